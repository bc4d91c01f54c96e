/**
 * @file monitor_loop.cpp
 * @brief Implementation of battery monitoring and shutdown control
 */

#include "monitor_loop.hpp"
#include "cpu_status.hpp"
#include "logger.hpp"
#include "metric_deriver.hpp"
#include <iomanip>
#include <sstream>

namespace {

constexpr auto BATTERY_STATUS_LOG_PERIOD = std::chrono::seconds(60);

} // namespace

const char* monitorStateName(MonitorState state) {
    switch (state) {
        case MonitorState::Idle: return "idle";
        case MonitorState::Polling: return "polling";
        case MonitorState::Publishing: return "publishing";
        case MonitorState::ShuttingDown: return "shutting down";
    }
    return "unknown";
}

MonitorLoop::MonitorLoop(const MonitorConfig& config, SensorReader& sensor,
                         SettingsStore& settings, BrokerClient& broker, PowerControl& power)
    : config_(config), sensor_(sensor), settings_(settings), broker_(broker), power_(power),
      stop_requested_(false), rearm_pending_(false), state_(MonitorState::Idle),
      tick_count_(0), external_power_(true), low_battery_warned_(false),
      last_battery_status_log_() {
}

void MonitorLoop::setState(MonitorState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != MonitorState::ShuttingDown) {
        state_ = state;
    }
}

MonitorState MonitorLoop::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<StatePayload> MonitorLoop::lastState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_state_;
}

int MonitorLoop::tickCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_count_;
}

void MonitorLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

void MonitorLoop::rearm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rearm_pending_ = true;
    }
    cv_.notify_all();
}

std::string MonitorLoop::formatBriefMetrics(const StatePayload& payload) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "BAT=" << payload.voltage << "V " << std::showpos
        << std::setprecision(3) << payload.current << std::noshowpos << "A "
        << payload.battery_level << "%";
    return oss.str();
}

void MonitorLoop::logBatteryStatus(const StatePayload& payload) {
    std::ostringstream oss;
    oss << "Battery Status: " << formatBriefMetrics(payload)
        << ", Warning=" << payload.battery_warning_threshold << "%"
        << ", Range=" << std::fixed << std::setprecision(2)
        << payload.battery_voltage_minimum << "V-" << payload.battery_voltage_maximum << "V";

    if (payload.cpu_stat.has_value()) {
        oss << ", Throttle=" << CpuStatus::describeThrottleState(payload.cpu_stat.value());
    }
    if (payload.cpu_temperature.has_value()) {
        oss << ", CPU=" << std::fixed << std::setprecision(1)
            << payload.cpu_temperature.value() << "°C";
    }

    logMessage(LOG_INFO, oss.str());
}

void MonitorLoop::handlePowerLoss(const StatePayload& payload) {
    logMessage(LOG_WARNING, "Power: mains -> battery | " + formatBriefMetrics(payload));
}

void MonitorLoop::handlePowerRestored(const StatePayload& payload) {
    last_battery_status_log_ = Clock::time_point();
    logMessage(LOG_INFO, "Power: battery -> mains | " + formatBriefMetrics(payload));
}

bool MonitorLoop::trackPowerSource(const StatePayload& payload) {
    bool event = false;
    if (payload.external_power != external_power_) {
        event = true;
        external_power_ = payload.external_power;
        if (!external_power_) {
            handlePowerLoss(payload);
        } else {
            handlePowerRestored(payload);
        }
    }

    // Periodic status logging when on battery
    if (!external_power_) {
        const auto now = Clock::now();
        if (last_battery_status_log_.time_since_epoch().count() == 0 ||
            now - last_battery_status_log_ >= BATTERY_STATUS_LOG_PERIOD) {
            last_battery_status_log_ = now;
            logBatteryStatus(payload);
        }
    }

    const bool low = !payload.external_power &&
                     payload.battery_level <= payload.battery_warning_threshold;
    if (low && !low_battery_warned_) {
        event = true;
        std::ostringstream oss;
        oss << "Battery level " << payload.battery_level << "% at or below warning threshold "
            << payload.battery_warning_threshold << "%";
        logMessage(LOG_WARNING, oss.str());
    }
    low_battery_warned_ = low;
    return event;
}

bool MonitorLoop::publishState(const StatePayload& payload) {
    if (!broker_.isConnected()) {
        logMessage(LOG_DEBUG, "Broker not connected, state not published");
        return false;
    }

    const std::string json = payload.toJson();
    if (!broker_.publish(config_.stateTopic(), json, config_.mqtt.qos, false)) {
        logMessage(LOG_WARNING, "Failed to publish state to " + config_.stateTopic());
        return false;
    }
    logMessage(LOG_DEBUG, "Published state " + json);
    return true;
}

void MonitorLoop::shutdownSystem(const StatePayload& payload) {
    std::ostringstream oss;
    oss << "Battery low (" << payload.battery_level << "%, " << std::fixed
        << std::setprecision(3) << payload.voltage << "V) on battery power. Shutting down system now.";
    const std::string message = oss.str();
    logMessage(LOG_ERR, message);
    logBatteryStatus(payload);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = MonitorState::ShuttingDown;
    }

    power_.broadcast(message);
    if (!power_.requestShutdown("battery low")) {
        logMessage(LOG_INFO, "Shutdown already issued, nothing to do");
    }
}

bool MonitorLoop::beginCycle() {
    if (power_.shutdownInProgress()) {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = MonitorState::ShuttingDown;
    }
    return state() != MonitorState::ShuttingDown;
}

std::optional<StatePayload> MonitorLoop::poll() {
    setState(MonitorState::Polling);
    const RuntimeSettings settings = settings_.snapshot();

    try {
        const PowerReading reading = sensor_.readPower();
        if (reading.overflow) {
            logMessage(LOG_WARNING, "Battery current out of range, assuming battery power");
        }
        return deriveState(reading, sensor_.readTemperature(), sensor_.readThrottleState(),
                           settings);
    } catch (const SensorError& e) {
        logMessage(LOG_ERR, std::string("Sensor read failed: ") + e.what());
    } catch (const std::exception& e) {
        logMessage(LOG_ERR, std::string("Monitor tick failed: ") + e.what());
    }
    setState(MonitorState::Idle);
    return std::nullopt;
}

void MonitorLoop::finishCycle(const StatePayload& payload) {
    if (shutdownRequired(payload)) {
        shutdownSystem(payload);
    } else {
        setState(MonitorState::Idle);
    }
}

bool MonitorLoop::tick() {
    if (!beginCycle()) {
        return false;
    }
    const std::optional<StatePayload> payload = poll();
    if (!payload.has_value()) {
        return false;
    }

    trackPowerSource(*payload);

    setState(MonitorState::Publishing);
    const bool published = publishState(*payload);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_state_ = payload;
        ++tick_count_;
    }

    finishCycle(*payload);
    return published;
}

bool MonitorLoop::sample() {
    if (!beginCycle()) {
        return false;
    }
    const std::optional<StatePayload> payload = poll();
    if (!payload.has_value()) {
        return false;
    }

    bool published = false;
    if (trackPowerSource(*payload)) {
        setState(MonitorState::Publishing);
        logMessage(LOG_DEBUG, "Power event, publishing state ahead of the report interval");
        published = publishState(*payload);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_state_ = payload;
    }

    finishCycle(*payload);
    return published;
}

void MonitorLoop::run() {
    std::ostringstream oss;
    oss << "Starting battery monitoring loop, report interval "
        << settings_.snapshot().report_interval << " s, sample interval "
        << config_.sensor.monitor_interval << " s";
    logMessage(LOG_INFO, oss.str());

    const std::chrono::seconds sample_period(config_.sensor.monitor_interval);

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        lock.unlock();
        const auto started = Clock::now();
        tick();
        lock.lock();

        if (state_ == MonitorState::ShuttingDown) {
            logMessage(LOG_INFO, "Monitoring halted, waiting for the system to stop");
            cv_.wait(lock, [this] { return stop_requested_; });
            break;
        }

        // Fixed period from the previous start, re-evaluated after rearm()
        rearm_pending_ = false;
        auto next_sample = started + sample_period;
        while (!stop_requested_ && state_ != MonitorState::ShuttingDown) {
            const auto deadline =
                started + std::chrono::seconds(settings_.snapshot().report_interval);
            const auto now = Clock::now();
            if (now >= deadline) {
                break;
            }
            if (sample_period.count() > 0 && now >= next_sample) {
                lock.unlock();
                sample();
                lock.lock();
                next_sample += sample_period;
                continue;
            }

            auto wake = deadline;
            if (sample_period.count() > 0 && next_sample < wake) {
                wake = next_sample;
            }
            cv_.wait_until(lock, wake, [this] { return stop_requested_ || rearm_pending_; });
            if (rearm_pending_) {
                rearm_pending_ = false;
                logMessage(LOG_DEBUG, "Report interval changed, rescheduling next poll");
            }
        }
    }

    logMessage(LOG_INFO, "Battery monitoring loop stopped");
}
