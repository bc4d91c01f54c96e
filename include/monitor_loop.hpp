#ifndef MONITOR_LOOP_HPP
#define MONITOR_LOOP_HPP

/**
 * @file monitor_loop.hpp
 * @brief Fixed period battery polling, state publishing and shutdown control
 */

#include "broker_client.hpp"
#include "config_parser.hpp"
#include "sensor_reader.hpp"
#include "settings_store.hpp"
#include "state_payload.hpp"
#include "system_actions.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

enum class MonitorState {
    Idle,
    Polling,
    Publishing,
    ShuttingDown
};

const char* monitorStateName(MonitorState state);

/**
 * @brief Main monitoring class
 *
 * Publishes the derived state every report_interval seconds and initiates
 * a system shutdown when the battery runs low while external power is
 * missing. Between report ticks the sensor is sampled every
 * sensor.monitor_interval seconds: power source changes and low battery
 * are published at once and the shutdown policy runs on every sample.
 * ShuttingDown is terminal: no further ticks run once it is entered.
 */
class MonitorLoop {
public:
    using Clock = std::chrono::steady_clock;

    MonitorLoop(const MonitorConfig& config, SensorReader& sensor, SettingsStore& settings,
                BrokerClient& broker, PowerControl& power);

    /**
     * @brief One poll/derive/publish/evaluate cycle
     * @return true when a state payload was published
     */
    bool tick();

    /**
     * @brief Reads and evaluates shutdown between report ticks
     * @return true when a power event forced an immediate publish
     */
    bool sample();

    /** @brief Blocks running ticks until stop() */
    void run();
    void stop();

    /** @brief Recomputes the pending deadline from the current report_interval */
    void rearm();

    MonitorState state() const;
    std::optional<StatePayload> lastState() const;
    int tickCount() const;

private:
    const MonitorConfig& config_;
    SensorReader& sensor_;
    SettingsStore& settings_;
    BrokerClient& broker_;
    PowerControl& power_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_;
    bool rearm_pending_;
    MonitorState state_;
    std::optional<StatePayload> last_state_;
    int tick_count_;

    // Touched by the monitor thread only
    bool external_power_;
    bool low_battery_warned_;
    Clock::time_point last_battery_status_log_;

    void setState(MonitorState state);
    bool beginCycle();
    std::optional<StatePayload> poll();
    bool publishState(const StatePayload& payload);
    bool trackPowerSource(const StatePayload& payload);
    void finishCycle(const StatePayload& payload);
    void handlePowerLoss(const StatePayload& payload);
    void handlePowerRestored(const StatePayload& payload);
    void logBatteryStatus(const StatePayload& payload);
    void shutdownSystem(const StatePayload& payload);

    static std::string formatBriefMetrics(const StatePayload& payload);
};

#endif // MONITOR_LOOP_HPP
