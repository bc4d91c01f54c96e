/**
 * @file monitor_daemon.cpp
 * @brief Component wiring and the network event loop
 */

#include "monitor_daemon.hpp"
#include "logger.hpp"
#include "version.hpp"
#include <cstdlib>
#include <sstream>
#include <thread>
#include <utility>

namespace {

// Upper bound on a single event wait, keeps timers responsive
constexpr auto MAX_EVENT_WAIT = std::chrono::seconds(1);

} // namespace

MonitorDaemon::MonitorDaemon(const MonitorConfig& config, const std::string& settings_path,
                             std::unique_ptr<SensorReader> sensor,
                             std::unique_ptr<SystemActions> actions, BrokerFactory broker_factory)
    : config_(config), sensor_(std::move(sensor)), actions_(std::move(actions)),
      broker_factory_(std::move(broker_factory)), stop_requested_(false), next_discovery_() {
    settings_ = std::make_unique<SettingsStore>(config_.defaults, settings_path);
    power_ = std::make_unique<PowerControl>(*actions_);
}

MonitorDaemon::~MonitorDaemon() {
    requestStop();
}

bool MonitorDaemon::initialize() {
    if (!settings_->path().empty() && !settings_->load()) {
        logMessage(LOG_WARNING, "Ignoring settings file " + settings_->path() +
                                    ", using configured defaults");
    }

    if (!sensor_->initialize()) {
        logMessage(LOG_ERR, "Failed to initialize battery sensor");
        return false;
    }

    broker_ = broker_factory_(ConnectionManager::brokerOptions(config_), events_);
    if (!broker_) {
        logMessage(LOG_ERR, "Failed to create MQTT client");
        return false;
    }

    BackoffPolicy backoff(std::chrono::seconds(config_.mqtt.reconnect_min_delay_sec),
                          std::chrono::seconds(config_.mqtt.reconnect_max_delay_sec));
    connection_ = std::make_unique<ConnectionManager>(config_, *broker_, backoff);
    discovery_ = std::make_unique<DiscoveryPublisher>(config_, *broker_);
    commands_ = std::make_unique<CommandHandler>(config_, *settings_, *power_);
    monitor_ = std::make_unique<MonitorLoop>(config_, *sensor_, *settings_, *broker_, *power_);

    commands_->setReportIntervalListener([this]() { monitor_->rearm(); });
    connection_->addConnectedHook([this]() { announceDiscovery(Clock::now()); });

    // Mark the device unavailable before the host goes down
    power_->setBeforeAction([this]() {
        if (broker_->isConnected() && !connection_->publishAvailability(false)) {
            logMessage(LOG_WARNING, "Unable to publish offline status");
        }
    });
    // Still monitoring after a failed restart, a halted loop stays offline
    power_->setActionFailed([this]() {
        if (power_->shutdownInProgress() || !broker_->isConnected()) {
            return;
        }
        if (!connection_->publishAvailability(true)) {
            logMessage(LOG_WARNING, "Unable to restore online status");
        }
    });

    const RuntimeSettings current = settings_->snapshot();
    std::ostringstream oss;
    oss << "Battery monitor " << BATTERY_MONITOR_VERSION << " initialized: state topic "
        << config_.stateTopic() << ", warning " << current.battery_warning_threshold
        << "%, voltage " << current.battery_voltage_minimum << "V-"
        << current.battery_voltage_maximum << "V, interval " << current.report_interval << " s";
    logMessage(LOG_INFO, oss.str());
    return true;
}

void MonitorDaemon::requestStop() {
    if (!stop_requested_.exchange(true)) {
        events_.close();
    }
}

void MonitorDaemon::announceDiscovery(Clock::time_point now) {
    if (!discovery_->enabled()) {
        return;
    }
    discovery_->announce();
    next_discovery_ = now + discovery_->interval();
}

MonitorDaemon::Clock::time_point MonitorDaemon::nextWakeup(Clock::time_point now) const {
    Clock::time_point wakeup = now + MAX_EVENT_WAIT;
    const auto attempt = connection_->nextAttempt();
    if (attempt.has_value() && attempt.value() < wakeup) {
        wakeup = attempt.value();
    }
    if (discovery_->enabled() && connection_->state() == ConnectionState::Connected &&
        next_discovery_ < wakeup) {
        wakeup = next_discovery_;
    }
    return wakeup;
}

bool MonitorDaemon::handleEvent(const BrokerEvent& event) {
    switch (event.type) {
        case BrokerEvent::Type::Connected:
            connection_->handleConnected();
            return true;
        case BrokerEvent::Type::ConnectFailed:
            return connection_->handleConnectFailed(event.reason, Clock::now());
        case BrokerEvent::Type::ConnectionLost:
            connection_->handleConnectionLost(event.reason, Clock::now());
            return true;
        case BrokerEvent::Type::Message:
            commands_->handleMessage(event.topic, event.payload);
            return true;
    }
    return true;
}

int MonitorDaemon::run() {
    if (!monitor_) {
        logMessage(LOG_ERR, "Daemon not initialized");
        return EXIT_FAILURE;
    }

    int exit_code = EXIT_SUCCESS;
    if (!connection_->start(Clock::now())) {
        return EXIT_FAILURE;
    }

    std::thread monitor_thread([this]() { monitor_->run(); });

    while (!stop_requested_.load()) {
        const auto now = Clock::now();
        auto event = events_.waitUntil(nextWakeup(now));

        try {
            if (event.has_value() && !handleEvent(event.value())) {
                exit_code = EXIT_FAILURE;
                break;
            }

            const auto after = Clock::now();
            if (!connection_->poll(after)) {
                exit_code = EXIT_FAILURE;
                break;
            }
            if (discovery_->enabled() && connection_->state() == ConnectionState::Connected &&
                after >= next_discovery_) {
                announceDiscovery(after);
            }
        } catch (const std::exception& e) {
            logMessage(LOG_ERR, std::string("Network loop error: ") + e.what());
        }
    }

    logMessage(LOG_INFO, "Stopping battery monitor");
    monitor_->stop();
    monitor_thread.join();
    connection_->shutdown();
    requestStop();
    return exit_code;
}
