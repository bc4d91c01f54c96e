#ifndef MONITOR_DAEMON_HPP
#define MONITOR_DAEMON_HPP

/**
 * @file monitor_daemon.hpp
 * @brief Owns the daemon components and runs the network event loop
 */

#include "broker_client.hpp"
#include "command_handler.hpp"
#include "config_parser.hpp"
#include "connection_manager.hpp"
#include "discovery_publisher.hpp"
#include "monitor_loop.hpp"
#include "sensor_reader.hpp"
#include "settings_store.hpp"
#include "system_actions.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

using BrokerFactory =
    std::function<std::unique_ptr<BrokerClient>(const BrokerOptions&, BrokerEventQueue&)>;

/**
 * @brief Battery monitor daemon
 *
 * run() starts the monitor thread and drains broker events on the calling
 * thread until requestStop() or a fatal broker failure. requestStop() may
 * be called from any thread.
 */
class MonitorDaemon {
public:
    using Clock = std::chrono::steady_clock;

    MonitorDaemon(const MonitorConfig& config, const std::string& settings_path,
                  std::unique_ptr<SensorReader> sensor, std::unique_ptr<SystemActions> actions,
                  BrokerFactory broker_factory);
    ~MonitorDaemon();

    MonitorDaemon(const MonitorDaemon&) = delete;
    MonitorDaemon& operator=(const MonitorDaemon&) = delete;

    /**
     * @brief Loads persisted settings, initializes the sensor, creates the broker client
     * @return false when the daemon cannot start
     */
    bool initialize();

    /** @return process exit status */
    int run();
    void requestStop();

    SettingsStore& settings() { return *settings_; }

private:
    MonitorConfig config_;
    std::unique_ptr<SensorReader> sensor_;
    std::unique_ptr<SystemActions> actions_;
    BrokerFactory broker_factory_;

    std::unique_ptr<SettingsStore> settings_;
    std::unique_ptr<PowerControl> power_;
    BrokerEventQueue events_;
    std::unique_ptr<BrokerClient> broker_;
    std::unique_ptr<ConnectionManager> connection_;
    std::unique_ptr<DiscoveryPublisher> discovery_;
    std::unique_ptr<CommandHandler> commands_;
    std::unique_ptr<MonitorLoop> monitor_;

    std::atomic<bool> stop_requested_;
    Clock::time_point next_discovery_;

    /** @return false on a fatal broker failure */
    bool handleEvent(const BrokerEvent& event);
    void announceDiscovery(Clock::time_point now);
    Clock::time_point nextWakeup(Clock::time_point now) const;
};

#endif // MONITOR_DAEMON_HPP
