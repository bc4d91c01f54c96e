#ifndef CONNECTION_MANAGER_HPP
#define CONNECTION_MANAGER_HPP

/**
 * @file connection_manager.hpp
 * @brief Broker session policy: connect, retry, post-connect announcements
 */

#include "backoff_policy.hpp"
#include "broker_client.hpp"
#include "config_parser.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

/**
 * @brief Drives the Disconnected -> Connecting -> Connected / Reconnecting machine
 *
 * Event handlers are called from the network loop thread only. state() may
 * be read from any thread.
 */
class ConnectionManager {
public:
    using Clock = std::chrono::steady_clock;

    ConnectionManager(const MonitorConfig& config, BrokerClient& broker, BackoffPolicy backoff);

    /** @brief Called after every successful (re)connection, after subscribe and online */
    void addConnectedHook(std::function<void()> hook);

    /**
     * @brief First connection attempt
     * @return false when the daemon must exit (exit_on_fail)
     */
    bool start(Clock::time_point now);

    void handleConnected();
    /** @return false when the failure is fatal */
    bool handleConnectFailed(const std::string& reason, Clock::time_point now);
    void handleConnectionLost(const std::string& reason, Clock::time_point now);

    /**
     * @brief Runs a scheduled reconnect attempt when due
     * @return false when the daemon must exit
     */
    bool poll(Clock::time_point now);

    bool publishAvailability(bool online);

    /** @brief Publishes offline and closes the session */
    void shutdown();

    ConnectionState state() const { return state_.load(); }
    std::optional<Clock::time_point> nextAttempt() const { return next_attempt_; }
    int connectCount() const { return connect_count_; }

    static BrokerOptions brokerOptions(const MonitorConfig& config);

private:
    const MonitorConfig& config_;
    BrokerClient& broker_;
    BackoffPolicy backoff_;
    std::atomic<ConnectionState> state_;
    bool ever_connected_;
    int connect_count_;
    std::optional<Clock::time_point> next_attempt_;
    std::vector<std::function<void()>> connected_hooks_;

    void setState(ConnectionState state);
    void scheduleRetry(Clock::time_point now);
};

#endif // CONNECTION_MANAGER_HPP
