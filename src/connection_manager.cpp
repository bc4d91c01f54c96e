/**
 * @file connection_manager.cpp
 * @brief Broker connect/reconnect policy
 */

#include "connection_manager.hpp"
#include "logger.hpp"
#include <sstream>
#include <utility>

ConnectionManager::ConnectionManager(const MonitorConfig& config, BrokerClient& broker,
                                     BackoffPolicy backoff)
    : config_(config), broker_(broker), backoff_(backoff),
      state_(ConnectionState::Disconnected), ever_connected_(false), connect_count_(0) {
}

BrokerOptions ConnectionManager::brokerOptions(const MonitorConfig& config) {
    BrokerOptions options;
    options.host = config.mqtt.broker;
    options.port = config.mqtt.port;
    options.client_id = config.mqtt.client_id;
    options.user = config.mqtt.user;
    options.password = config.mqtt.password;
    options.keepalive_sec = config.mqtt.keepalive_sec;
    options.version = config.mqtt.version;
    options.will.topic = config.statusTopic();
    options.will.payload = config.mqtt.payload_offline;
    options.will.qos = config.mqtt.qos;
    options.will.retain = true;
    return options;
}

void ConnectionManager::addConnectedHook(std::function<void()> hook) {
    connected_hooks_.push_back(std::move(hook));
}

void ConnectionManager::setState(ConnectionState state) {
    const ConnectionState previous = state_.exchange(state);
    if (previous != state) {
        logMessage(LOG_DEBUG, std::string("Broker connection ") + connectionStateName(previous) +
                                  " -> " + connectionStateName(state));
    }
}

bool ConnectionManager::start(Clock::time_point now) {
    std::ostringstream oss;
    oss << "Connecting to MQTT broker " << config_.mqtt.broker << ":" << config_.mqtt.port
        << " as '" << config_.mqtt.client_id << "' (MQTT v" << config_.mqtt.version
        << ", exit on fail " << (config_.mqtt.exit_on_fail ? "enabled" : "disabled") << ")";
    logMessage(LOG_INFO, oss.str());

    setState(ConnectionState::Connecting);
    if (!broker_.connect()) {
        return handleConnectFailed("connect request rejected", now);
    }
    return true;
}

void ConnectionManager::handleConnected() {
    if (state_.load() == ConnectionState::Connected) {
        logMessage(LOG_DEBUG, "Ignoring duplicate connected event");
        return;
    }

    setState(ConnectionState::Connected);
    backoff_.reset();
    next_attempt_.reset();
    ever_connected_ = true;
    ++connect_count_;

    logMessage(LOG_INFO, "Connected to MQTT broker");

    // Clean sessions drop subscriptions, so each session subscribes once
    const std::string filter = config_.commandFilter();
    if (broker_.subscribe(filter, config_.mqtt.qos)) {
        logMessage(LOG_INFO, "Subscribed to command topic " + filter);
    } else {
        logMessage(LOG_WARNING, "Unable to subscribe to command topic " + filter);
    }

    if (!publishAvailability(true)) {
        logMessage(LOG_WARNING, "Unable to publish online status");
    }

    for (const auto& hook : connected_hooks_) {
        hook();
    }
}

bool ConnectionManager::handleConnectFailed(const std::string& reason, Clock::time_point now) {
    logMessage(LOG_ERR, "Unable to connect to the MQTT broker: " +
                            (reason.empty() ? std::string("unknown error") : reason));

    if (!ever_connected_ && config_.mqtt.exit_on_fail) {
        setState(ConnectionState::Disconnected);
        logMessage(LOG_ERR, "exit_on_fail is set, giving up");
        return false;
    }

    scheduleRetry(now);
    return true;
}

void ConnectionManager::handleConnectionLost(const std::string& reason, Clock::time_point now) {
    if (state_.load() != ConnectionState::Connected) {
        return;
    }

    logMessage(LOG_WARNING, "Disconnected from MQTT broker" +
                                (reason.empty() ? std::string() : ": " + reason));
    scheduleRetry(now);
}

void ConnectionManager::scheduleRetry(Clock::time_point now) {
    const std::chrono::seconds delay = backoff_.nextDelay();
    next_attempt_ = now + delay;
    setState(ever_connected_ ? ConnectionState::Reconnecting : ConnectionState::Disconnected);

    std::ostringstream oss;
    oss << "Retrying broker connection in " << delay.count() << " s (attempt "
        << backoff_.attempts() << ")";
    logMessage(LOG_INFO, oss.str());
}

bool ConnectionManager::poll(Clock::time_point now) {
    if (!next_attempt_.has_value() || now < next_attempt_.value()) {
        return true;
    }

    next_attempt_.reset();
    setState(ever_connected_ ? ConnectionState::Reconnecting : ConnectionState::Connecting);
    logMessage(LOG_DEBUG, "Attempting broker connection");
    if (!broker_.connect()) {
        return handleConnectFailed("connect request rejected", now);
    }
    return true;
}

bool ConnectionManager::publishAvailability(bool online) {
    const std::string& payload = online ? config_.mqtt.payload_online : config_.mqtt.payload_offline;
    return broker_.publish(config_.statusTopic(), payload, config_.mqtt.qos, true);
}

void ConnectionManager::shutdown() {
    next_attempt_.reset();
    if (broker_.isConnected()) {
        if (!publishAvailability(false)) {
            logMessage(LOG_WARNING, "Unable to publish offline status");
        }
        broker_.disconnect();
        logMessage(LOG_INFO, "Disconnected from MQTT broker");
    }
    setState(ConnectionState::Disconnected);
}
