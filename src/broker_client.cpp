/**
 * @file broker_client.cpp
 * @brief Broker events and their queue
 */

#include "broker_client.hpp"
#include <utility>

const char* connectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Reconnecting: return "Reconnecting";
    }
    return "Unknown";
}

BrokerEvent BrokerEvent::connected() {
    BrokerEvent event;
    event.type = Type::Connected;
    return event;
}

BrokerEvent BrokerEvent::connectFailed(const std::string& reason) {
    BrokerEvent event;
    event.type = Type::ConnectFailed;
    event.reason = reason;
    return event;
}

BrokerEvent BrokerEvent::connectionLost(const std::string& reason) {
    BrokerEvent event;
    event.type = Type::ConnectionLost;
    event.reason = reason;
    return event;
}

BrokerEvent BrokerEvent::message(const std::string& topic, const std::string& payload) {
    BrokerEvent event;
    event.type = Type::Message;
    event.topic = topic;
    event.payload = payload;
    return event;
}

void BrokerEventQueue::push(BrokerEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<BrokerEvent> BrokerEventQueue::waitUntil(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_until(lock, deadline, [this] { return closed_ || !events_.empty(); });
    if (closed_ || events_.empty()) {
        return std::nullopt;
    }
    BrokerEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

std::optional<BrokerEvent> BrokerEventQueue::tryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (events_.empty()) {
        return std::nullopt;
    }
    BrokerEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void BrokerEventQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        events_.clear();
    }
    cv_.notify_all();
}

bool BrokerEventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t BrokerEventQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}
