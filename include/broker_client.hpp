#ifndef BROKER_CLIENT_HPP
#define BROKER_CLIENT_HPP

/**
 * @file broker_client.hpp
 * @brief MQTT transport boundary and the event queue it feeds
 */

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting
};

const char* connectionStateName(ConnectionState state);

/**
 * @brief Something the transport observed, delivered to the network loop
 */
struct BrokerEvent {
    enum class Type {
        Connected,
        ConnectFailed,
        ConnectionLost,
        Message
    };

    Type type = Type::Message;
    std::string topic;
    std::string payload;
    std::string reason;     // failure or loss cause, may be empty

    static BrokerEvent connected();
    static BrokerEvent connectFailed(const std::string& reason);
    static BrokerEvent connectionLost(const std::string& reason);
    static BrokerEvent message(const std::string& topic, const std::string& payload);
};

/**
 * @brief Multi producer, single consumer queue of broker events
 *
 * Transport library callbacks only push here; application logic runs on
 * the thread that drains the queue.
 */
class BrokerEventQueue {
public:
    void push(BrokerEvent event);

    /**
     * @brief Pops the next event, waiting no later than deadline
     * @return nullopt on timeout or after close()
     */
    std::optional<BrokerEvent> waitUntil(std::chrono::steady_clock::time_point deadline);
    std::optional<BrokerEvent> tryPop();

    void close();
    bool closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<BrokerEvent> events_;
    bool closed_ = false;
};

struct WillMessage {
    std::string topic;
    std::string payload;
    int qos = 1;
    bool retain = true;
};

struct BrokerOptions {
    std::string host;
    int port = 1883;
    std::string client_id;
    std::string user;
    std::string password;
    int keepalive_sec = 60;
    int version = 3;
    WillMessage will;
};

/**
 * @brief Minimal publish/subscribe transport
 *
 * connect() only starts an attempt; its result arrives as a Connected or
 * ConnectFailed event. publish() is fire and forget and returns false when
 * the message could not be handed to the transport.
 */
class BrokerClient {
public:
    virtual ~BrokerClient() = default;

    virtual bool connect() = 0;
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    virtual bool publish(const std::string& topic, const std::string& payload,
                         int qos, bool retain) = 0;
    virtual bool subscribe(const std::string& topic_filter, int qos) = 0;
};

#endif // BROKER_CLIENT_HPP
