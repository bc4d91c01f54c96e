#ifndef PAHO_BROKER_CLIENT_HPP
#define PAHO_BROKER_CLIENT_HPP

/**
 * @file paho_broker_client.hpp
 * @brief Eclipse Paho MQTTAsync implementation of BrokerClient
 */

#include "broker_client.hpp"
#include <MQTTAsync.h>

/**
 * @brief Clean session client with automatic reconnect disabled
 *
 * Reconnection is driven by ConnectionManager. Paho callbacks run on the
 * library's threads and only push events onto the queue.
 */
class PahoBrokerClient : public BrokerClient {
public:
    /** @throws std::runtime_error when the client handle cannot be created */
    PahoBrokerClient(BrokerOptions options, BrokerEventQueue& events);
    ~PahoBrokerClient() override;

    PahoBrokerClient(const PahoBrokerClient&) = delete;
    PahoBrokerClient& operator=(const PahoBrokerClient&) = delete;

    bool connect() override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos, bool retain) override;
    bool subscribe(const std::string& topic_filter, int qos) override;

private:
    BrokerOptions options_;
    BrokerEventQueue& events_;
    std::string server_uri_;
    MQTTAsync client_;

    // Paho callback implementations
    static void onConnectSuccess(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void onConnectSuccess5(void* context, MQTTAsync_successData5* response);
    static void onConnectFailure5(void* context, MQTTAsync_failureData5* response);
    static void onConnectionLost(void* context, char* cause);
    static int onMessageArrived(void* context, char* topic_name, int topic_len,
                                MQTTAsync_message* message);
    static void onSubscribeFailure(void* context, MQTTAsync_failureData* response);
    static void onSubscribeFailure5(void* context, MQTTAsync_failureData5* response);
};

#endif // PAHO_BROKER_CLIENT_HPP
