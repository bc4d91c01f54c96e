/**
 * @file paho_broker_client.cpp
 * @brief MQTTAsync transport
 */

#include "paho_broker_client.hpp"
#include "logger.hpp"
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

std::string failureText(const char* message, int code) {
    std::ostringstream oss;
    if (message != nullptr) {
        oss << message << " ";
    }
    oss << "(rc " << code << ")";
    return oss.str();
}

} // namespace

PahoBrokerClient::PahoBrokerClient(BrokerOptions options, BrokerEventQueue& events)
    : options_(std::move(options)), events_(events), client_(nullptr) {
    std::ostringstream uri;
    uri << "tcp://" << options_.host << ":" << options_.port;
    server_uri_ = uri.str();

    MQTTAsync_createOptions create_opts = MQTTAsync_createOptions_initializer;
    if (options_.version == 5) {
        create_opts.MQTTVersion = MQTTVERSION_5;
    }

    int rc = MQTTAsync_createWithOptions(&client_, server_uri_.c_str(), options_.client_id.c_str(),
                                         MQTTCLIENT_PERSISTENCE_NONE, nullptr, &create_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        client_ = nullptr;
        throw std::runtime_error("Failed to create MQTT client: " + failureText(nullptr, rc));
    }

    rc = MQTTAsync_setCallbacks(client_, this, onConnectionLost, onMessageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        MQTTAsync_destroy(&client_);
        throw std::runtime_error("Failed to set MQTT callbacks: " + failureText(nullptr, rc));
    }
}

PahoBrokerClient::~PahoBrokerClient() {
    if (client_ != nullptr) {
        if (MQTTAsync_isConnected(client_)) {
            MQTTAsync_disconnect(client_, nullptr);
        }
        MQTTAsync_destroy(&client_);
    }
}

void PahoBrokerClient::onConnectSuccess(void* context, MQTTAsync_successData* /*response*/) {
    auto* self = static_cast<PahoBrokerClient*>(context);
    self->events_.push(BrokerEvent::connected());
}

void PahoBrokerClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<PahoBrokerClient*>(context);
    self->events_.push(BrokerEvent::connectFailed(
        response != nullptr ? failureText(response->message, response->code) : std::string()));
}

void PahoBrokerClient::onConnectSuccess5(void* context, MQTTAsync_successData5* /*response*/) {
    auto* self = static_cast<PahoBrokerClient*>(context);
    self->events_.push(BrokerEvent::connected());
}

void PahoBrokerClient::onConnectFailure5(void* context, MQTTAsync_failureData5* response) {
    auto* self = static_cast<PahoBrokerClient*>(context);
    std::string reason;
    if (response != nullptr) {
        reason = failureText(response->message, response->code) + " " +
                 MQTTReasonCode_toString(response->reasonCode);
    }
    self->events_.push(BrokerEvent::connectFailed(reason));
}

void PahoBrokerClient::onConnectionLost(void* context, char* cause) {
    auto* self = static_cast<PahoBrokerClient*>(context);
    self->events_.push(BrokerEvent::connectionLost(cause != nullptr ? cause : ""));
}

int PahoBrokerClient::onMessageArrived(void* context, char* topic_name, int topic_len,
                                       MQTTAsync_message* message) {
    auto* self = static_cast<PahoBrokerClient*>(context);

    // topic_len is 0 when the topic is null terminated
    std::string topic = topic_len > 0 ? std::string(topic_name, topic_len) : std::string(topic_name);
    std::string payload(static_cast<const char*>(message->payload), message->payloadlen);
    self->events_.push(BrokerEvent::message(topic, payload));

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topic_name);
    return 1;
}

void PahoBrokerClient::onSubscribeFailure(void* /*context*/, MQTTAsync_failureData* response) {
    logMessage(LOG_WARNING, "Subscription failed: " +
                                (response != nullptr ? failureText(response->message, response->code)
                                                     : std::string("unknown error")));
}

void PahoBrokerClient::onSubscribeFailure5(void* /*context*/, MQTTAsync_failureData5* response) {
    logMessage(LOG_WARNING, "Subscription failed: " +
                                (response != nullptr ? failureText(response->message, response->code)
                                                     : std::string("unknown error")));
}

bool PahoBrokerClient::connect() {
    MQTTAsync_connectOptions v3_opts = MQTTAsync_connectOptions_initializer;
    MQTTAsync_connectOptions v5_opts = MQTTAsync_connectOptions_initializer5;
    MQTTAsync_connectOptions& conn_opts = options_.version == 5 ? v5_opts : v3_opts;

    conn_opts.keepAliveInterval = options_.keepalive_sec;
    conn_opts.context = this;
    conn_opts.automaticReconnect = 0;
    if (options_.version == 5) {
        conn_opts.cleanstart = 1;
        conn_opts.onSuccess5 = onConnectSuccess5;
        conn_opts.onFailure5 = onConnectFailure5;
    } else {
        conn_opts.cleansession = 1;
        conn_opts.MQTTVersion = MQTTVERSION_3_1_1;
        conn_opts.onSuccess = onConnectSuccess;
        conn_opts.onFailure = onConnectFailure;
    }

    if (!options_.user.empty()) {
        conn_opts.username = options_.user.c_str();
        conn_opts.password = options_.password.c_str();
    }

    // Last will, delivered by the broker when the session dies uncleanly
    MQTTAsync_willOptions will_opts = MQTTAsync_willOptions_initializer;
    will_opts.topicName = options_.will.topic.c_str();
    will_opts.message = options_.will.payload.c_str();
    will_opts.retained = options_.will.retain ? 1 : 0;
    will_opts.qos = options_.will.qos;
    conn_opts.will = &will_opts;

    logMessage(LOG_DEBUG, "Connecting to " + server_uri_);
    const int rc = MQTTAsync_connect(client_, &conn_opts);
    if (rc != MQTTASYNC_SUCCESS) {
        logMessage(LOG_ERR, "MQTT connect request failed: " + failureText(MQTTAsync_strerror(rc), rc));
        return false;
    }
    return true;
}

void PahoBrokerClient::disconnect() {
    MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
    opts.timeout = 1000;
    const int rc = MQTTAsync_disconnect(client_, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        logMessage(LOG_WARNING, "MQTT disconnect failed: " + failureText(MQTTAsync_strerror(rc), rc));
    }
}

bool PahoBrokerClient::isConnected() const {
    return MQTTAsync_isConnected(client_) != 0;
}

bool PahoBrokerClient::publish(const std::string& topic, const std::string& payload,
                               int qos, bool retain) {
    MQTTAsync_message msg = MQTTAsync_message_initializer;
    msg.payload = const_cast<char*>(payload.data());
    msg.payloadlen = static_cast<int>(payload.size());
    msg.qos = qos;
    msg.retained = retain ? 1 : 0;

    const int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &msg, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        logMessage(LOG_DEBUG, "Publish to " + topic + " failed: " +
                                  failureText(MQTTAsync_strerror(rc), rc));
        return false;
    }
    return true;
}

bool PahoBrokerClient::subscribe(const std::string& topic_filter, int qos) {
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.context = this;
    if (options_.version == 5) {
        opts.onFailure5 = onSubscribeFailure5;
    } else {
        opts.onFailure = onSubscribeFailure;
    }

    const int rc = MQTTAsync_subscribe(client_, topic_filter.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        logMessage(LOG_WARNING, "Subscribe to " + topic_filter + " failed: " +
                                    failureText(MQTTAsync_strerror(rc), rc));
        return false;
    }
    return true;
}
