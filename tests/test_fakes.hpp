#ifndef TEST_FAKES_HPP
#define TEST_FAKES_HPP

#include "broker_client.hpp"
#include "config_parser.hpp"
#include "sensor_reader.hpp"
#include "system_actions.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct PublishedMessage {
    std::string topic;
    std::string payload;
    int qos;
    bool retain;
};

class FakeBroker : public BrokerClient {
public:
    bool connect_result = true;
    std::atomic<int> connect_calls{0};
    std::atomic<int> disconnect_calls{0};

    bool connect() override {
        ++connect_calls;
        return connect_result;
    }

    void disconnect() override {
        ++disconnect_calls;
        connected_ = false;
    }

    bool isConnected() const override { return connected_.load(); }
    void setConnected(bool connected) { connected_ = connected; }

    bool publish(const std::string& topic, const std::string& payload, int qos,
                 bool retain) override {
        if (!connected_) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        published_.push_back({topic, payload, qos, retain});
        return true;
    }

    bool subscribe(const std::string& topic_filter, int /*qos*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions_.push_back(topic_filter);
        return true;
    }

    std::vector<PublishedMessage> published() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return published_;
    }

    std::vector<std::string> subscriptions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return subscriptions_;
    }

    int countPublished(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& message : published_) {
            if (message.topic == topic) {
                ++count;
            }
        }
        return count;
    }

    int countPayload(const std::string& topic, const std::string& payload) const {
        std::lock_guard<std::mutex> lock(mutex_);
        int count = 0;
        for (const auto& message : published_) {
            if (message.topic == topic && message.payload == payload) {
                ++count;
            }
        }
        return count;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        published_.clear();
    }

private:
    std::atomic<bool> connected_{false};
    mutable std::mutex mutex_;
    std::vector<PublishedMessage> published_;
    std::vector<std::string> subscriptions_;
};

class FakeSensor : public SensorReader {
public:
    using Clock = std::chrono::steady_clock;

    explicit FakeSensor(PowerReading reading = PowerReading()) : reading_(reading) {}

    PowerReading readPower() override {
        std::lock_guard<std::mutex> lock(mutex_);
        read_times_.push_back(Clock::now());
        if (fail_) {
            throw SensorError("I2C read failed");
        }
        return reading_;
    }

    std::optional<double> readTemperature() override { return 48.25; }
    std::optional<int> readThrottleState() override { return 0; }

    void setReading(double voltage, double current) {
        std::lock_guard<std::mutex> lock(mutex_);
        reading_.voltage = voltage;
        reading_.current = current;
        reading_.power = voltage * current;
        reading_.overflow = false;
    }

    void setOverflow(double voltage) {
        std::lock_guard<std::mutex> lock(mutex_);
        reading_.voltage = voltage;
        reading_.current = 5.5;
        reading_.power = voltage * reading_.current;
        reading_.overflow = true;
    }

    void setFail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::vector<Clock::time_point> readTimes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return read_times_;
    }

private:
    mutable std::mutex mutex_;
    PowerReading reading_;
    bool fail_ = false;
    std::vector<Clock::time_point> read_times_;
};

class FakeSystemActions : public SystemActions {
public:
    std::atomic<int> shutdown_calls{0};
    std::atomic<int> restart_calls{0};
    std::atomic<int> broadcast_calls{0};
    bool result = true;

    bool shutdown() override {
        ++shutdown_calls;
        return result;
    }

    bool restart() override {
        ++restart_calls;
        return result;
    }

    void broadcast(const std::string& /*message*/) override { ++broadcast_calls; }
};

inline MonitorConfig testConfig() {
    MonitorConfig config;
    config.hostname.name = "pi";
    config.hostname.pretty = "Pi";
    config.logging.enable_syslog = false;
    return config;
}

#endif // TEST_FAKES_HPP
