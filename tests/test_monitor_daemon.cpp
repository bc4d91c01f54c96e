#include "monitor_daemon.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <thread>

using namespace std::chrono_literals;

struct Harness {
    MonitorConfig config = testConfig();
    FakeBroker* broker = nullptr;
    BrokerEventQueue* events = nullptr;
    FakeSystemActions* actions = nullptr;
    bool connect_result = true;
    bool action_result = true;

    Harness() { config.defaults.report_interval = 1; }

    std::unique_ptr<MonitorDaemon> make() {
        auto sensor = std::make_unique<FakeSensor>();
        sensor->setReading(3.9, 0.0);
        auto system = std::make_unique<FakeSystemActions>();
        system->result = action_result;
        actions = system.get();
        return std::make_unique<MonitorDaemon>(
            config, std::string(), std::move(sensor), std::move(system),
            [this](const BrokerOptions&, BrokerEventQueue& queue) {
                auto client = std::make_unique<FakeBroker>();
                client->connect_result = connect_result;
                broker = client.get();
                events = &queue;
                return std::unique_ptr<BrokerClient>(std::move(client));
            });
    }
};

template <typename Predicate>
static bool waitFor(Predicate predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

static void test_session_and_commands() {
    Harness h;
    auto daemon = h.make();
    EXPECT_TRUE(daemon->initialize());

    int exit_code = -1;
    std::thread runner([&]() { exit_code = daemon->run(); });

    EXPECT_TRUE(waitFor([&]() { return h.broker->connect_calls == 1; }, 1000ms));
    h.broker->setConnected(true);
    h.events->push(BrokerEvent::connected());

    const std::string status = h.config.statusTopic();
    EXPECT_TRUE(waitFor([&]() { return h.broker->countPayload(status, "online") == 1; }, 1000ms));
    EXPECT_TRUE(waitFor([&]() { return h.broker->countPublished(h.config.stateTopic()) >= 1; },
                        2000ms));

    h.events->push(BrokerEvent::message(h.config.commandPrefix() + "battery_warning_threshold", "35"));
    EXPECT_TRUE(waitFor([&]() {
        return daemon->settings().snapshot().battery_warning_threshold == 35;
    }, 1000ms));

    h.events->push(BrokerEvent::message(h.config.commandPrefix() + "restart", ""));
    EXPECT_TRUE(waitFor([&]() { return h.actions->restart_calls.load() == 1; }, 1000ms));
    // Offline goes out before the restart command
    EXPECT_TRUE(h.broker->countPayload(status, "offline") >= 1);

    daemon->requestStop();
    runner.join();
    EXPECT_EQ_INT(exit_code, EXIT_SUCCESS);
    EXPECT_EQ_INT(h.broker->disconnect_calls, 1);
}

static std::string lastPayload(const FakeBroker& broker, const std::string& topic) {
    const auto published = broker.published();
    for (auto it = published.rbegin(); it != published.rend(); ++it) {
        if (it->topic == topic) {
            return it->payload;
        }
    }
    return std::string();
}

static void test_failed_restart_restores_online() {
    Harness h;
    h.action_result = false;
    auto daemon = h.make();
    EXPECT_TRUE(daemon->initialize());

    std::thread runner([&]() { daemon->run(); });
    EXPECT_TRUE(waitFor([&]() { return h.broker->connect_calls == 1; }, 1000ms));
    h.broker->setConnected(true);
    h.events->push(BrokerEvent::connected());

    const std::string status = h.config.statusTopic();
    EXPECT_TRUE(waitFor([&]() { return h.broker->countPayload(status, "online") == 1; }, 1000ms));

    h.events->push(BrokerEvent::message(h.config.commandPrefix() + "restart", ""));
    EXPECT_TRUE(waitFor([&]() { return h.broker->countPayload(status, "online") == 2; }, 1000ms));
    EXPECT_EQ_INT(h.actions->restart_calls.load(), 1);
    EXPECT_EQ_INT(h.broker->countPayload(status, "offline"), 1);
    EXPECT_EQ_STR(lastPayload(*h.broker, status), "online");

    // Monitoring carries on
    const int states = h.broker->countPublished(h.config.stateTopic());
    EXPECT_TRUE(waitFor([&]() {
        return h.broker->countPublished(h.config.stateTopic()) > states;
    }, 2500ms));

    daemon->requestStop();
    runner.join();
}

static void test_exit_on_fail() {
    Harness h;
    h.config.mqtt.exit_on_fail = true;
    h.connect_result = false;
    auto daemon = h.make();
    EXPECT_TRUE(daemon->initialize());
    EXPECT_EQ_INT(daemon->run(), EXIT_FAILURE);
}

static void test_failed_connect_event_is_fatal() {
    Harness h;
    h.config.mqtt.exit_on_fail = true;
    auto daemon = h.make();
    EXPECT_TRUE(daemon->initialize());

    int exit_code = -1;
    std::thread runner([&]() { exit_code = daemon->run(); });
    EXPECT_TRUE(waitFor([&]() { return h.broker->connect_calls == 1; }, 1000ms));
    h.events->push(BrokerEvent::connectFailed("connection refused"));
    runner.join();
    EXPECT_EQ_INT(exit_code, EXIT_FAILURE);
}

int main() {
    test_session_and_commands();
    test_failed_restart_restores_online();
    test_exit_on_fail();
    test_failed_connect_event_is_fatal();
    return finishTests("monitor daemon");
}
