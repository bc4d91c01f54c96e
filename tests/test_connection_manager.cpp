#include "connection_manager.hpp"
#include "discovery_publisher.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using Clock = ConnectionManager::Clock;

static BackoffPolicy defaultBackoff() {
    return BackoffPolicy(1s, 60s);
}

static void test_broker_options() {
    MonitorConfig config = testConfig();
    config.mqtt.user = "ha";
    const BrokerOptions options = ConnectionManager::brokerOptions(config);
    EXPECT_EQ_STR(options.host, "127.0.0.1");
    EXPECT_EQ_INT(options.port, 1883);
    EXPECT_EQ_STR(options.user, "ha");
    EXPECT_EQ_STR(options.will.topic, "batterymonitor/pi/status");
    EXPECT_EQ_STR(options.will.payload, "offline");
    EXPECT_EQ_INT(options.will.qos, 1);
    EXPECT_TRUE(options.will.retain);
}

static void test_connect_and_reconnect() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());
    DiscoveryPublisher discovery(config, broker);

    int hooks = 0;
    manager.addConnectedHook([&]() {
        ++hooks;
        discovery.announce();
    });

    const auto t0 = Clock::now();
    EXPECT_TRUE(manager.start(t0));
    EXPECT_EQ_INT(broker.connect_calls, 1);
    EXPECT_TRUE(manager.state() == ConnectionState::Connecting);

    broker.setConnected(true);
    manager.handleConnected();
    EXPECT_TRUE(manager.state() == ConnectionState::Connected);
    EXPECT_EQ_INT(broker.subscriptions().size(), 1);
    EXPECT_EQ_STR(broker.subscriptions()[0], "batterymonitor/pi/set/+");
    EXPECT_EQ_INT(broker.countPayload(config.statusTopic(), "online"), 1);
    EXPECT_EQ_INT(hooks, 1);

    const std::string voltage_config = discovery.configTopic(DiscoveryPublisher::entities()[0]);
    EXPECT_EQ_INT(broker.countPublished(voltage_config), 1);

    // A duplicate event for the same session is ignored
    manager.handleConnected();
    EXPECT_EQ_INT(broker.subscriptions().size(), 1);
    EXPECT_EQ_INT(hooks, 1);

    // Unexpected loss
    broker.setConnected(false);
    const auto t1 = Clock::now();
    manager.handleConnectionLost("keepalive timeout", t1);
    EXPECT_TRUE(manager.state() == ConnectionState::Reconnecting);
    EXPECT_TRUE(manager.nextAttempt().has_value());
    EXPECT_TRUE(manager.nextAttempt().value() == t1 + 1s);

    EXPECT_TRUE(manager.poll(t1));
    EXPECT_EQ_INT(broker.connect_calls, 1);
    EXPECT_TRUE(manager.poll(t1 + 1s));
    EXPECT_EQ_INT(broker.connect_calls, 2);
    EXPECT_FALSE(manager.nextAttempt().has_value());

    broker.setConnected(true);
    manager.handleConnected();
    EXPECT_TRUE(manager.state() == ConnectionState::Connected);
    EXPECT_EQ_INT(manager.connectCount(), 2);
    EXPECT_EQ_INT(broker.countPayload(config.statusTopic(), "online"), 2);
    EXPECT_EQ_INT(broker.countPublished(voltage_config), 2);
    EXPECT_EQ_INT(hooks, 2);
    // One subscription per session
    EXPECT_EQ_INT(broker.subscriptions().size(), 2);
}

static void test_loss_ignored_when_not_connected() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());
    manager.handleConnectionLost("late callback", Clock::now());
    EXPECT_TRUE(manager.state() == ConnectionState::Disconnected);
    EXPECT_FALSE(manager.nextAttempt().has_value());
}

static void test_exit_on_fail() {
    MonitorConfig config = testConfig();
    config.mqtt.exit_on_fail = true;
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());

    EXPECT_TRUE(manager.start(Clock::now()));
    EXPECT_FALSE(manager.handleConnectFailed("connection refused", Clock::now()));
    EXPECT_FALSE(manager.nextAttempt().has_value());

    FakeBroker rejecting;
    rejecting.connect_result = false;
    ConnectionManager rejected(config, rejecting, defaultBackoff());
    EXPECT_FALSE(rejected.start(Clock::now()));
}

static void test_retry_backoff_without_exit_on_fail() {
    MonitorConfig config = testConfig();
    config.mqtt.exit_on_fail = false;
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());

    const auto t0 = Clock::now();
    EXPECT_TRUE(manager.start(t0));
    EXPECT_TRUE(manager.handleConnectFailed("connection refused", t0));
    EXPECT_TRUE(manager.nextAttempt().value() == t0 + 1s);

    EXPECT_TRUE(manager.poll(t0 + 1s));
    EXPECT_TRUE(manager.handleConnectFailed("connection refused", t0 + 1s));
    EXPECT_TRUE(manager.nextAttempt().value() == t0 + 3s);
    EXPECT_TRUE(manager.state() == ConnectionState::Disconnected);
}

static void test_failure_after_first_connect_retries() {
    MonitorConfig config = testConfig();
    config.mqtt.exit_on_fail = true;
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());

    EXPECT_TRUE(manager.start(Clock::now()));
    broker.setConnected(true);
    manager.handleConnected();
    broker.setConnected(false);
    manager.handleConnectionLost("", Clock::now());
    EXPECT_TRUE(manager.handleConnectFailed("connection refused", Clock::now()));
    EXPECT_TRUE(manager.state() == ConnectionState::Reconnecting);
}

static void test_graceful_shutdown() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    ConnectionManager manager(config, broker, defaultBackoff());

    EXPECT_TRUE(manager.start(Clock::now()));
    broker.setConnected(true);
    manager.handleConnected();
    manager.shutdown();

    const auto published = broker.published();
    EXPECT_EQ_STR(published.back().topic, "batterymonitor/pi/status");
    EXPECT_EQ_STR(published.back().payload, "offline");
    EXPECT_TRUE(published.back().retain);
    EXPECT_EQ_INT(broker.disconnect_calls, 1);
    EXPECT_TRUE(manager.state() == ConnectionState::Disconnected);
}

int main() {
    test_broker_options();
    test_connect_and_reconnect();
    test_loss_ignored_when_not_connected();
    test_exit_on_fail();
    test_retry_backoff_without_exit_on_fail();
    test_failure_after_first_connect_retries();
    test_graceful_shutdown();
    return finishTests("connection manager");
}
