#include "broker_client.hpp"
#include "test_support.hpp"
#include <thread>

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static void test_fifo_order() {
    BrokerEventQueue queue;
    queue.push(BrokerEvent::connected());
    queue.push(BrokerEvent::message("batterymonitor/pi/set/restart", ""));
    EXPECT_EQ_INT(queue.size(), 2);

    auto first = queue.tryPop();
    EXPECT_TRUE(first.has_value() && first->type == BrokerEvent::Type::Connected);
    auto second = queue.waitUntil(Clock::now() + 10ms);
    EXPECT_TRUE(second.has_value() && second->type == BrokerEvent::Type::Message);
    EXPECT_EQ_STR(second->topic, "batterymonitor/pi/set/restart");
    EXPECT_FALSE(queue.tryPop().has_value());
}

static void test_wait_times_out() {
    BrokerEventQueue queue;
    const auto start = Clock::now();
    EXPECT_FALSE(queue.waitUntil(start + 50ms).has_value());
    EXPECT_TRUE(Clock::now() - start >= 50ms);
}

static void test_push_wakes_waiter() {
    BrokerEventQueue queue;
    std::thread producer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.push(BrokerEvent::connectionLost("keepalive timeout"));
    });

    auto event = queue.waitUntil(Clock::now() + 2s);
    producer.join();
    EXPECT_TRUE(event.has_value() && event->type == BrokerEvent::Type::ConnectionLost);
    EXPECT_EQ_STR(event->reason, "keepalive timeout");
}

static void test_close_releases_waiter() {
    BrokerEventQueue queue;
    queue.push(BrokerEvent::connectFailed("refused"));
    std::thread closer([&queue]() {
        std::this_thread::sleep_for(20ms);
        queue.close();
    });

    // The pending event is taken first
    EXPECT_TRUE(queue.waitUntil(Clock::now() + 2s).has_value());
    const auto start = Clock::now();
    EXPECT_FALSE(queue.waitUntil(start + 2s).has_value());
    EXPECT_TRUE(Clock::now() - start < 1s);
    closer.join();

    EXPECT_TRUE(queue.closed());
    queue.push(BrokerEvent::connected());
    EXPECT_EQ_INT(queue.size(), 0);
}

static void test_state_names() {
    EXPECT_EQ_STR(connectionStateName(ConnectionState::Reconnecting), "Reconnecting");
    EXPECT_EQ_STR(connectionStateName(ConnectionState::Connected), "Connected");
}

int main() {
    test_fifo_order();
    test_wait_times_out();
    test_push_wakes_waiter();
    test_close_releases_waiter();
    test_state_names();
    return finishTests("broker event queue");
}
