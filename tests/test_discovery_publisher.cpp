#include "discovery_publisher.hpp"
#include "test_fakes.hpp"
#include "test_support.hpp"
#include <ArduinoJson.h>

template <typename Value>
static std::string text(const Value& value) {
    const char* s = value.template as<const char*>();
    return s != nullptr ? s : "";
}

static const DiscoveryEntity& entity(const std::string& field) {
    for (const auto& e : DiscoveryPublisher::entities()) {
        if (field == e.field) {
            return e;
        }
    }
    return DiscoveryPublisher::entities().front();
}

static void test_entity_table() {
    EXPECT_EQ_INT(DiscoveryPublisher::entities().size(), 12);
    EXPECT_EQ_STR(entity("external_power").field, "external_power");
    EXPECT_TRUE(entity("external_power").type == EntityType::BinarySensor);
    EXPECT_TRUE(entity("report_interval").type == EntityType::Number);
    EXPECT_TRUE(entity("shutdown").type == EntityType::Button);
}

static void test_topics() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    DiscoveryPublisher discovery(config, broker);

    EXPECT_EQ_STR(discovery.deviceId(), "batterymonitor_pi");
    EXPECT_EQ_STR(discovery.configTopic(entity("voltage")),
                  "homeassistant/sensor/batterymonitor_pi_voltage/config");
    EXPECT_EQ_STR(discovery.configTopic(entity("external_power")),
                  "homeassistant/binary_sensor/batterymonitor_pi_external_power/config");
    EXPECT_EQ_STR(discovery.configTopic(entity("report_interval")),
                  "homeassistant/number/batterymonitor_pi_report_interval/config");
    EXPECT_EQ_STR(discovery.configTopic(entity("restart")),
                  "homeassistant/button/batterymonitor_pi_restart/config");
}

static void test_sensor_payload() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    DiscoveryPublisher discovery(config, broker);

    StaticJsonDocument<2048> doc;
    EXPECT_FALSE(deserializeJson(doc, discovery.configPayload(entity("voltage"))));
    EXPECT_EQ_STR(text(doc["name"]), "Voltage");
    EXPECT_EQ_STR(text(doc["unique_id"]), "batterymonitor_pi_voltage");
    EXPECT_EQ_STR(text(doc["state_topic"]), "batterymonitor/pi/state");
    EXPECT_EQ_STR(text(doc["value_template"]), "{{ value_json.voltage }}");
    EXPECT_EQ_STR(text(doc["unit_of_measurement"]), "V");
    EXPECT_EQ_STR(text(doc["device_class"]), "voltage");
    EXPECT_EQ_INT(doc["expire_after"].as<int>(), 120);
    EXPECT_EQ_STR(text(doc["availability"][0]["topic"]), "batterymonitor/pi/status");
    EXPECT_EQ_STR(text(doc["availability"][0]["payload_available"]), "online");
    EXPECT_EQ_STR(text(doc["availability"][0]["payload_not_available"]), "offline");
    EXPECT_EQ_STR(text(doc["device"]["identifiers"][0]), "batterymonitor_pi");
    EXPECT_EQ_STR(text(doc["device"]["name"]), "Pi");
    EXPECT_TRUE(doc["command_topic"].isNull());
}

static void test_command_payloads() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    DiscoveryPublisher discovery(config, broker);

    StaticJsonDocument<2048> number;
    EXPECT_FALSE(deserializeJson(number, discovery.configPayload(entity("report_interval"))));
    EXPECT_EQ_STR(text(number["command_topic"]), "batterymonitor/pi/set/report_interval");
    EXPECT_NEAR(number["min"].as<double>(), 5.0, 1e-9);
    EXPECT_NEAR(number["max"].as<double>(), 300.0, 1e-9);
    EXPECT_NEAR(number["step"].as<double>(), 5.0, 1e-9);
    EXPECT_EQ_STR(text(number["mode"]), "box");

    StaticJsonDocument<2048> button;
    EXPECT_FALSE(deserializeJson(button, discovery.configPayload(entity("shutdown"))));
    EXPECT_EQ_STR(text(button["command_topic"]), "batterymonitor/pi/set/shutdown");
    EXPECT_EQ_STR(text(button["payload_press"]), "PRESS");
    EXPECT_TRUE(button["state_topic"].isNull());

    StaticJsonDocument<2048> binary;
    EXPECT_FALSE(deserializeJson(binary, discovery.configPayload(entity("external_power"))));
    EXPECT_EQ_STR(text(binary["payload_on"]), "ON");
    EXPECT_EQ_STR(text(binary["payload_off"]), "OFF");
    EXPECT_EQ_STR(text(binary["device_class"]), "plug");
}

static void test_announce() {
    MonitorConfig config = testConfig();
    FakeBroker broker;
    DiscoveryPublisher discovery(config, broker);

    EXPECT_EQ_INT(discovery.announce(), 0);
    EXPECT_EQ_INT(broker.published().size(), 0);

    broker.setConnected(true);
    EXPECT_EQ_INT(discovery.announce(), 12);
    for (const auto& message : broker.published()) {
        EXPECT_TRUE(message.retain);
        EXPECT_EQ_INT(message.qos, 1);
    }

    config.homeassistant.discovery = false;
    broker.clear();
    EXPECT_EQ_INT(discovery.announce(), 0);
    EXPECT_EQ_INT(broker.published().size(), 0);
}

int main() {
    test_entity_table();
    test_topics();
    test_sensor_payload();
    test_command_payloads();
    test_announce();
    return finishTests("discovery publisher");
}
