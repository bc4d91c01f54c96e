/**
 * @file discovery_publisher.cpp
 * @brief Home Assistant discovery payloads
 */

#include "discovery_publisher.hpp"
#include "logger.hpp"
#include "version.hpp"
#include <ArduinoJson.h>
#include <sstream>

namespace {

constexpr double NO_LIMIT = 0.0;

} // namespace

const std::vector<DiscoveryEntity>& DiscoveryPublisher::entities() {
    static const std::vector<DiscoveryEntity> list = {
        {"voltage", "Voltage", EntityType::Sensor, "V", "voltage", nullptr, 2, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"current", "Current", EntityType::Sensor, "A", "current", nullptr, 3, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"battery_level", "Battery Level", EntityType::Sensor, "%", "battery", nullptr, -1, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"external_power", "External Power", EntityType::BinarySensor, nullptr, "plug", "diagnostic", -1, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"cpu_temperature", "CPU Temperature", EntityType::Sensor, "\xC2\xB0" "C", "temperature", "diagnostic", 2, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"cpu_stat", "CPU Stat", EntityType::Sensor, nullptr, nullptr, "diagnostic", -1, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"battery_warning_threshold", "Battery Warning", EntityType::Number, "%", "battery", "config", -1, 0.0, 100.0, 1.0},
        {"battery_voltage_minimum", "Battery Voltage Minimum", EntityType::Number, "V", "voltage", "config", -1, 2.5, 4.5, 0.1},
        {"battery_voltage_maximum", "Battery Voltage Maximum", EntityType::Number, "V", "voltage", "config", -1, 2.5, 4.5, 0.1},
        {"report_interval", "Report Interval", EntityType::Number, "s", nullptr, "config", -1, 5.0, 300.0, 5.0},
        {"restart", "Restart", EntityType::Button, nullptr, "restart", "diagnostic", -1, NO_LIMIT, NO_LIMIT, NO_LIMIT},
        {"shutdown", "Shutdown", EntityType::Button, nullptr, nullptr, "diagnostic", -1, NO_LIMIT, NO_LIMIT, NO_LIMIT},
    };
    return list;
}

const char* DiscoveryPublisher::componentName(EntityType type) {
    switch (type) {
        case EntityType::Sensor: return "sensor";
        case EntityType::BinarySensor: return "binary_sensor";
        case EntityType::Number: return "number";
        case EntityType::Button: return "button";
    }
    return "sensor";
}

DiscoveryPublisher::DiscoveryPublisher(const MonitorConfig& config, BrokerClient& broker)
    : config_(config), broker_(broker) {
}

std::chrono::seconds DiscoveryPublisher::interval() const {
    return std::chrono::seconds(config_.homeassistant.discovery_interval);
}

std::string DiscoveryPublisher::deviceId() const {
    return config_.homeassistant.device_prefix + "_" + config_.hostname.name;
}

std::string DiscoveryPublisher::configTopic(const DiscoveryEntity& entity) const {
    return config_.homeassistant.topic + "/" + componentName(entity.type) + "/" +
           deviceId() + "_" + entity.field + "/config";
}

std::string DiscoveryPublisher::configPayload(const DiscoveryEntity& entity) const {
    StaticJsonDocument<2048> doc;
    const std::string device_id = deviceId();

    doc["name"] = entity.pretty;
    doc["unique_id"] = device_id + "_" + entity.field;
    doc["object_id"] = device_id + "_" + entity.field;
    if (entity.device_class != nullptr) {
        doc["device_class"] = entity.device_class;
    }
    if (entity.entity_category != nullptr) {
        doc["entity_category"] = entity.entity_category;
    }

    JsonArray availability = doc.createNestedArray("availability");
    JsonObject status = availability.createNestedObject();
    status["topic"] = config_.statusTopic();
    status["payload_available"] = config_.mqtt.payload_online;
    status["payload_not_available"] = config_.mqtt.payload_offline;

    JsonObject device = doc.createNestedObject("device");
    JsonArray identifiers = device.createNestedArray("identifiers");
    identifiers.add(device_id);
    device["name"] = config_.hostname.pretty;
    device["manufacturer"] = config_.homeassistant.manufacturer;
    device["model"] = config_.homeassistant.model;
    device["sw_version"] = BATTERY_MONITOR_VERSION;

    const std::string value_template = std::string("{{ value_json.") + entity.field + " }}";
    const std::string command_topic = config_.commandPrefix() + entity.field;

    switch (entity.type) {
        case EntityType::Sensor:
            doc["state_topic"] = config_.stateTopic();
            doc["value_template"] = value_template;
            doc["expire_after"] = config_.homeassistant.expire_after;
            if (entity.unit != nullptr) {
                doc["unit_of_measurement"] = entity.unit;
                doc["state_class"] = "measurement";
            }
            if (entity.display_precision >= 0) {
                doc["suggested_display_precision"] = entity.display_precision;
            }
            break;
        case EntityType::BinarySensor:
            doc["state_topic"] = config_.stateTopic();
            doc["value_template"] = value_template;
            doc["expire_after"] = config_.homeassistant.expire_after;
            doc["payload_on"] = "ON";
            doc["payload_off"] = "OFF";
            break;
        case EntityType::Number:
            doc["state_topic"] = config_.stateTopic();
            doc["value_template"] = value_template;
            doc["command_topic"] = command_topic;
            doc["command_template"] = "{{ value }}";
            doc["min"] = entity.min;
            doc["max"] = entity.max;
            doc["step"] = entity.step;
            doc["mode"] = "box";
            if (entity.unit != nullptr) {
                doc["unit_of_measurement"] = entity.unit;
            }
            break;
        case EntityType::Button:
            doc["command_topic"] = command_topic;
            doc["payload_press"] = "PRESS";
            break;
    }

    std::string json;
    serializeJson(doc, json);
    return json;
}

int DiscoveryPublisher::announce() {
    if (!enabled()) {
        return 0;
    }
    if (!broker_.isConnected()) {
        logMessage(LOG_DEBUG, "Skipping discovery announcement, broker not connected");
        return 0;
    }

    int published = 0;
    for (const auto& entity : entities()) {
        const std::string topic = configTopic(entity);
        if (broker_.publish(topic, configPayload(entity), config_.mqtt.qos, true)) {
            ++published;
        } else {
            logMessage(LOG_WARNING, "Discovery publish failed for " + topic);
        }
    }

    std::ostringstream oss;
    oss << "Published " << published << "/" << entities().size()
        << " Home Assistant discovery configs";
    logMessage(LOG_DEBUG, oss.str());
    return published;
}
