/**
 * @file config_parser.cpp
 * @brief YAML configuration loading and validation
 */

#include "config_parser.hpp"
#include <yaml-cpp/yaml.h>
#include <climits>
#include <sstream>
#include <unistd.h>

namespace {

template <typename T>
void readValue(const YAML::Node& section, const char* key, T& out) {
    if (!section || !section.IsMap()) {
        return;
    }
    const YAML::Node node = section[key];
    if (node && !node.IsNull()) {
        out = node.as<T>();
    }
}

void requirePositive(int value, const char* name) {
    if (value <= 0) {
        std::ostringstream oss;
        oss << name << " must be positive, got " << value;
        throw ConfigError(oss.str());
    }
}

void requireTopicLevel(const std::string& value, const char* name) {
    if (value.empty() || value.find_first_of("#+") != std::string::npos) {
        throw ConfigError(std::string(name) + " must be a non-empty topic without wildcards");
    }
}

MonitorConfig buildConfig(const YAML::Node& root) {
    MonitorConfig config;

    const YAML::Node mqtt = root["mqtt"];
    readValue(mqtt, "broker", config.mqtt.broker);
    readValue(mqtt, "port", config.mqtt.port);
    readValue(mqtt, "user", config.mqtt.user);
    readValue(mqtt, "password", config.mqtt.password);
    readValue(mqtt, "client_id", config.mqtt.client_id);
    readValue(mqtt, "version", config.mqtt.version);
    readValue(mqtt, "timeout", config.mqtt.keepalive_sec);
    readValue(mqtt, "qos", config.mqtt.qos);
    readValue(mqtt, "exit_on_fail", config.mqtt.exit_on_fail);
    readValue(mqtt, "base_topic", config.mqtt.base_topic);
    readValue(mqtt, "reconnect_min_delay", config.mqtt.reconnect_min_delay_sec);
    readValue(mqtt, "reconnect_max_delay", config.mqtt.reconnect_max_delay_sec);
    if (mqtt && mqtt.IsMap()) {
        const YAML::Node topic = mqtt["topic"];
        readValue(topic, "state", config.mqtt.state_topic);
        readValue(topic, "status", config.mqtt.status_topic);
        readValue(topic, "set", config.mqtt.set_topic);
    }

    const YAML::Node status = root["status"];
    readValue(status, "online", config.mqtt.payload_online);
    readValue(status, "offline", config.mqtt.payload_offline);

    const YAML::Node hostname = root["hostname"];
    readValue(hostname, "name", config.hostname.name);
    readValue(hostname, "pretty", config.hostname.pretty);

    const YAML::Node homeassistant = root["homeassistant"];
    readValue(homeassistant, "discovery", config.homeassistant.discovery);
    readValue(homeassistant, "topic", config.homeassistant.topic);
    readValue(homeassistant, "discovery_interval", config.homeassistant.discovery_interval);
    readValue(homeassistant, "expire_after", config.homeassistant.expire_after);
    readValue(homeassistant, "device_prefix", config.homeassistant.device_prefix);
    readValue(homeassistant, "manufacturer", config.homeassistant.manufacturer);
    readValue(homeassistant, "model", config.homeassistant.model);

    const YAML::Node sensor = root["sensor"];
    int address = config.sensor.i2c_addr;
    readValue(sensor, "i2c_bus", config.sensor.i2c_bus);
    readValue(sensor, "address", address);
    readValue(sensor, "shunt_ohms", config.sensor.shunt_ohms);
    readValue(sensor, "max_expected_amps", config.sensor.max_expected_amps);
    readValue(sensor, "monitor_interval", config.sensor.monitor_interval);
    if (address < 0x03 || address > 0x77) {
        std::ostringstream oss;
        oss << "sensor.address 0x" << std::hex << address << " is not a valid 7-bit I2C address";
        throw ConfigError(oss.str());
    }
    config.sensor.i2c_addr = static_cast<uint8_t>(address);

    const YAML::Node system = root["system"];
    readValue(system, "shutdown", config.system.shutdown_command);
    readValue(system, "restart", config.system.restart_command);
    readValue(system, "wall_message", config.system.wall_message);

    const YAML::Node logging = root["logging"];
    std::string level = Logger::levelName(config.logging.level);
    readValue(logging, "level", level);
    readValue(logging, "console", config.logging.console);
    readValue(logging, "syslog", config.logging.enable_syslog);
    config.logging.level = Logger::parseLevel(level, -1);
    if (config.logging.level < 0) {
        throw ConfigError("logging.level '" + level + "' is not a known level");
    }

    const YAML::Node defaults = root["defaults"];
    readValue(defaults, "battery_warning_threshold", config.defaults.battery_warning_threshold);
    readValue(defaults, "battery_voltage_minimum", config.defaults.battery_voltage_minimum);
    readValue(defaults, "battery_voltage_maximum", config.defaults.battery_voltage_maximum);
    readValue(defaults, "report_interval", config.defaults.report_interval);

    return config;
}

void validateConfig(MonitorConfig& config) {
    if (config.mqtt.port <= 0 || config.mqtt.port > 65535) {
        std::ostringstream oss;
        oss << "mqtt.port " << config.mqtt.port << " outside 1..65535";
        throw ConfigError(oss.str());
    }
    if (config.mqtt.version != 3 && config.mqtt.version != 5) {
        throw ConfigError("mqtt.version must be 3 or 5");
    }
    if (config.mqtt.qos < 1 || config.mqtt.qos > 2) {
        throw ConfigError("mqtt.qos must be 1 or 2");
    }
    requirePositive(config.mqtt.keepalive_sec, "mqtt.timeout");
    requirePositive(config.mqtt.reconnect_min_delay_sec, "mqtt.reconnect_min_delay");
    requirePositive(config.mqtt.reconnect_max_delay_sec, "mqtt.reconnect_max_delay");
    if (config.mqtt.reconnect_max_delay_sec < config.mqtt.reconnect_min_delay_sec) {
        throw ConfigError("mqtt.reconnect_max_delay must not be below mqtt.reconnect_min_delay");
    }
    requirePositive(config.homeassistant.discovery_interval, "homeassistant.discovery_interval");
    requirePositive(config.homeassistant.expire_after, "homeassistant.expire_after");
    if (config.sensor.shunt_ohms <= 0.0 || config.sensor.max_expected_amps <= 0.0) {
        throw ConfigError("sensor.shunt_ohms and sensor.max_expected_amps must be positive");
    }
    if (config.sensor.monitor_interval < 0) {
        throw ConfigError("sensor.monitor_interval must not be negative");
    }

    if (config.hostname.name.empty()) {
        config.hostname.name = ConfigParser::systemHostname();
    }
    if (config.hostname.pretty.empty()) {
        config.hostname.pretty = config.hostname.name;
    }
    if (config.mqtt.client_id.empty()) {
        config.mqtt.client_id = config.hostname.name;
    }

    requireTopicLevel(config.mqtt.base_topic, "mqtt.base_topic");
    requireTopicLevel(config.hostname.name, "hostname.name");
    requireTopicLevel(config.mqtt.state_topic, "mqtt.topic.state");
    requireTopicLevel(config.mqtt.status_topic, "mqtt.topic.status");
    requireTopicLevel(config.mqtt.set_topic, "mqtt.topic.set");
    requireTopicLevel(config.homeassistant.topic, "homeassistant.topic");

    std::string reason;
    if (!validateSettings(config.defaults, &reason)) {
        throw ConfigError("defaults: " + reason);
    }
}

} // namespace

std::string MonitorConfig::deviceTopic() const {
    return mqtt.base_topic + "/" + hostname.name;
}

std::string MonitorConfig::stateTopic() const {
    return deviceTopic() + "/" + mqtt.state_topic;
}

std::string MonitorConfig::statusTopic() const {
    return deviceTopic() + "/" + mqtt.status_topic;
}

std::string MonitorConfig::commandPrefix() const {
    return deviceTopic() + "/" + mqtt.set_topic + "/";
}

std::string MonitorConfig::commandFilter() const {
    return commandPrefix() + "+";
}

MonitorConfig ConfigParser::loadFile(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Unable to load " + path + ": " + e.what());
    }

    try {
        MonitorConfig config = buildConfig(root);
        validateConfig(config);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value in " + path + ": " + e.what());
    }
}

MonitorConfig ConfigParser::parse(const std::string& yaml_text) {
    try {
        MonitorConfig config = buildConfig(YAML::Load(yaml_text));
        validateConfig(config);
        return config;
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
}

std::string ConfigParser::systemHostname() {
    char name[HOST_NAME_MAX + 1] = {0};
    if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "batterymonitor";
    }
    return name;
}
