#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

/**
 * @file config_parser.hpp
 * @brief Static daemon configuration and its YAML loader
 */

#include "logger.hpp"
#include "settings_store.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Raised for unreadable or inconsistent configuration files
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

struct MqttConfig {
    std::string broker = "127.0.0.1";
    int port = 1883;
    std::string user;
    std::string password;
    std::string client_id = "Battery Monitor";
    int version = 3;                       // 3 (3.1.1) or 5
    int keepalive_sec = 60;
    int qos = 1;
    bool exit_on_fail = true;

    std::string base_topic = "batterymonitor";
    std::string state_topic = "state";
    std::string status_topic = "status";
    std::string set_topic = "set";

    std::string payload_online = "online";
    std::string payload_offline = "offline";

    int reconnect_min_delay_sec = 1;
    int reconnect_max_delay_sec = 60;
};

struct HostnameConfig {
    std::string name;                      // defaults to gethostname()
    std::string pretty;
};

struct HomeAssistantConfig {
    bool discovery = true;
    std::string topic = "homeassistant";
    int discovery_interval = 120;          // seconds
    int expire_after = 120;                // seconds
    std::string device_prefix = "batterymonitor";
    std::string manufacturer = "Battery Monitor";
    std::string model = "INA219 Battery HAT";
};

struct SensorConfig {
    std::string i2c_bus = "/dev/i2c-1";
    uint8_t i2c_addr = 0x40;
    double shunt_ohms = 0.05;
    double max_expected_amps = 5.5;
    int monitor_interval = 5;              // s between samples, 0 samples on report ticks only
};

struct SystemConfig {
    std::string shutdown_command = "sudo shutdown 0 -h";
    std::string restart_command = "sudo shutdown 0 -r";
    bool wall_message = true;              // broadcast autonomous shutdowns with wall(1)
};

/**
 * @brief Complete static configuration, immutable after startup
 */
struct MonitorConfig {
    MqttConfig mqtt;
    HostnameConfig hostname;
    HomeAssistantConfig homeassistant;
    SensorConfig sensor;
    SystemConfig system;
    LoggingConfig logging;
    RuntimeSettings defaults;              // seed values for the settings store

    std::string deviceTopic() const;       // <base>/<hostname>
    std::string stateTopic() const;
    std::string statusTopic() const;
    std::string commandPrefix() const;     // <base>/<hostname>/<set>/
    std::string commandFilter() const;     // <base>/<hostname>/<set>/+
};

/**
 * @brief Loads MonitorConfig from YAML, every key is optional
 */
class ConfigParser {
public:
    static MonitorConfig loadFile(const std::string& path);
    static MonitorConfig parse(const std::string& yaml_text);

    static std::string systemHostname();
};

#endif // CONFIG_PARSER_HPP
