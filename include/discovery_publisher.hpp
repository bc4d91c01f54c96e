#ifndef DISCOVERY_PUBLISHER_HPP
#define DISCOVERY_PUBLISHER_HPP

/**
 * @file discovery_publisher.hpp
 * @brief Home Assistant MQTT discovery announcements
 */

#include "broker_client.hpp"
#include "config_parser.hpp"
#include <chrono>
#include <string>
#include <vector>

enum class EntityType {
    Sensor,
    BinarySensor,
    Number,
    Button
};

/**
 * @brief Static description of one published entity
 *
 * Null strings and negative precision mean "not set".
 */
struct DiscoveryEntity {
    const char* field;
    const char* pretty;
    EntityType type;
    const char* unit;
    const char* device_class;
    const char* entity_category;
    int display_precision;
    double min;
    double max;
    double step;
};

class DiscoveryPublisher {
public:
    DiscoveryPublisher(const MonitorConfig& config, BrokerClient& broker);

    bool enabled() const { return config_.homeassistant.discovery; }
    std::chrono::seconds interval() const;

    /** @brief <device_prefix>_<hostname>, used for identifiers and unique ids */
    std::string deviceId() const;

    std::string configTopic(const DiscoveryEntity& entity) const;
    std::string configPayload(const DiscoveryEntity& entity) const;

    /**
     * @brief Publishes every entity config, retained
     * @return number of configs handed to the broker
     */
    int announce();

    static const std::vector<DiscoveryEntity>& entities();
    static const char* componentName(EntityType type);

private:
    const MonitorConfig& config_;
    BrokerClient& broker_;
};

#endif // DISCOVERY_PUBLISHER_HPP
