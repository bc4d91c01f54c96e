#ifndef STATE_PAYLOAD_HPP
#define STATE_PAYLOAD_HPP

/**
 * @file state_payload.hpp
 * @brief Per tick state published on the state topic
 */

#include <optional>
#include <string>

struct StatePayload {
    double voltage = 0.0;                   // V, 3 decimals
    double current = 0.0;                   // A, 4 decimals
    int battery_level = 0;                  // percent, [0,100]
    bool external_power = true;
    std::optional<double> cpu_temperature;  // degrees C
    std::optional<int> cpu_stat;            // get_throttled bitmask
    int battery_warning_threshold = 0;
    double battery_voltage_minimum = 0.0;
    double battery_voltage_maximum = 0.0;
    int report_interval = 0;

    /** @brief JSON object, missing CPU values encode as null */
    std::string toJson() const;
};

const char* externalPowerText(bool external_power);

#endif // STATE_PAYLOAD_HPP
