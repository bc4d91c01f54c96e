#ifndef METRIC_DERIVER_HPP
#define METRIC_DERIVER_HPP

/**
 * @file metric_deriver.hpp
 * @brief Battery level, external power and shutdown policy calculations
 */

#include "sensor_reader.hpp"
#include "settings_store.hpp"
#include "state_payload.hpp"
#include <optional>

// Discharge current above which the board is running from the battery
constexpr double DISCHARGE_CURRENT_THRESHOLD_A = 0.010;
// The charger holds the cell slightly under its nominal maximum
constexpr double BATTERY_VOLTAGE_HEADROOM = 0.05;

/**
 * @brief Charge estimate, linear between minimum and (maximum - headroom), clamped to [0,100]
 */
int calculateBatteryLevel(double voltage, double minimum, double maximum);

/**
 * @brief External power is assumed unless the battery is discharging
 *
 * A voltage above maximum + headroom can only come from the charger, so it
 * forces external power on even when the current reads as a discharge.
 * A current overflow otherwise counts as running on battery.
 */
bool detectExternalPower(const PowerReading& reading, double maximum);

/**
 * @brief Builds the published state for one tick from a settings snapshot
 */
StatePayload deriveState(const PowerReading& reading,
                         std::optional<double> cpu_temperature,
                         std::optional<int> cpu_stat,
                         const RuntimeSettings& settings);

/**
 * @brief Low charge or low voltage while running on battery
 */
bool shutdownRequired(const StatePayload& state);

#endif // METRIC_DERIVER_HPP
