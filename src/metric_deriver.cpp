/**
 * @file metric_deriver.cpp
 * @brief Battery metric calculations
 */

#include "metric_deriver.hpp"
#include <algorithm>
#include <cmath>

namespace {

double roundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace

int calculateBatteryLevel(double voltage, double minimum, double maximum) {
    const double span = maximum - BATTERY_VOLTAGE_HEADROOM - minimum;
    if (span <= 0.0) {
        // Limits too close for a linear estimate
        return voltage > minimum ? 100 : 0;
    }

    const double percent = (voltage - minimum) / span * 100.0;
    return static_cast<int>(std::max(0.0, std::min(100.0, percent)));
}

bool detectExternalPower(const PowerReading& reading, double maximum) {
    if (reading.voltage > maximum + BATTERY_VOLTAGE_HEADROOM) {
        return true;
    }
    if (reading.overflow) {
        return false;
    }
    return reading.current <= DISCHARGE_CURRENT_THRESHOLD_A;
}

StatePayload deriveState(const PowerReading& reading,
                         std::optional<double> cpu_temperature,
                         std::optional<int> cpu_stat,
                         const RuntimeSettings& settings) {
    StatePayload state;
    state.voltage = roundTo(reading.voltage, 3);
    state.current = roundTo(reading.current, 4);
    state.battery_level = calculateBatteryLevel(reading.voltage,
                                                settings.battery_voltage_minimum,
                                                settings.battery_voltage_maximum);
    state.external_power = detectExternalPower(reading, settings.battery_voltage_maximum);
    state.cpu_temperature = cpu_temperature;
    state.cpu_stat = cpu_stat;
    state.battery_warning_threshold = settings.battery_warning_threshold;
    state.battery_voltage_minimum = settings.battery_voltage_minimum;
    state.battery_voltage_maximum = settings.battery_voltage_maximum;
    state.report_interval = settings.report_interval;
    return state;
}

bool shutdownRequired(const StatePayload& state) {
    if (state.external_power) {
        return false;
    }
    return state.battery_level <= state.battery_warning_threshold ||
           state.voltage <= state.battery_voltage_minimum;
}
