/**
 * @file state_payload.cpp
 * @brief JSON encoding of the state topic payload
 */

#include "state_payload.hpp"
#include <ArduinoJson.h>

const char* externalPowerText(bool external_power) {
    return external_power ? "ON" : "OFF";
}

std::string StatePayload::toJson() const {
    StaticJsonDocument<512> doc;

    doc["voltage"] = voltage;
    doc["current"] = current;
    doc["battery_level"] = battery_level;
    doc["external_power"] = externalPowerText(external_power);
    if (cpu_temperature.has_value()) {
        doc["cpu_temperature"] = cpu_temperature.value();
    } else {
        doc["cpu_temperature"] = nullptr;
    }
    if (cpu_stat.has_value()) {
        doc["cpu_stat"] = cpu_stat.value();
    } else {
        doc["cpu_stat"] = nullptr;
    }
    doc["battery_warning_threshold"] = battery_warning_threshold;
    doc["battery_voltage_minimum"] = battery_voltage_minimum;
    doc["battery_voltage_maximum"] = battery_voltage_maximum;
    doc["report_interval"] = report_interval;

    std::string json;
    serializeJson(doc, json);
    return json;
}
