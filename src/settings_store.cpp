/**
 * @file settings_store.cpp
 * @brief Guarded runtime settings and their JSON settings file
 */

#include "settings_store.hpp"
#include "logger.hpp"
#include <ArduinoJson.h>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <utility>

namespace {

// Integral decimals such as 10.0 count as integers
void readIntegerKey(JsonVariantConst value, const char* key, const std::string& path, int& out) {
    if (value.isNull()) {
        return;
    }
    if (value.is<int>()) {
        out = value.as<int>();
        return;
    }
    if (value.is<double>()) {
        const double number = value.as<double>();
        if (std::isfinite(number) && std::trunc(number) == number &&
            std::fabs(number) <= 2147483647.0) {
            out = static_cast<int>(number);
            return;
        }
    }
    logMessage(LOG_WARNING, std::string("Ignoring ") + key + " in " + path +
                                ", expected an integer");
}

void readNumberKey(JsonVariantConst value, const char* key, const std::string& path, double& out) {
    if (value.isNull()) {
        return;
    }
    if (value.is<double>()) {
        out = value.as<double>();
        return;
    }
    logMessage(LOG_WARNING, std::string("Ignoring ") + key + " in " + path +
                                ", expected a number");
}

} // namespace

bool validateSettings(const RuntimeSettings& settings, std::string* reason) {
    std::ostringstream oss;

    if (settings.battery_warning_threshold < 0 || settings.battery_warning_threshold > 100) {
        oss << "battery_warning_threshold " << settings.battery_warning_threshold
            << " outside [0,100]";
    } else if (!std::isfinite(settings.battery_voltage_minimum) ||
               !std::isfinite(settings.battery_voltage_maximum)) {
        oss << "battery voltage limits must be finite";
    } else if (settings.battery_voltage_minimum >= settings.battery_voltage_maximum) {
        oss << "battery_voltage_minimum " << settings.battery_voltage_minimum
            << "V not below battery_voltage_maximum " << settings.battery_voltage_maximum << "V";
    } else if (settings.report_interval <= 0) {
        oss << "report_interval " << settings.report_interval << " must be positive";
    } else {
        return true;
    }

    if (reason != nullptr) {
        *reason = oss.str();
    }
    return false;
}

SettingsStore::SettingsStore(const RuntimeSettings& initial, std::string path)
    : settings_(initial), path_(std::move(path)) {
}

RuntimeSettings SettingsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

bool SettingsStore::setBatteryWarningThreshold(int percent) {
    return update([percent](RuntimeSettings& s) { s.battery_warning_threshold = percent; });
}

bool SettingsStore::setBatteryVoltageMinimum(double volts) {
    return update([volts](RuntimeSettings& s) { s.battery_voltage_minimum = volts; });
}

bool SettingsStore::setBatteryVoltageMaximum(double volts) {
    return update([volts](RuntimeSettings& s) { s.battery_voltage_maximum = volts; });
}

bool SettingsStore::setReportInterval(int seconds) {
    return update([seconds](RuntimeSettings& s) { s.report_interval = seconds; });
}

bool SettingsStore::update(const std::function<void(RuntimeSettings&)>& mutate) {
    RuntimeSettings copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        copy = settings_;
        mutate(copy);
        if (!validateSettings(copy)) {
            return false;
        }
        settings_ = copy;
    }

    if (!save()) {
        logMessage(LOG_WARNING, "Settings change applied in memory only");
    }
    return true;
}

bool SettingsStore::load() {
    if (path_.empty()) {
        return true;
    }

    struct stat st;
    if (stat(path_.c_str(), &st) != 0) {
        logMessage(LOG_INFO, "Settings file " + path_ + " not found, writing defaults");
        return save();
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        logMessage(LOG_WARNING, "Unable to open settings file " + path_);
        return false;
    }

    StaticJsonDocument<512> doc;
    DeserializationError err = deserializeJson(doc, file);
    if (err) {
        logMessage(LOG_WARNING, "Settings file " + path_ + " is not valid JSON: " + err.c_str());
        return false;
    }

    RuntimeSettings merged = snapshot();

    readIntegerKey(doc["battery_warning_threshold"], "battery_warning_threshold", path_,
                   merged.battery_warning_threshold);
    readNumberKey(doc["battery_voltage_minimum"], "battery_voltage_minimum", path_,
                  merged.battery_voltage_minimum);
    readNumberKey(doc["battery_voltage_maximum"], "battery_voltage_maximum", path_,
                  merged.battery_voltage_maximum);
    readIntegerKey(doc["report_interval"], "report_interval", path_, merged.report_interval);

    std::string reason;
    if (!validateSettings(merged, &reason)) {
        logMessage(LOG_WARNING, "Ignoring settings file " + path_ + ": " + reason);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = merged;
    }

    std::ostringstream oss;
    oss << "Loaded settings from " << path_ << ": threshold=" << merged.battery_warning_threshold
        << "% min=" << merged.battery_voltage_minimum << "V max=" << merged.battery_voltage_maximum
        << "V interval=" << merged.report_interval << "s";
    logMessage(LOG_INFO, oss.str());
    return true;
}

bool SettingsStore::save() const {
    if (path_.empty()) {
        return true;
    }
    // Serialise writers and always write the newest values
    std::lock_guard<std::mutex> lock(file_mutex_);
    return persist(snapshot());
}

bool SettingsStore::persist(const RuntimeSettings& settings) const {
    StaticJsonDocument<256> doc;
    doc["report_interval"] = settings.report_interval;
    doc["battery_warning_threshold"] = settings.battery_warning_threshold;
    doc["battery_voltage_minimum"] = settings.battery_voltage_minimum;
    doc["battery_voltage_maximum"] = settings.battery_voltage_maximum;

    std::string body;
    serializeJson(doc, body);

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            logMessage(LOG_WARNING, "Unable to write settings file " + tmp_path);
            return false;
        }
        file << body << '\n';
        if (!file.good()) {
            logMessage(LOG_WARNING, "Short write on settings file " + tmp_path);
            return false;
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        logMessage(LOG_WARNING, "Unable to replace settings file " + path_);
        std::remove(tmp_path.c_str());
        return false;
    }
    return true;
}
