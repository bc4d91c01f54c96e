#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

/**
 * @file settings_store.hpp
 * @brief Runtime adjustable settings shared by the monitor loop and the command handler
 */

#include <functional>
#include <mutex>
#include <string>

constexpr int DEFAULT_REPORT_INTERVAL = 30;
constexpr int DEFAULT_BATTERY_WARNING_THRESHOLD = 10;
constexpr double DEFAULT_BATTERY_VOLTAGE_MINIMUM = 2.7;
constexpr double DEFAULT_BATTERY_VOLTAGE_MAXIMUM = 4.2;

/**
 * @brief Values that can be changed over MQTT while the daemon runs
 */
struct RuntimeSettings {
    int battery_warning_threshold = DEFAULT_BATTERY_WARNING_THRESHOLD;  // percent
    double battery_voltage_minimum = DEFAULT_BATTERY_VOLTAGE_MINIMUM;   // volts
    double battery_voltage_maximum = DEFAULT_BATTERY_VOLTAGE_MAXIMUM;   // volts
    int report_interval = DEFAULT_REPORT_INTERVAL;                      // seconds
};

/**
 * @brief Checks min < max, report_interval > 0 and threshold in [0,100]
 * @param reason Filled with a description of the first violation, may be null
 */
bool validateSettings(const RuntimeSettings& settings, std::string* reason = nullptr);

/**
 * @brief Single guarded copy of the runtime settings
 *
 * Readers always receive a complete copy taken under the lock, so a reader
 * never observes a half applied update. Every successful setter writes the
 * new values to the settings file when a path was given; the file write
 * happens outside the snapshot lock.
 */
class SettingsStore {
public:
    explicit SettingsStore(const RuntimeSettings& initial, std::string path = std::string());

    RuntimeSettings snapshot() const;

    bool setBatteryWarningThreshold(int percent);
    bool setBatteryVoltageMinimum(double volts);
    bool setBatteryVoltageMaximum(double volts);
    bool setReportInterval(int seconds);

    /**
     * @brief Merge the persisted settings file over the current values
     *
     * A missing file is created with the current values. A file whose
     * merged values break the invariants is ignored.
     * @return false when the file exists but could not be used
     */
    bool load();
    bool save() const;

    const std::string& path() const { return path_; }

private:
    mutable std::mutex mutex_;
    mutable std::mutex file_mutex_;
    RuntimeSettings settings_;
    std::string path_;

    bool update(const std::function<void(RuntimeSettings&)>& mutate);
    bool persist(const RuntimeSettings& settings) const;
};

#endif // SETTINGS_STORE_HPP
