#ifndef CPU_STATUS_HPP
#define CPU_STATUS_HPP

/**
 * @file cpu_status.hpp
 * @brief CPU temperature and firmware throttle flags from sysfs or vcgencmd
 */

#include <optional>
#include <string>
#include <vector>

// get_throttled bit positions, the same bits + 16 mean "has occurred"
constexpr int THROTTLE_UNDER_VOLTAGE_BIT = 0;
constexpr int THROTTLE_FREQ_CAPPED_BIT = 1;
constexpr int THROTTLE_THROTTLED_BIT = 2;
constexpr int THROTTLE_SOFT_TEMP_LIMIT_BIT = 3;

class CpuStatus {
public:
    CpuStatus();
    CpuStatus(std::vector<std::string> temperature_paths,
              std::vector<std::string> throttle_paths,
              bool use_vcgencmd);

    /** @brief Degrees Celsius rounded to 2 decimals */
    std::optional<double> readTemperature() const;

    /** @brief Raw get_throttled bitmask */
    std::optional<int> readThrottleState() const;

    static std::optional<int> readSysfsInt(const std::string& path, int base = 10);
    static std::optional<double> readSysfsDouble(const std::string& path, double scale = 1.0);

    /** @brief "OK" or a comma separated list of active/occurred conditions */
    static std::string describeThrottleState(int mask);

private:
    std::vector<std::string> temperature_paths_;
    std::vector<std::string> throttle_paths_;
    bool use_vcgencmd_;

    static std::optional<std::string> runVcgencmd(const std::string& argument);
};

#endif // CPU_STATUS_HPP
