/**
 * @file cpu_status.cpp
 * @brief CPU temperature and throttle flag readers
 */

#include "cpu_status.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <unistd.h>
#include <utility>

namespace {

const char* const VCGENCMD_PATHS[] = {"/usr/bin/vcgencmd", "/opt/vc/bin/vcgencmd"};

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

double roundTo(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace

CpuStatus::CpuStatus()
    : CpuStatus({"/sys/class/thermal/thermal_zone0/temp",
                 "/sys/devices/virtual/thermal/thermal_zone0/temp"},
                {"/sys/devices/platform/soc/soc:firmware/get_throttled",
                 "/sys/devices/platform/scb/soc:firmware/get_throttled",
                 "/sys/firmware/devicetree/base/soc/get_throttled"},
                true) {
}

CpuStatus::CpuStatus(std::vector<std::string> temperature_paths,
                     std::vector<std::string> throttle_paths,
                     bool use_vcgencmd)
    : temperature_paths_(std::move(temperature_paths)),
      throttle_paths_(std::move(throttle_paths)),
      use_vcgencmd_(use_vcgencmd) {
}

std::optional<int> CpuStatus::readSysfsInt(const std::string& path, int base) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string text;
    std::getline(file, text);
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const long value = std::strtol(text.c_str(), &end, base);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<double> CpuStatus::readSysfsDouble(const std::string& path, double scale) {
    auto value = readSysfsInt(path);
    if (value.has_value()) {
        return static_cast<double>(value.value()) * scale;
    }
    return std::nullopt;
}

std::optional<std::string> CpuStatus::runVcgencmd(const std::string& argument) {
    for (const char* binary : VCGENCMD_PATHS) {
        if (access(binary, X_OK) != 0) {
            continue;
        }

        const std::string command = std::string(binary) + " " + argument + " 2>/dev/null";
        FILE* pipe = popen(command.c_str(), "r");
        if (pipe == nullptr) {
            continue;
        }

        std::string output;
        char buf[128];
        while (std::fgets(buf, sizeof(buf), pipe) != nullptr) {
            output += buf;
        }
        if (pclose(pipe) != 0) {
            continue;
        }

        // Output is "key=value"
        const auto eq = output.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        return trim(output.substr(eq + 1));
    }
    return std::nullopt;
}

std::optional<double> CpuStatus::readTemperature() const {
    for (const auto& path : temperature_paths_) {
        auto celsius = readSysfsDouble(path, 0.001);
        if (celsius.has_value()) {
            return roundTo(celsius.value(), 2);
        }
    }

    if (use_vcgencmd_) {
        // temp=48.3'C
        auto value = runVcgencmd("measure_temp");
        if (value.has_value()) {
            char* end = nullptr;
            const double celsius = std::strtod(value->c_str(), &end);
            if (end != value->c_str()) {
                return roundTo(celsius, 2);
            }
        }
    }
    return std::nullopt;
}

std::optional<int> CpuStatus::readThrottleState() const {
    for (const auto& path : throttle_paths_) {
        auto mask = readSysfsInt(path, 16);
        if (mask.has_value()) {
            return mask;
        }
    }

    if (use_vcgencmd_) {
        // throttled=0x50005
        auto value = runVcgencmd("get_throttled");
        if (value.has_value()) {
            errno = 0;
            char* end = nullptr;
            const long mask = std::strtol(value->c_str(), &end, 16);
            if (errno == 0 && end != value->c_str() && *end == '\0') {
                return static_cast<int>(mask);
            }
        }
    }
    return std::nullopt;
}

std::string CpuStatus::describeThrottleState(int mask) {
    static const struct {
        int bit;
        const char* text;
    } flags[] = {
        {THROTTLE_UNDER_VOLTAGE_BIT, "Under-voltage now"},
        {THROTTLE_FREQ_CAPPED_BIT, "Frequency capped now"},
        {THROTTLE_THROTTLED_BIT, "Throttled now"},
        {THROTTLE_SOFT_TEMP_LIMIT_BIT, "Soft temp limit now"},
        {THROTTLE_UNDER_VOLTAGE_BIT + 16, "Under-voltage occurred"},
        {THROTTLE_FREQ_CAPPED_BIT + 16, "Frequency capped occurred"},
        {THROTTLE_THROTTLED_BIT + 16, "Throttling occurred"},
        {THROTTLE_SOFT_TEMP_LIMIT_BIT + 16, "Soft temp limit occurred"},
    };

    std::string text;
    for (const auto& flag : flags) {
        if (mask & (1 << flag.bit)) {
            if (!text.empty()) {
                text += ", ";
            }
            text += flag.text;
        }
    }
    return text.empty() ? "OK" : text;
}
