#ifndef SENSOR_READER_HPP
#define SENSOR_READER_HPP

/**
 * @file sensor_reader.hpp
 * @brief Sensor access used by the monitor loop
 */

#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief One sample of the battery power monitor
 */
struct PowerReading {
    double voltage = 0.0;   // V, battery bus voltage
    double current = 0.0;   // A, positive while discharging
    double power = 0.0;     // W
    bool overflow = false;  // current out of range, current holds the range limit
};

/**
 * @brief Raised for a failed sensor read. Treated as transient by callers.
 */
class SensorError : public std::runtime_error {
public:
    explicit SensorError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Abstract sensor source
 *
 * readPower() throws SensorError on I/O failure. CPU values are optional
 * because not every board exposes them.
 */
class SensorReader {
public:
    virtual ~SensorReader() = default;

    virtual bool initialize() { return true; }

    virtual PowerReading readPower() = 0;
    virtual std::optional<double> readTemperature() = 0;
    virtual std::optional<int> readThrottleState() = 0;
};

#endif // SENSOR_READER_HPP
