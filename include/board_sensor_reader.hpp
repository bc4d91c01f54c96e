#ifndef BOARD_SENSOR_READER_HPP
#define BOARD_SENSOR_READER_HPP

/**
 * @file board_sensor_reader.hpp
 * @brief SensorReader for the battery HAT: INA219 plus CPU status files
 */

#include "config_parser.hpp"
#include "cpu_status.hpp"
#include "ina219_driver.hpp"
#include "sensor_reader.hpp"
#include <memory>

class BoardSensorReader : public SensorReader {
public:
    explicit BoardSensorReader(const SensorConfig& config);

    bool initialize() override;

    PowerReading readPower() override;
    std::optional<double> readTemperature() override;
    std::optional<int> readThrottleState() override;

private:
    std::unique_ptr<Ina219Driver> driver_;
    CpuStatus cpu_;
};

#endif // BOARD_SENSOR_READER_HPP
