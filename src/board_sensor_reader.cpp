/**
 * @file board_sensor_reader.cpp
 * @brief Battery HAT sensor access
 */

#include "board_sensor_reader.hpp"

BoardSensorReader::BoardSensorReader(const SensorConfig& config)
    : driver_(std::make_unique<Ina219Driver>(config.i2c_bus, config.i2c_addr,
                                             config.shunt_ohms, config.max_expected_amps)) {
}

bool BoardSensorReader::initialize() {
    return driver_->initialize();
}

PowerReading BoardSensorReader::readPower() {
    PowerReading reading;
    reading.voltage = driver_->readBusVoltage();
    if (driver_->currentOverflow()) {
        // Current and power registers are meaningless, report the range limit
        reading.overflow = true;
        reading.current = driver_->maxExpectedAmps();
        reading.power = reading.voltage * reading.current;
        return reading;
    }
    reading.current = driver_->readCurrent();
    reading.power = driver_->readPower();
    return reading;
}

std::optional<double> BoardSensorReader::readTemperature() {
    return cpu_.readTemperature();
}

std::optional<int> BoardSensorReader::readThrottleState() {
    return cpu_.readThrottleState();
}
