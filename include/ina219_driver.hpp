#ifndef INA219_DRIVER_HPP
#define INA219_DRIVER_HPP

/**
 * @file ina219_driver.hpp
 * @brief Linux i2c-dev driver for the INA219 current/power monitor
 */

#include <cstdint>
#include <string>

/**
 * @brief INA219 register level driver
 *
 * Programs the calibration register from the shunt value and the expected
 * maximum current, then reads bus voltage, current and power. All reads
 * throw SensorError on I/O failure. A math overflow is not an error: the
 * bus voltage stays valid and currentOverflow() reports it.
 */
class Ina219Driver {
public:
    Ina219Driver(const std::string& i2c_bus, uint8_t i2c_addr,
                 double shunt_ohms, double max_expected_amps);
    ~Ina219Driver();

    Ina219Driver(const Ina219Driver&) = delete;
    Ina219Driver& operator=(const Ina219Driver&) = delete;

    bool initialize();

    double readBusVoltage();    // V
    double readCurrent();       // A
    double readPower();         // W

    /** @brief OVF flag from the last readBusVoltage() */
    bool currentOverflow() const { return overflow_; }
    double maxExpectedAmps() const { return max_expected_amps_; }

    /**
     * @brief Smallest PGA range (mV) that covers max_amps * shunt_ohms, 0 if none does
     */
    static int selectShuntRangeMv(double shunt_ohms, double max_expected_amps);

private:
    static constexpr uint8_t REG_CONFIG = 0x00;
    static constexpr uint8_t REG_BUS_VOLTAGE = 0x02;
    static constexpr uint8_t REG_POWER = 0x03;
    static constexpr uint8_t REG_CURRENT = 0x04;
    static constexpr uint8_t REG_CALIBRATION = 0x05;

    std::string i2c_bus_;
    uint8_t i2c_addr_;
    double shunt_ohms_;
    double max_expected_amps_;
    int fd_;
    double current_lsb_;
    double power_lsb_;
    uint16_t calibration_;
    bool overflow_;

    void writeRegister(uint8_t reg, uint16_t value);
    uint16_t readRegister(uint8_t reg);
    void configure();
};

#endif // INA219_DRIVER_HPP
