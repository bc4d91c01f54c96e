/**
 * @file ina219_driver.cpp
 * @brief INA219 access through /dev/i2c-N
 */

#include "ina219_driver.hpp"
#include "logger.hpp"
#include "sensor_reader.hpp"
#include <cerrno>
#include <cmath>
#include <cstring>
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

// Configuration register fields (datasheet table 3)
constexpr uint16_t CONFIG_BRNG_16V = 0x0000;
constexpr uint16_t CONFIG_ADC_12BIT = 0x3;
constexpr uint16_t CONFIG_MODE_SHUNT_BUS_CONTINUOUS = 0x7;

constexpr double CALIBRATION_SCALE = 0.04096;
constexpr double BUS_VOLTAGE_LSB = 0.004;

std::string errnoText(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

Ina219Driver::Ina219Driver(const std::string& i2c_bus, uint8_t i2c_addr,
                           double shunt_ohms, double max_expected_amps)
    : i2c_bus_(i2c_bus), i2c_addr_(i2c_addr), shunt_ohms_(shunt_ohms),
      max_expected_amps_(max_expected_amps), fd_(-1), current_lsb_(0.0),
      power_lsb_(0.0), calibration_(0), overflow_(false) {
}

Ina219Driver::~Ina219Driver() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

int Ina219Driver::selectShuntRangeMv(double shunt_ohms, double max_expected_amps) {
    const double max_shunt_mv = shunt_ohms * max_expected_amps * 1000.0;
    for (int range : {40, 80, 160, 320}) {
        if (max_shunt_mv <= range) {
            return range;
        }
    }
    return 0;
}

bool Ina219Driver::initialize() {
    fd_ = ::open(i2c_bus_.c_str(), O_RDWR);
    if (fd_ < 0) {
        logMessage(LOG_ERR, errnoText("Unable to open " + i2c_bus_));
        return false;
    }

    if (ioctl(fd_, I2C_SLAVE, i2c_addr_) < 0) {
        std::ostringstream oss;
        oss << "Unable to select INA219 at 0x" << std::hex << static_cast<int>(i2c_addr_);
        logMessage(LOG_ERR, errnoText(oss.str()));
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    try {
        configure();
    } catch (const SensorError& e) {
        logMessage(LOG_ERR, std::string("INA219 configuration failed: ") + e.what());
        ::close(fd_);
        fd_ = -1;
        return false;
    }

    std::ostringstream oss;
    oss << "INA219 on " << i2c_bus_ << " calibrated: shunt=" << shunt_ohms_
        << " ohm, max=" << max_expected_amps_ << " A, cal=" << calibration_;
    logMessage(LOG_INFO, oss.str());
    return true;
}

void Ina219Driver::configure() {
    const int range_mv = selectShuntRangeMv(shunt_ohms_, max_expected_amps_);
    if (range_mv == 0) {
        throw SensorError("expected shunt voltage exceeds the 320mV PGA range");
    }

    uint16_t gain = 0;
    switch (range_mv) {
        case 40: gain = 0x0; break;
        case 80: gain = 0x1; break;
        case 160: gain = 0x2; break;
        default: gain = 0x3; break;
    }

    current_lsb_ = max_expected_amps_ / 32767.0;
    power_lsb_ = current_lsb_ * 20.0;

    const double cal = std::trunc(CALIBRATION_SCALE / (current_lsb_ * shunt_ohms_));
    calibration_ = cal > 0xFFFE ? 0xFFFE : static_cast<uint16_t>(cal);

    const uint16_t config = CONFIG_BRNG_16V |
                            static_cast<uint16_t>(gain << 11) |
                            static_cast<uint16_t>(CONFIG_ADC_12BIT << 7) |
                            static_cast<uint16_t>(CONFIG_ADC_12BIT << 3) |
                            CONFIG_MODE_SHUNT_BUS_CONTINUOUS;

    writeRegister(REG_CALIBRATION, calibration_);
    writeRegister(REG_CONFIG, config);
}

void Ina219Driver::writeRegister(uint8_t reg, uint16_t value) {
    if (fd_ < 0) {
        throw SensorError("INA219 not initialized");
    }
    uint8_t buf[3] = {reg, static_cast<uint8_t>(value >> 8), static_cast<uint8_t>(value & 0xFF)};
    if (::write(fd_, buf, sizeof(buf)) != static_cast<ssize_t>(sizeof(buf))) {
        throw SensorError(errnoText("INA219 register write failed"));
    }
}

uint16_t Ina219Driver::readRegister(uint8_t reg) {
    if (fd_ < 0) {
        throw SensorError("INA219 not initialized");
    }
    if (::write(fd_, &reg, 1) != 1) {
        throw SensorError(errnoText("INA219 register select failed"));
    }
    uint8_t buf[2] = {0, 0};
    if (::read(fd_, buf, sizeof(buf)) != static_cast<ssize_t>(sizeof(buf))) {
        throw SensorError(errnoText("INA219 register read failed"));
    }
    return static_cast<uint16_t>((buf[0] << 8) | buf[1]);
}

double Ina219Driver::readBusVoltage() {
    const uint16_t raw = readRegister(REG_BUS_VOLTAGE);
    // OVF: power or current calculation out of range
    overflow_ = (raw & 0x0001) != 0;
    return static_cast<double>(raw >> 3) * BUS_VOLTAGE_LSB;
}

double Ina219Driver::readCurrent() {
    const int16_t raw = static_cast<int16_t>(readRegister(REG_CURRENT));
    return static_cast<double>(raw) * current_lsb_;
}

double Ina219Driver::readPower() {
    return static_cast<double>(readRegister(REG_POWER)) * power_lsb_;
}
