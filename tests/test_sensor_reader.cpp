#include "cpu_status.hpp"
#include "ina219_driver.hpp"
#include "test_support.hpp"
#include <cstdio>
#include <fstream>
#include <sstream>
#include <unistd.h>

static std::string writeTemp(const char* name, const std::string& body) {
    std::ostringstream oss;
    oss << "/tmp/battery_monitor_" << name << "_" << getpid();
    std::ofstream file(oss.str(), std::ios::trunc);
    file << body;
    return oss.str();
}

static void test_sysfs_values() {
    const std::string temp = writeTemp("temp", "48312\n");
    const std::string throttled = writeTemp("throttled", "50005\n");

    CpuStatus cpu({"/nonexistent/thermal_zone0/temp", temp}, {throttled}, false);
    EXPECT_NEAR(cpu.readTemperature().value_or(0.0), 48.31, 1e-9);
    EXPECT_EQ_INT(cpu.readThrottleState().value_or(-1), 0x50005);

    EXPECT_EQ_INT(CpuStatus::readSysfsInt(temp).value_or(-1), 48312);
    EXPECT_NEAR(CpuStatus::readSysfsDouble(temp, 0.001).value_or(0.0), 48.312, 1e-9);

    std::remove(temp.c_str());
    std::remove(throttled.c_str());
}

static void test_missing_values() {
    const std::string garbage = writeTemp("garbage", "n/a\n");

    CpuStatus cpu({"/nonexistent/temp", garbage}, {"/nonexistent/get_throttled"}, false);
    EXPECT_FALSE(cpu.readTemperature().has_value());
    EXPECT_FALSE(cpu.readThrottleState().has_value());
    EXPECT_FALSE(CpuStatus::readSysfsInt(garbage).has_value());

    std::remove(garbage.c_str());
}

static void test_throttle_description() {
    EXPECT_EQ_STR(CpuStatus::describeThrottleState(0), "OK");
    EXPECT_EQ_STR(CpuStatus::describeThrottleState(0x1), "Under-voltage now");
    EXPECT_EQ_STR(CpuStatus::describeThrottleState(0x50000),
                  "Under-voltage occurred, Throttling occurred");
}

static void test_shunt_range() {
    // 0.05 ohm at 5.5 A drops 275 mV
    EXPECT_EQ_INT(Ina219Driver::selectShuntRangeMv(0.05, 5.5), 320);
    EXPECT_EQ_INT(Ina219Driver::selectShuntRangeMv(0.1, 0.3), 40);
    EXPECT_EQ_INT(Ina219Driver::selectShuntRangeMv(0.1, 1.0), 160);
    EXPECT_EQ_INT(Ina219Driver::selectShuntRangeMv(0.1, 5.0), 0);
}

static void test_missing_bus() {
    Ina219Driver driver("/nonexistent/i2c-9", 0x40, 0.05, 5.5);
    EXPECT_FALSE(driver.initialize());
}

int main() {
    test_sysfs_values();
    test_missing_values();
    test_throttle_description();
    test_shunt_range();
    test_missing_bus();
    return finishTests("sensor reader");
}
