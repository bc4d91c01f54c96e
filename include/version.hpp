#ifndef VERSION_HPP
#define VERSION_HPP

/**
 * @file version.hpp
 * @brief Daemon version, reported in logs and in the discovery device block
 */

#define BATTERY_MONITOR_VERSION "1.0.0"

#endif // VERSION_HPP
