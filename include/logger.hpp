#ifndef LOGGER_HPP
#define LOGGER_HPP

/**
 * @file logger.hpp
 * @brief syslog backed logging shared by every daemon component
 */

#include <string>
#include <syslog.h>

/**
 * @brief Logging options taken from the static configuration
 */
struct LoggingConfig {
    bool enable_syslog = true;
    bool console = false;          // mirror messages to stderr, the only output without syslog
    int level = LOG_INFO;          // highest syslog priority that is emitted
};

/**
 * @brief Process wide syslog wrapper
 *
 * systemd captures syslog output into journald, so nothing else is needed
 * when running as a service. Console mirroring is for interactive runs.
 */
class Logger {
public:
    static void open(const std::string& ident, const LoggingConfig& config);
    static void close();

    static bool enabled(int priority);
    static bool syslogOpen();
    static const std::string& ident();

    static int parseLevel(const std::string& name, int fallback);
    static const char* levelName(int priority);

private:
    static bool open_;
    static LoggingConfig config_;
    static std::string ident_;
};

void logMessage(int priority, const std::string& message);

#endif // LOGGER_HPP
