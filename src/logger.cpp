/**
 * @file logger.cpp
 * @brief syslog backed logging
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unistd.h>

bool Logger::open_ = false;
LoggingConfig Logger::config_;
std::string Logger::ident_;

void Logger::open(const std::string& ident, const LoggingConfig& config) {
    close();

    config_ = config;
    ident_ = ident;

    if (!config_.enable_syslog) {
        // stderr only, logMessage writes it directly
        return;
    }

    int options = LOG_PID | LOG_CONS;
    if (config_.console) {
        options |= LOG_PERROR;
    }

    // openlog keeps the pointer, ident_ outlives the connection
    openlog(ident_.c_str(), options, LOG_DAEMON);
    setlogmask(LOG_UPTO(config_.level));
    open_ = true;
}

void Logger::close() {
    if (open_) {
        closelog();
        open_ = false;
    }
    config_.console = false;
}

bool Logger::enabled(int priority) {
    return (open_ || config_.console) && priority <= config_.level;
}

bool Logger::syslogOpen() {
    return open_;
}

const std::string& Logger::ident() {
    return ident_;
}

int Logger::parseLevel(const std::string& name, int fallback) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LOG_DEBUG;
    if (lower == "info") return LOG_INFO;
    if (lower == "notice") return LOG_NOTICE;
    if (lower == "warning" || lower == "warn") return LOG_WARNING;
    if (lower == "error" || lower == "err") return LOG_ERR;
    if (lower == "critical" || lower == "crit") return LOG_CRIT;
    return fallback;
}

const char* Logger::levelName(int priority) {
    switch (priority) {
        case LOG_DEBUG: return "debug";
        case LOG_INFO: return "info";
        case LOG_NOTICE: return "notice";
        case LOG_WARNING: return "warning";
        case LOG_ERR: return "error";
        case LOG_CRIT: return "critical";
        default: return "unknown";
    }
}

void logMessage(int priority, const std::string& message) {
    if (!Logger::enabled(priority)) {
        return;
    }
    if (Logger::syslogOpen()) {
        // LOG_PERROR covers the console copy
        syslog(priority, "%s", message.c_str());
    } else {
        std::fprintf(stderr, "%s[%d]: %s: %s\n", Logger::ident().c_str(), static_cast<int>(getpid()),
                     Logger::levelName(priority), message.c_str());
    }
}
