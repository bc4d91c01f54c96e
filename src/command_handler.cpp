/**
 * @file command_handler.cpp
 * @brief Command topic handling
 */

#include "command_handler.hpp"
#include "logger.hpp"
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace {

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

CommandHandler::CommandHandler(const MonitorConfig& config, SettingsStore& settings,
                               PowerControl& power)
    : prefix_(config.commandPrefix()), settings_(settings), power_(power) {
}

void CommandHandler::setReportIntervalListener(std::function<void()> listener) {
    report_interval_listener_ = std::move(listener);
}

CommandType CommandHandler::parseCommand(const std::string& suffix) {
    if (suffix == "battery_warning_threshold") return CommandType::BatteryWarningThreshold;
    if (suffix == "battery_voltage_minimum") return CommandType::BatteryVoltageMinimum;
    if (suffix == "battery_voltage_maximum") return CommandType::BatteryVoltageMaximum;
    if (suffix == "report_interval") return CommandType::ReportInterval;
    if (suffix == "restart") return CommandType::Restart;
    if (suffix == "shutdown") return CommandType::Shutdown;
    return CommandType::Unknown;
}

const char* CommandHandler::commandName(CommandType type) {
    switch (type) {
        case CommandType::BatteryWarningThreshold: return "battery_warning_threshold";
        case CommandType::BatteryVoltageMinimum: return "battery_voltage_minimum";
        case CommandType::BatteryVoltageMaximum: return "battery_voltage_maximum";
        case CommandType::ReportInterval: return "report_interval";
        case CommandType::Restart: return "restart";
        case CommandType::Shutdown: return "shutdown";
        case CommandType::Unknown: break;
    }
    return "unknown";
}

std::optional<double> CommandHandler::parseNumber(const std::string& payload) {
    const std::string text = trim(payload);
    if (text.empty()) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> CommandHandler::parseInteger(const std::string& payload) {
    auto value = parseNumber(payload);
    if (!value.has_value()) {
        return std::nullopt;
    }
    if (std::floor(value.value()) != value.value() ||
        value.value() < static_cast<double>(INT_MIN) ||
        value.value() > static_cast<double>(INT_MAX)) {
        return std::nullopt;
    }
    return static_cast<int>(value.value());
}

std::optional<CommandMessage> CommandHandler::decode(const std::string& topic,
                                                     const std::string& payload) const {
    if (topic.size() <= prefix_.size() || topic.compare(0, prefix_.size(), prefix_) != 0) {
        return std::nullopt;
    }
    CommandMessage message;
    message.topic_suffix = topic.substr(prefix_.size());
    message.payload = payload;
    return message;
}

bool CommandHandler::handleMessage(const std::string& topic, const std::string& payload) {
    auto message = decode(topic, payload);
    if (!message.has_value()) {
        logMessage(LOG_DEBUG, "Ignoring message on unrelated topic " + topic);
        return false;
    }
    return handle(message.value());
}

bool CommandHandler::handle(const CommandMessage& message) {
    const CommandType type = parseCommand(message.topic_suffix);

    switch (type) {
        case CommandType::BatteryWarningThreshold:
            return applyThreshold(message);
        case CommandType::BatteryVoltageMinimum:
            return applyVoltageMinimum(message);
        case CommandType::BatteryVoltageMaximum:
            return applyVoltageMaximum(message);
        case CommandType::ReportInterval:
            return applyReportInterval(message);
        case CommandType::Restart:
            logMessage(LOG_INFO, "Restart button has been pressed");
            return power_.requestRestart("restart command received");
        case CommandType::Shutdown:
            logMessage(LOG_INFO, "Shutdown button has been pressed");
            return power_.requestShutdown("shutdown command received");
        case CommandType::Unknown:
            break;
    }

    logMessage(LOG_DEBUG, "Ignoring unknown command '" + message.topic_suffix + "'");
    return false;
}

void CommandHandler::reject(const CommandMessage& message, const std::string& reason) {
    logMessage(LOG_WARNING, "Rejected " + message.topic_suffix + " payload '" +
                                message.payload + "': " + reason);
}

bool CommandHandler::applyThreshold(const CommandMessage& message) {
    auto percent = parseInteger(message.payload);
    if (!percent.has_value()) {
        reject(message, "not an integer");
        return false;
    }
    if (!settings_.setBatteryWarningThreshold(percent.value())) {
        reject(message, "must be within [0,100]");
        return false;
    }

    std::ostringstream oss;
    oss << "Battery warning threshold changed to " << percent.value() << "%";
    logMessage(LOG_INFO, oss.str());
    return true;
}

bool CommandHandler::applyVoltageMinimum(const CommandMessage& message) {
    auto volts = parseNumber(message.payload);
    if (!volts.has_value()) {
        reject(message, "not a number");
        return false;
    }
    if (!settings_.setBatteryVoltageMinimum(volts.value())) {
        std::ostringstream oss;
        oss << "must be below battery_voltage_maximum "
            << settings_.snapshot().battery_voltage_maximum << "V";
        reject(message, oss.str());
        return false;
    }

    std::ostringstream oss;
    oss << "Battery voltage minimum changed to " << volts.value() << "V";
    logMessage(LOG_INFO, oss.str());
    return true;
}

bool CommandHandler::applyVoltageMaximum(const CommandMessage& message) {
    auto volts = parseNumber(message.payload);
    if (!volts.has_value()) {
        reject(message, "not a number");
        return false;
    }
    if (!settings_.setBatteryVoltageMaximum(volts.value())) {
        std::ostringstream oss;
        oss << "must be above battery_voltage_minimum "
            << settings_.snapshot().battery_voltage_minimum << "V";
        reject(message, oss.str());
        return false;
    }

    std::ostringstream oss;
    oss << "Battery voltage maximum changed to " << volts.value() << "V";
    logMessage(LOG_INFO, oss.str());
    return true;
}

bool CommandHandler::applyReportInterval(const CommandMessage& message) {
    auto seconds = parseInteger(message.payload);
    if (!seconds.has_value()) {
        reject(message, "not an integer");
        return false;
    }
    if (!settings_.setReportInterval(seconds.value())) {
        reject(message, "must be positive");
        return false;
    }

    std::ostringstream oss;
    oss << "Report interval changed to " << seconds.value() << " s";
    logMessage(LOG_INFO, oss.str());

    if (report_interval_listener_) {
        report_interval_listener_();
    }
    return true;
}
