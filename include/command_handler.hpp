#ifndef COMMAND_HANDLER_HPP
#define COMMAND_HANDLER_HPP

/**
 * @file command_handler.hpp
 * @brief Applies set/<command> messages to the settings or to the host
 */

#include "config_parser.hpp"
#include "settings_store.hpp"
#include "system_actions.hpp"
#include <functional>
#include <optional>
#include <string>

enum class CommandType {
    BatteryWarningThreshold,
    BatteryVoltageMinimum,
    BatteryVoltageMaximum,
    ReportInterval,
    Restart,
    Shutdown,
    Unknown
};

struct CommandMessage {
    std::string topic_suffix;
    std::string payload;
};

class CommandHandler {
public:
    CommandHandler(const MonitorConfig& config, SettingsStore& settings, PowerControl& power);

    /** @brief Called after report_interval changed so the polling timer picks it up */
    void setReportIntervalListener(std::function<void()> listener);

    /**
     * @brief Strips the command prefix from a received topic
     * @return nullopt for topics outside <base>/<hostname>/<set>/
     */
    std::optional<CommandMessage> decode(const std::string& topic, const std::string& payload) const;

    /**
     * @brief Validates and applies one command
     * @return true when settings changed or an action was dispatched
     */
    bool handle(const CommandMessage& message);

    bool handleMessage(const std::string& topic, const std::string& payload);

    static CommandType parseCommand(const std::string& suffix);
    static const char* commandName(CommandType type);

    /** @brief Whole number, integral decimals ("30.0") accepted */
    static std::optional<int> parseInteger(const std::string& payload);
    /** @brief Finite decimal number, no trailing text */
    static std::optional<double> parseNumber(const std::string& payload);

private:
    std::string prefix_;
    SettingsStore& settings_;
    PowerControl& power_;
    std::function<void()> report_interval_listener_;

    bool applyThreshold(const CommandMessage& message);
    bool applyVoltageMinimum(const CommandMessage& message);
    bool applyVoltageMaximum(const CommandMessage& message);
    bool applyReportInterval(const CommandMessage& message);

    void reject(const CommandMessage& message, const std::string& reason);
};

#endif // COMMAND_HANDLER_HPP
