/**
 * @file system_actions.cpp
 * @brief Host power actions
 */

#include "system_actions.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <sstream>
#include <sys/wait.h>
#include <utility>

ShellSystemActions::ShellSystemActions(const SystemConfig& config) : config_(config) {
}

bool ShellSystemActions::runCommand(const std::string& command, const char* what) {
    if (command.empty()) {
        logMessage(LOG_ERR, std::string("No ") + what + " command configured");
        return false;
    }

    logMessage(LOG_INFO, std::string("Executing system ") + what + ": " + command);
    const int result = std::system(command.c_str());
    if (result == -1) {
        logMessage(LOG_ERR, std::string("Unable to start ") + what + " command");
        return false;
    }
    if (!WIFEXITED(result) || WEXITSTATUS(result) != 0) {
        std::ostringstream oss;
        oss << what << " command returned non-zero exit code "
            << (WIFEXITED(result) ? WEXITSTATUS(result) : result);
        logMessage(LOG_WARNING, oss.str());
        return false;
    }
    return true;
}

bool ShellSystemActions::shutdown() {
    return runCommand(config_.shutdown_command, "shutdown");
}

bool ShellSystemActions::restart() {
    return runCommand(config_.restart_command, "restart");
}

void ShellSystemActions::broadcast(const std::string& message) {
    if (!config_.wall_message) {
        return;
    }

    // Single quotes keep the message literal for the shell
    std::string quoted;
    for (char c : message) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    const std::string command = "echo '" + quoted + "' | wall";
    const int result = std::system(command.c_str());
    if (result != 0) {
        logMessage(LOG_WARNING, "Failed to send wall message");
    }
}

PowerControl::PowerControl(SystemActions& actions)
    : actions_(actions), shutdown_issued_(false), restart_issued_(false) {
}

void PowerControl::setBeforeAction(std::function<void()> hook) {
    before_action_ = std::move(hook);
}

void PowerControl::setActionFailed(std::function<void()> hook) {
    action_failed_ = std::move(hook);
}

bool PowerControl::requestShutdown(const std::string& reason) {
    if (shutdown_issued_.exchange(true)) {
        logMessage(LOG_DEBUG, "Shutdown already in progress, ignoring: " + reason);
        return false;
    }

    logMessage(LOG_WARNING, "System shutdown requested: " + reason);
    if (before_action_) {
        before_action_();
    }
    if (!actions_.shutdown()) {
        logMessage(LOG_ERR, "System shutdown failed, not retrying");
        if (action_failed_) {
            action_failed_();
        }
    }
    return true;
}

bool PowerControl::requestRestart(const std::string& reason) {
    if (restart_issued_.exchange(true)) {
        logMessage(LOG_DEBUG, "Restart already in progress, ignoring: " + reason);
        return false;
    }

    logMessage(LOG_WARNING, "System restart requested: " + reason);
    if (before_action_) {
        before_action_();
    }
    if (!actions_.restart()) {
        logMessage(LOG_ERR, "System restart failed, not retrying");
        if (action_failed_) {
            action_failed_();
        }
    }
    return true;
}
