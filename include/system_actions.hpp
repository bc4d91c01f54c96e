#ifndef SYSTEM_ACTIONS_HPP
#define SYSTEM_ACTIONS_HPP

/**
 * @file system_actions.hpp
 * @brief Host shutdown/restart and the guard that issues them at most once
 */

#include "config_parser.hpp"
#include <atomic>
#include <functional>
#include <string>

/**
 * @brief Operating system power actions
 *
 * The calls are fire and forget; a successful action is expected to end
 * the process (directly or through the service manager).
 */
class SystemActions {
public:
    virtual ~SystemActions() = default;

    virtual bool shutdown() = 0;
    virtual bool restart() = 0;

    /** @brief Message to all logged-in users */
    virtual void broadcast(const std::string& message) { (void)message; }
};

/**
 * @brief Runs the configured shell commands
 */
class ShellSystemActions : public SystemActions {
public:
    explicit ShellSystemActions(const SystemConfig& config);

    bool shutdown() override;
    bool restart() override;
    void broadcast(const std::string& message) override;

private:
    SystemConfig config_;

    bool runCommand(const std::string& command, const char* what);
};

/**
 * @brief Single entry point for destructive actions
 *
 * Autonomous and commanded shutdowns share one flag, so a shutdown is
 * issued at most once per process. Restart has its own flag. The flags
 * are never cleared, a failed action is logged and not retried.
 */
class PowerControl {
public:
    explicit PowerControl(SystemActions& actions);

    /** @brief Runs before the action, used to publish the offline status */
    void setBeforeAction(std::function<void()> hook);
    /** @brief Runs when the action command fails, used to restore the online status */
    void setActionFailed(std::function<void()> hook);

    /** @return true when this call issued the shutdown */
    bool requestShutdown(const std::string& reason);
    /** @return true when this call issued the restart */
    bool requestRestart(const std::string& reason);

    bool shutdownInProgress() const { return shutdown_issued_.load(); }
    bool restartInProgress() const { return restart_issued_.load(); }

    void broadcast(const std::string& message) { actions_.broadcast(message); }

private:
    SystemActions& actions_;
    std::function<void()> before_action_;
    std::function<void()> action_failed_;
    std::atomic<bool> shutdown_issued_;
    std::atomic<bool> restart_issued_;
};

#endif // SYSTEM_ACTIONS_HPP
