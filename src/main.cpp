/**
 * @file main.cpp
 * @brief Entry point for the battery MQTT monitor daemon
 */

#include "board_sensor_reader.hpp"
#include "config_parser.hpp"
#include "logger.hpp"
#include "monitor_daemon.hpp"
#include "paho_broker_client.hpp"
#include "system_actions.hpp"
#include "version.hpp"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <thread>

namespace {

constexpr const char* LOG_IDENT = "battery-mqtt-monitor";

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  -c, --config <file>    YAML configuration (default: config.yaml)\n"
              << "  -s, --settings <file>  runtime settings file (default: settings.json)\n"
              << "  -v, --verbose          log debug messages to the console\n"
              << "  -h, --help             show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = "config.yaml";
    std::string settings_path = "settings.json";
    bool verbose = false;

    static const struct option long_options[] = {
        {"config", required_argument, nullptr, 'c'},
        {"settings", required_argument, nullptr, 's'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "c:s:vh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 's':
                settings_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'h':
                printUsage(argv[0]);
                return EXIT_SUCCESS;
            default:
                printUsage(argv[0]);
                return EXIT_FAILURE;
        }
    }

    MonitorConfig config;
    try {
        config = ConfigParser::loadFile(config_path);
    } catch (const ConfigError& e) {
        std::cerr << LOG_IDENT << ": " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    if (verbose) {
        config.logging.console = true;
        config.logging.level = LOG_DEBUG;
    }
    Logger::open(LOG_IDENT, config.logging);
    logMessage(LOG_INFO, std::string("Starting battery monitor ") + BATTERY_MONITOR_VERSION +
                             " with " + config_path);

    // Signals are taken synchronously by a dedicated thread, every other
    // thread inherits the blocked mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    int exit_code = EXIT_FAILURE;
    try {
        MonitorDaemon daemon(
            config, settings_path, std::make_unique<BoardSensorReader>(config.sensor),
            std::make_unique<ShellSystemActions>(config.system),
            [](const BrokerOptions& options, BrokerEventQueue& events) {
                return std::unique_ptr<BrokerClient>(
                    std::make_unique<PahoBrokerClient>(options, events));
            });

        if (!daemon.initialize()) {
            logMessage(LOG_ERR, "Failed to initialize battery monitor");
            Logger::close();
            return EXIT_FAILURE;
        }

        std::thread signal_thread([&daemon, &signals]() {
            int signal_number = 0;
            if (sigwait(&signals, &signal_number) == 0) {
                logMessage(LOG_INFO, std::string("Received ") + strsignal(signal_number) +
                                         ", shutting down");
            }
            daemon.requestStop();
        });

        try {
            exit_code = daemon.run();
        } catch (const std::exception& e) {
            logMessage(LOG_ERR, std::string("Fatal error: ") + e.what());
            exit_code = EXIT_FAILURE;
        }

        // Wake the signal thread when the daemon stopped on its own
        pthread_kill(signal_thread.native_handle(), SIGTERM);
        signal_thread.join();
    } catch (const std::exception& e) {
        logMessage(LOG_ERR, std::string("Fatal error: ") + e.what());
        exit_code = EXIT_FAILURE;
    }

    logMessage(LOG_INFO, "Battery monitor stopped");
    Logger::close();
    return exit_code;
}
