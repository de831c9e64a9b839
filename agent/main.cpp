#include "agent.h"
#include "config_manager.h"
#include "logging.h"
#include "version.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <spdlog/spdlog.h>
#include <thread>

std::atomic<bool> shutdown_requested(false);

void signalHandler(int) {
    shutdown_requested = true;
}

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config PATH] [--log-level LEVEL] [--version]\n"
              << "\n"
              << "  --config PATH       agent configuration (default " << ConfigManager::kDefaultConfigPath << ")\n"
              << "  --log-level LEVEL   trace, debug, info, warn, error or critical\n"
              << "  --version           print the version and exit\n";
}

}

int main(int argc, char** argv) {
    std::string config_path = ConfigManager::kDefaultConfigPath;
    std::string log_level;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "lightning-rod " << kAgentVersion << std::endl;
            return 0;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    // Set up signal handlers for graceful shutdown
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        auto config = std::make_unique<ConfigManager>(config_path);

        LoggingSettings logging;
        logging.level = resolveLogLevel(log_level, config->getLogLevel());
        logging.file = config->getLogFile();
        initializeLogging(logging);

        spdlog::info("Lightning Rod {} starting...", kAgentVersion);
        spdlog::info("Using config: {}", config_path);

        // Create and start the agent
        Agent agent(std::move(config));
        agent.start();

        // Main loop - wait for shutdown signal
        while (!shutdown_requested && agent.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        spdlog::info("Shutting down agent...");
        agent.stop();

        spdlog::info("Lightning Rod stopped successfully");
        shutdownLogging();
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("[FATAL] {}", e.what());
        shutdownLogging();
        return 1;
    }
}
