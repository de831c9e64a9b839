#include "logging.h"
#include <cstdlib>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

}

std::string resolveLogLevel(const std::string& override_level, const std::string& configured_level) {
    if (!override_level.empty()) {
        return override_level;
    }
    if (const char* level = std::getenv("LIGHTNINGROD_LOG_LEVEL")) {
        return level;
    }
    if (!configured_level.empty()) {
        return configured_level;
    }
    return "info";
}

void initializeLogging(const LoggingSettings& settings) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!settings.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(settings.file));
        } catch (const spdlog::spdlog_ex& e) {
            // Console logging still works; report and carry on.
            spdlog::error("[Logging] Cannot open log file {}: {}", settings.file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("lightning-rod", sinks.begin(), sinks.end());
    logger->set_pattern(settings.pattern.empty() ? kDefaultPattern : settings.pattern);
    logger->set_level(spdlog::level::from_str(settings.level));
    spdlog::set_default_logger(std::move(logger));
    spdlog::flush_on(spdlog::level::warn);
}

void shutdownLogging() {
    spdlog::shutdown();
}
