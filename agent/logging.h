#pragma once

#include <string>

struct LoggingSettings {
    std::string level = "info";
    std::string file;     // empty: console only
    std::string pattern;  // empty: default pattern
};

// Installs the process-wide spdlog logger. Safe to call again after a
// configuration reload; the previous default logger is replaced.
void initializeLogging(const LoggingSettings& settings);
void shutdownLogging();

// Level precedence: explicit override, then LIGHTNINGROD_LOG_LEVEL, then config.
std::string resolveLogLevel(const std::string& override_level, const std::string& configured_level);
