#include "config_manager.h"
#include "errors.h"
#include "json_store.h"
#include <filesystem>
#include <fstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , agent_config_(nlohmann::json::object()) {

    loadAgentConfig();
}

ConfigManager::~ConfigManager() {
}

void ConfigManager::loadAgentConfig() {
    if (!fs::exists(config_path_)) {
        spdlog::warn("[ConfigManager] Config file {} not found, using defaults", config_path_);
        agent_config_ = nlohmann::json::object();
        return;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open agent config: " + config_path_);
    }

    try {
        file >> agent_config_;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("Invalid agent config " + config_path_ + ": " + e.what());
    }

    if (!agent_config_.is_object()) {
        throw ConfigurationError("Agent config " + config_path_ + " must be a JSON object");
    }

    spdlog::info("[ConfigManager] Loaded agent config from {}", config_path_);
}

nlohmann::json ConfigManager::section(const char* name) const {
    auto it = agent_config_.find(name);
    if (it == agent_config_.end() || !it->is_object()) {
        return nlohmann::json::object();
    }
    return *it;
}

std::string ConfigManager::getHome() const {
    return section("lightningrod").value("home", std::string(kDefaultHome));
}

std::string ConfigManager::getLogLevel() const {
    return section("lightningrod").value("log_level", std::string("info"));
}

std::string ConfigManager::getLogFile() const {
    return section("lightningrod").value("log_file", std::string());
}

bool ConfigManager::skipCertVerify() const {
    return section("lightningrod").value("skip_cert_verify", true);
}

std::string ConfigManager::getCaFile() const {
    return section("lightningrod").value("ca_file", std::string());
}

std::string ConfigManager::getBoardSettingsPath() const {
    return (fs::path(getHome()) / "settings.json").string();
}

nlohmann::json ConfigManager::loadBoardSettings() const {
    std::string path = getBoardSettingsPath();
    nlohmann::json settings;
    try {
        settings = readJsonFile(path);
    } catch (const PersistenceError& e) {
        throw ConfigurationError(std::string("Failed to load board settings: ") + e.what());
    }

    if (!settings.is_object() || !settings.contains("iotronic") || !settings["iotronic"].is_object()) {
        throw ConfigurationError("Board settings " + path + " has no \"iotronic\" section");
    }
    return settings;
}

void ConfigManager::saveBoardSettings(const nlohmann::json& settings) const {
    writeJsonFile(getBoardSettingsPath(), settings);
    spdlog::debug("[ConfigManager] Saved board settings to {}", getBoardSettingsPath());
}
