#pragma once

#include <string>
#include <nlohmann/json.hpp>

class ConfigManager {
public:
    static constexpr const char* kDefaultConfigPath = "/etc/iotronic/iotronic.json";
    static constexpr const char* kDefaultHome = "/var/lib/iotronic";

    // A missing config file means "all defaults"; an unreadable or malformed
    // one throws ConfigurationError.
    explicit ConfigManager(const std::string& config_path);
    ~ConfigManager();

    // Configuration access
    const nlohmann::json& getAgentConfig() const { return agent_config_; }
    const std::string& getConfigPath() const { return config_path_; }

    // Utility methods
    std::string getHome() const;
    std::string getLogLevel() const;
    std::string getLogFile() const;
    bool skipCertVerify() const;
    std::string getCaFile() const;

    // Board settings document (<home>/settings.json)
    std::string getBoardSettingsPath() const;
    nlohmann::json loadBoardSettings() const;
    void saveBoardSettings(const nlohmann::json& settings) const;

private:
    std::string config_path_;
    nlohmann::json agent_config_;

    // Private methods
    void loadAgentConfig();
    nlohmann::json section(const char* name) const;
};
