#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <nlohmann/json.hpp>

class ConfigManager;

struct ControlPlaneEndpoint {
    std::string url;
    std::string realm;
};

// Board identity, status and control-plane endpoint selection, backed by the
// settings document. Every mutation is written through to disk before the
// call returns.
class Board {
public:
    static constexpr const char* kRegistrationToken = "<REGISTRATION-TOKEN>";

    static constexpr const char* kStatusFirstBoot = "first_boot";
    static constexpr const char* kStatusRegistered = "registered";
    static constexpr const char* kStatusOnline = "online";
    static constexpr const char* kStatusError = "error";

    explicit Board(const ConfigManager& config);
    ~Board();

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    // Reads settings.json and recomputes the selected endpoint. Throws
    // ConfigurationError when no endpoint is usable; in that case status has
    // already been forced to first_boot.
    void load();

    // Write-through mutations; throw PersistenceError if the store is unwritable.
    void updateStatus(const std::string& status);
    void touchUpdatedTime();

    // Persists the new document first, then reloads from the persisted copy.
    void replaceSettings(const nlohmann::json& settings);

    // Identity
    std::string uuid() const;
    std::string code() const;
    std::string name() const;
    std::string status() const;
    std::string type() const;
    bool mobile() const;
    std::string agent() const;
    std::string createdAt() const;
    std::string updatedAt() const;
    nlohmann::json location() const;
    nlohmann::json extra() const;
    bool isFirstBoot() const;

    // Session
    std::string sessionId() const;
    void setSessionId(const std::string& session_id);

    // Endpoint selection
    std::optional<ControlPlaneEndpoint> selectedEndpoint() const;
    std::string selectedEndpointKind() const;
    ControlPlaneEndpoint requireEndpoint() const;

    nlohmann::json toJson() const;

    // Local time with microseconds, the format used for created_at/updated_at
    static std::string currentTimestamp();

private:
    const ConfigManager& config_;
    mutable std::shared_mutex mutex_;

    nlohmann::json settings_;

    std::string uuid_;
    std::string code_;
    std::string name_;
    std::string status_;
    std::string type_;
    bool mobile_;
    std::string agent_;
    std::string created_at_;
    std::string updated_at_;
    nlohmann::json location_;
    nlohmann::json extra_;

    std::string session_id_;

    std::optional<ControlPlaneEndpoint> endpoint_;
    std::string endpoint_kind_;

    // Private methods
    void applySettingsLocked(const nlohmann::json& settings);
    void selectEndpointLocked();
    void persistLocked();
    nlohmann::json& boardSectionLocked();
    static std::optional<ControlPlaneEndpoint> parseEndpoint(const nlohmann::json& wamp, const char* key);
};
