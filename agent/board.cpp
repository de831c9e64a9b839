#include "board.h"
#include "config_manager.h"
#include "errors.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

Board::Board(const ConfigManager& config)
    : config_(config)
    , settings_(nlohmann::json::object())
    , mobile_(false)
    , location_(nlohmann::json::object())
    , extra_(nlohmann::json::object()) {
}

Board::~Board() {
}

void Board::load() {
    nlohmann::json settings = config_.loadBoardSettings();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    applySettingsLocked(settings);
    selectEndpointLocked();
}

void Board::replaceSettings(const nlohmann::json& settings) {
    if (!settings.is_object() || !settings.contains("iotronic") || !settings["iotronic"].is_object()) {
        throw ConfigurationError("Board settings must contain an \"iotronic\" object");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    config_.saveBoardSettings(settings);

    // Reload from the persisted copy so memory never diverges from disk.
    applySettingsLocked(config_.loadBoardSettings());
    selectEndpointLocked();
}

void Board::applySettingsLocked(const nlohmann::json& settings) {
    try {
        nlohmann::json board = settings["iotronic"].value("board", nlohmann::json::object());

        uuid_ = board.value("uuid", std::string());
        code_ = board.value("code", std::string());
        name_ = board.value("name", std::string());
        status_ = board.value("status", std::string());
        type_ = board.value("type", std::string());
        mobile_ = board.value("mobile", false);
        agent_ = board.value("agent", std::string());
        created_at_ = board.value("created_at", std::string());
        updated_at_ = board.value("updated_at", std::string());
        location_ = board.value("location", nlohmann::json::object());
        extra_ = board.value("extra", nlohmann::json::object());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Malformed board settings: ") + e.what());
    }

    settings_ = settings;

    spdlog::info("[Board] Board settings:");
    spdlog::info("[Board]  - code: {}", code_);
    spdlog::info("[Board]  - uuid: {}", uuid_);

    if (code_ == kRegistrationToken) {
        spdlog::info("[Board] FIRST BOOT procedure started");
        status_ = kStatusFirstBoot;
    }
}

void Board::selectEndpointLocked() {
    endpoint_.reset();
    endpoint_kind_.clear();

    nlohmann::json wamp = settings_["iotronic"].value("wamp", nlohmann::json::object());

    if (auto primary = parseEndpoint(wamp, "main-agent")) {
        endpoint_ = primary;
        endpoint_kind_ = "main-agent";
    } else if (status_.empty() || status_ == kStatusRegistered || status_ == kStatusFirstBoot) {
        auto registration = parseEndpoint(wamp, "registration-agent");
        if (!registration) {
            throw ConfigurationError("No registration-agent endpoint in settings.json");
        }
        endpoint_ = registration;
        endpoint_kind_ = "registration-agent";
    } else {
        spdlog::error("[Board] Control-plane endpoint configuration is wrong for status '{}'... please check settings.json",
                      status_);

        status_ = kStatusFirstBoot;
        boardSectionLocked()["status"] = status_;
        try {
            persistLocked();
        } catch (const PersistenceError& e) {
            spdlog::error("[Board] Failed to persist forced first_boot status: {}", e.what());
        }

        throw ConfigurationError("No usable control-plane endpoint: main-agent is missing and board is not registered");
    }

    spdlog::info("[Board] Selected {} endpoint:", endpoint_kind_);
    spdlog::info("[Board]  - agent: {}", agent_);
    spdlog::info("[Board]  - url: {}", endpoint_->url);
    spdlog::info("[Board]  - realm: {}", endpoint_->realm);
}

std::optional<ControlPlaneEndpoint> Board::parseEndpoint(const nlohmann::json& wamp, const char* key) {
    auto it = wamp.find(key);
    if (it == wamp.end() || !it->is_object()) {
        return std::nullopt;
    }

    ControlPlaneEndpoint endpoint;
    endpoint.url = it->value("url", std::string());
    endpoint.realm = it->value("realm", std::string());
    return endpoint;
}

void Board::updateStatus(const std::string& status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    spdlog::info("[Board] Status {} -> {}", status_, status);
    status_ = status;
    boardSectionLocked()["status"] = status;
    persistLocked();
}

void Board::touchUpdatedTime() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    updated_at_ = currentTimestamp();
    boardSectionLocked()["updated_at"] = updated_at_;
    persistLocked();
}

nlohmann::json& Board::boardSectionLocked() {
    nlohmann::json& iotronic = settings_["iotronic"];
    if (!iotronic.contains("board") || !iotronic["board"].is_object()) {
        iotronic["board"] = nlohmann::json::object();
    }
    return iotronic["board"];
}

void Board::persistLocked() {
    config_.saveBoardSettings(settings_);
}

std::string Board::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
    return out.str();
}

std::string Board::uuid() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return uuid_;
}

std::string Board::code() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return code_;
}

std::string Board::name() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return name_;
}

std::string Board::status() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return status_;
}

std::string Board::type() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return type_;
}

bool Board::mobile() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return mobile_;
}

std::string Board::agent() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return agent_;
}

std::string Board::createdAt() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return created_at_;
}

std::string Board::updatedAt() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return updated_at_;
}

nlohmann::json Board::location() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return location_;
}

nlohmann::json Board::extra() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return extra_;
}

bool Board::isFirstBoot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return status_ == kStatusFirstBoot;
}

std::string Board::sessionId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return session_id_;
}

void Board::setSessionId(const std::string& session_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    session_id_ = session_id;
}

std::optional<ControlPlaneEndpoint> Board::selectedEndpoint() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return endpoint_;
}

std::string Board::selectedEndpointKind() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return endpoint_kind_;
}

ControlPlaneEndpoint Board::requireEndpoint() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (!endpoint_ || endpoint_->url.empty() || endpoint_->realm.empty()) {
        throw ConfigurationError("Control-plane configuration not available");
    }
    return *endpoint_;
}

nlohmann::json Board::toJson() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    nlohmann::json board;
    board["uuid"] = uuid_;
    board["code"] = code_;
    board["name"] = name_;
    board["type"] = type_;
    board["status"] = status_;
    board["mobile"] = mobile_;
    board["agent"] = agent_;
    board["created_at"] = created_at_;
    board["updated_at"] = updated_at_;
    board["location"] = location_;
    board["extra"] = extra_;
    return board;
}
