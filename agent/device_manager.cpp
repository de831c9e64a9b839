#include "device_manager.h"
#include "board.h"
#include "metrics_collector.h"
#include "session_manager.h"
#include <spdlog/spdlog.h>

DeviceManager::DeviceManager(Board& board, SessionManager& session, MetricsCollector& metrics,
                             const DeviceRegistry& registry)
    : board_(board)
    , session_(session)
    , device_(registry.create(board.type(), metrics))
    , running_(false) {

    spdlog::info("[DeviceManager] Device Manager initialized for type: {}", device_->identify());
}

DeviceManager::~DeviceManager() {
    running_ = false;
}

void DeviceManager::start() {
    spdlog::info("[DeviceManager] Starting Device Manager...");

    running_ = true;
    session_.addConnectListener([this](const std::string&) {
        if (running_) {
            registerRPCs();
        }
    });
    registerRPCs();

    spdlog::info("[DeviceManager] Device Manager started successfully");
}

void DeviceManager::stop() {
    if (running_.exchange(false)) {
        spdlog::info("[DeviceManager] Stopping Device Manager...");
    }
}

std::string DeviceManager::ping() const {
    return hostName() + " @ " + Board::currentTimestamp();
}

std::vector<rpc::Capability> DeviceManager::capabilities() {
    return {
        {"DevicePing", [this](const nlohmann::json& args) { return handleDevicePing(args); }},
        {"DeviceInfo", [this](const nlohmann::json& args) { return handleDeviceInfo(args); }},
        {"DeviceStatus", [this](const nlohmann::json& args) { return handleDeviceStatus(args); }}
    };
}

void DeviceManager::registerRPCs() {
    session_.advertise(capabilities());
}

nlohmann::json DeviceManager::handleDevicePing(const nlohmann::json&) {
    spdlog::info("[DeviceManager] RPC DevicePing called");
    return rpc::guard("DevicePing", [&]() {
        return rpc::success(ping());
    });
}

nlohmann::json DeviceManager::handleDeviceInfo(const nlohmann::json&) {
    spdlog::info("[DeviceManager] RPC DeviceInfo called");
    return rpc::guard("DeviceInfo", [&]() {
        nlohmann::json info = device_->describe();
        info["uuid"] = board_.uuid();
        info["name"] = board_.name();
        return rpc::success("Device info retrieved", info);
    });
}

nlohmann::json DeviceManager::handleDeviceStatus(const nlohmann::json&) {
    spdlog::info("[DeviceManager] RPC DeviceStatus called");
    return rpc::guard("DeviceStatus", [&]() {
        return rpc::success("Device status retrieved", device_->healthCheck());
    });
}
