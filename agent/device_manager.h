#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "device.h"
#include "rpc.h"

class Board;
class MetricsCollector;
class SessionManager;

class DeviceManager {
public:
    DeviceManager(Board& board, SessionManager& session, MetricsCollector& metrics,
                  const DeviceRegistry& registry = DeviceRegistry());
    ~DeviceManager();

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

    void start();
    void stop();

    Device& device() { return *device_; }

    // "<hostname> @ <local timestamp>"
    std::string ping() const;

    std::vector<rpc::Capability> capabilities();

private:
    Board& board_;
    SessionManager& session_;
    std::unique_ptr<Device> device_;
    std::atomic<bool> running_;

    void registerRPCs();

    nlohmann::json handleDevicePing(const nlohmann::json& args);
    nlohmann::json handleDeviceInfo(const nlohmann::json& args);
    nlohmann::json handleDeviceStatus(const nlohmann::json& args);
};
