#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include "rpc.h"

class Board;
class ConfigManager;
class ProcessRunner;
class SessionManager;

struct ServiceInfo {
    std::string name;
    int local_port = 0;
    std::string public_url;
    pid_t pid = 0;
    std::string status;

    nlohmann::json toJson() const;
    static ServiceInfo fromJson(const nlohmann::json& j);
};

// Exposes local TCP ports through wstun tunnels to the control-plane host.
// The registry is mirrored to <home>/services.json after every change.
class ServiceManager {
public:
    static constexpr const char* kStatusRunning = "running";
    static constexpr const char* kStatusStopped = "stopped";

    ServiceManager(const ConfigManager& config, Board& board, SessionManager& session, ProcessRunner& runner);
    ~ServiceManager();

    ServiceManager(const ServiceManager&) = delete;
    ServiceManager& operator=(const ServiceManager&) = delete;

    // Loads the registry, reconciles it and advertises capabilities.
    // Registration failure is fatal.
    void start();
    void stop();

    // Throw AlreadyExistsError / NotFoundError / InvalidArgumentError /
    // ProcessError / PersistenceError.
    ServiceInfo exposeService(const std::string& name, int local_port);
    void unexposeService(const std::string& name);
    std::vector<ServiceInfo> listServices() const;

    // Respawns tunnels whose process has died.
    void reconcile();

    std::string tunnelUrl() const;
    std::string registryPath() const { return registry_path_; }
    std::chrono::milliseconds reconcileInterval() const { return reconcile_interval_; }

    std::vector<rpc::Capability> capabilities();

private:
    Board& board_;
    SessionManager& session_;
    ProcessRunner& runner_;

    std::string wstun_bin_;
    int wstun_port_;
    std::chrono::milliseconds reconcile_interval_;
    std::string registry_path_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, ServiceInfo> services_;
    std::atomic<bool> running_;

    // Private methods
    void registerRPCs();
    void loadRegistry();
    void saveRegistryLocked();
    ServiceInfo spawnTunnelLocked(const std::string& name, int local_port);
    void stopServiceLocked(const std::string& name);

    nlohmann::json handleExposeService(const nlohmann::json& args);
    nlohmann::json handleUnexposeService(const nlohmann::json& args);
    nlohmann::json handleServicesList(const nlohmann::json& args);
};
