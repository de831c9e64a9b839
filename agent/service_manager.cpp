#include "service_manager.h"
#include "board.h"
#include "config_manager.h"
#include "errors.h"
#include "json_store.h"
#include "process_runner.h"
#include "session_manager.h"
#include <filesystem>
#include <mutex>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

bool isSecureScheme(const std::string& scheme) {
    return scheme == "mqtts" || scheme == "ssl" || scheme == "tls" || scheme == "wss" || scheme == "https";
}

}

nlohmann::json ServiceInfo::toJson() const {
    return {
        {"name", name},
        {"local_port", local_port},
        {"public_url", public_url},
        {"pid", pid},
        {"status", status}
    };
}

ServiceInfo ServiceInfo::fromJson(const nlohmann::json& j) {
    ServiceInfo info;
    info.name = j.at("name").get<std::string>();
    info.local_port = j.at("local_port").get<int>();
    info.public_url = j.value("public_url", "");
    info.pid = j.value("pid", 0);
    info.status = j.value("status", ServiceManager::kStatusStopped);
    return info;
}

ServiceManager::ServiceManager(const ConfigManager& config, Board& board, SessionManager& session, ProcessRunner& runner)
    : board_(board)
    , session_(session)
    , runner_(runner)
    , running_(false) {

    nlohmann::json section = config.getAgentConfig().value("services", nlohmann::json::object());
    try {
        wstun_bin_ = section.value("wstun_bin", "/usr/bin/wstun");
        wstun_port_ = section.value("wstun_port", 8080);
        reconcile_interval_ = std::chrono::milliseconds(
            static_cast<int64_t>(section.value("reconcile_interval", 60.0) * 1000));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid services settings: ") + e.what());
    }

    registry_path_ = (fs::path(config.getHome()) / "services.json").string();

    spdlog::info("[ServiceManager] WSTUN bin path: {}", wstun_bin_);
}

ServiceManager::~ServiceManager() {
    running_ = false;
}

void ServiceManager::start() {
    spdlog::info("[ServiceManager] Starting Service Manager...");

    loadRegistry();
    reconcile();

    running_ = true;
    session_.addConnectListener([this](const std::string&) {
        if (running_) {
            registerRPCs();
        }
    });
    registerRPCs();

    spdlog::info("[ServiceManager] Service Manager started successfully");
}

void ServiceManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[ServiceManager] Stopping Service Manager...");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& service : services_) {
        names.push_back(service.first);
    }

    for (const auto& name : names) {
        try {
            stopServiceLocked(name);
        } catch (const std::exception& e) {
            spdlog::error("[ServiceManager] Failed to stop service {}: {}", name, e.what());
        }
    }
}

std::string ServiceManager::tunnelUrl() const {
    std::optional<ControlPlaneEndpoint> endpoint = board_.selectedEndpoint();
    if (!endpoint) {
        throw ConfigurationError("No control-plane endpoint selected");
    }

    const std::string& url = endpoint->url;
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw ConfigurationError("Invalid control-plane URL: " + url);
    }

    std::string host = url.substr(scheme_end + 3);
    size_t path_pos = host.find('/');
    if (path_pos != std::string::npos) {
        host = host.substr(0, path_pos);
    }
    size_t colon_pos = host.find(':');
    if (colon_pos != std::string::npos) {
        host = host.substr(0, colon_pos);
    }
    if (host.empty()) {
        throw ConfigurationError("Missing host in control-plane URL: " + url);
    }

    std::string protocol = isSecureScheme(url.substr(0, scheme_end)) ? "wss" : "ws";
    return protocol + "://" + host + ":" + std::to_string(wstun_port_);
}

ServiceInfo ServiceManager::exposeService(const std::string& name, int local_port) {
    rpc::validateResourceName(name);
    if (local_port < 1 || local_port > 65535) {
        throw InvalidArgumentError("Invalid local_port: out of range");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (services_.count(name) > 0) {
        throw AlreadyExistsError("Service " + name + " already exposed");
    }

    ServiceInfo info = spawnTunnelLocked(name, local_port);
    services_[name] = info;
    saveRegistryLocked();

    spdlog::info("[ServiceManager] Service {} exposed on port {} (PID: {})", name, local_port, info.pid);
    return info;
}

void ServiceManager::unexposeService(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (services_.count(name) == 0) {
        throw NotFoundError("Service " + name + " not found");
    }
    stopServiceLocked(name);
}

std::vector<ServiceInfo> ServiceManager::listServices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<ServiceInfo> services;
    for (const auto& service : services_) {
        services.push_back(service.second);
    }
    return services;
}

void ServiceManager::reconcile() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool changed = false;

    for (auto& [name, info] : services_) {
        if (info.status == kStatusRunning && runner_.isAlive(info.pid)) {
            continue;
        }

        spdlog::warn("[ServiceManager] Tunnel for service {} is not running, respawning", name);
        try {
            info = spawnTunnelLocked(name, info.local_port);
            spdlog::info("[ServiceManager] Service {} respawned (PID: {})", name, info.pid);
        } catch (const AgentError& e) {
            spdlog::error("[ServiceManager] Failed to respawn service {}: {}", name, e.what());
            info.pid = 0;
            info.status = kStatusStopped;
        }
        changed = true;
    }

    if (changed) {
        try {
            saveRegistryLocked();
        } catch (const PersistenceError& e) {
            spdlog::error("[ServiceManager] {}", e.what());
        }
    }
}

ServiceInfo ServiceManager::spawnTunnelLocked(const std::string& name, int local_port) {
    std::string tunnel_url = tunnelUrl();

    pid_t pid = runner_.spawn({
        wstun_bin_,
        "client",
        "-s", tunnel_url,
        "-t", "127.0.0.1:" + std::to_string(local_port)
    });

    ServiceInfo info;
    info.name = name;
    info.local_port = local_port;
    info.public_url = tunnel_url + "/" + name;
    info.pid = pid;
    info.status = kStatusRunning;
    return info;
}

void ServiceManager::stopServiceLocked(const std::string& name) {
    auto it = services_.find(name);
    if (it == services_.end()) {
        return;
    }

    pid_t pid = it->second.pid;
    if (pid > 0) {
        try {
            if (!runner_.terminate(pid)) {
                spdlog::debug("[ServiceManager] Tunnel process {} already gone", pid);
            }
        } catch (const ProcessError& e) {
            spdlog::warn("[ServiceManager] Failed to kill process {}: {}", pid, e.what());
        }
    }

    services_.erase(it);
    saveRegistryLocked();

    spdlog::info("[ServiceManager] Service {} unexposed", name);
}

void ServiceManager::loadRegistry() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    services_.clear();

    if (!fs::exists(registry_path_)) {
        spdlog::info("[ServiceManager] No service registry at {}, starting empty", registry_path_);
        try {
            saveRegistryLocked();
        } catch (const PersistenceError& e) {
            spdlog::warn("[ServiceManager] {}", e.what());
        }
        return;
    }

    try {
        nlohmann::json doc = readJsonFile(registry_path_);
        nlohmann::json services = doc.value("services", nlohmann::json::object());
        for (const auto& [name, entry] : services.items()) {
            ServiceInfo info = ServiceInfo::fromJson(entry);
            services_[name] = info;
        }
        spdlog::info("[ServiceManager] Loaded {} service(s) from registry", services_.size());
    } catch (const PersistenceError& e) {
        spdlog::warn("[ServiceManager] Failed to load services config: {}", e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[ServiceManager] Ignoring malformed service registry: {}", e.what());
        services_.clear();
    }
}

void ServiceManager::saveRegistryLocked() {
    nlohmann::json services = nlohmann::json::object();
    for (const auto& service : services_) {
        services[service.first] = service.second.toJson();
    }
    writeJsonFile(registry_path_, {{"services", services}});
}

std::vector<rpc::Capability> ServiceManager::capabilities() {
    return {
        {"ExposeService", [this](const nlohmann::json& args) { return handleExposeService(args); }},
        {"UnexposeService", [this](const nlohmann::json& args) { return handleUnexposeService(args); }},
        {"ServicesList", [this](const nlohmann::json& args) { return handleServicesList(args); }}
    };
}

void ServiceManager::registerRPCs() {
    session_.advertise(capabilities());
}

nlohmann::json ServiceManager::handleExposeService(const nlohmann::json& args) {
    spdlog::info("[ServiceManager] RPC ExposeService called");
    return rpc::guard("ExposeService", [&]() {
        std::string name = rpc::stringArg(args, 0, "service_name");
        int local_port = rpc::portArg(args, 1, "local_port");

        ServiceInfo info = exposeService(name, local_port);
        return rpc::success("Service " + name + " exposed on port " + std::to_string(local_port),
                            {{"public_url", info.public_url}, {"service", info.toJson()}});
    });
}

nlohmann::json ServiceManager::handleUnexposeService(const nlohmann::json& args) {
    spdlog::info("[ServiceManager] RPC UnexposeService called");
    return rpc::guard("UnexposeService", [&]() {
        std::string name = rpc::stringArg(args, 0, "service_name");
        unexposeService(name);
        return rpc::success("Service " + name + " unexposed");
    });
}

nlohmann::json ServiceManager::handleServicesList(const nlohmann::json&) {
    spdlog::info("[ServiceManager] RPC ServicesList called");
    return rpc::guard("ServicesList", [&]() {
        nlohmann::json services = nlohmann::json::array();
        for (const auto& info : listServices()) {
            services.push_back(info.toJson());
        }
        return rpc::success("Services list retrieved", {{"services", services}});
    });
}
