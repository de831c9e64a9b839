#pragma once

#include <atomic>
#include <map>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "rpc.h"

class ConfigManager;
class ProcessRunner;
class SessionManager;

struct WebServiceInfo {
    std::string name;
    int local_port = 0;
    int public_port = 0;
    std::string domain;
    std::string status;

    nlohmann::json toJson() const;
    static WebServiceInfo fromJson(const nlohmann::json& j);
};

// Publishes local HTTP services through reverse-proxy routes. Every
// registry entry owns exactly one lr_<name>.conf in the proxy's conf dir.
class WebServiceManager {
public:
    static constexpr const char* kStatusEnabled = "enabled";
    static constexpr const char* kStatusDisabled = "disabled";

    WebServiceManager(const ConfigManager& config, SessionManager& session, ProcessRunner& runner);
    ~WebServiceManager();

    WebServiceManager(const WebServiceManager&) = delete;
    WebServiceManager& operator=(const WebServiceManager&) = delete;

    void start();
    void stop();

    // On validation or reload failure the new artifact is removed again and
    // ProcessError is thrown; the registry is left untouched.
    WebServiceInfo enableWebService(const std::string& name, int local_port, int public_port,
                                    const std::string& domain = "");

    // Succeeds for unknown names.
    void disableWebService(const std::string& name);

    std::vector<WebServiceInfo> listWebServices() const;
    nlohmann::json proxyInfo() const;

    // Regenerates missing artifacts and removes orphaned ones.
    void reconcile();

    std::string artifactPath(const std::string& name) const;
    std::string registryPath() const { return registry_path_; }

    static std::string renderConfig(int local_port, int public_port, const std::string& domain);

    std::vector<rpc::Capability> capabilities();

private:
    SessionManager& session_;
    ProcessRunner& runner_;

    std::string proxy_;
    std::string conf_dir_;
    std::string registry_path_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, WebServiceInfo> webservices_;
    std::atomic<bool> running_;

    // Private methods
    void registerRPCs();
    void loadRegistry();
    void saveRegistryLocked();
    void writeArtifact(const WebServiceInfo& info);
    bool removeArtifact(const std::string& path);
    void reloadProxy();
    void removeWebServiceLocked(const std::string& name);
    bool isProxyRunning() const;

    nlohmann::json handleEnableWebService(const nlohmann::json& args);
    nlohmann::json handleDisableWebService(const nlohmann::json& args);
    nlohmann::json handleWebServicesList(const nlohmann::json& args);
    nlohmann::json handleProxyInfo(const nlohmann::json& args);
};
