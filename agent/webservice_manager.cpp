#include "webservice_manager.h"
#include "config_manager.h"
#include "errors.h"
#include "json_store.h"
#include "process_runner.h"
#include "session_manager.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace {

constexpr const char* kArtifactPrefix = "lr_";
constexpr const char* kArtifactSuffix = ".conf";

}

nlohmann::json WebServiceInfo::toJson() const {
    return {
        {"name", name},
        {"local_port", local_port},
        {"public_port", public_port},
        {"domain", domain},
        {"status", status}
    };
}

WebServiceInfo WebServiceInfo::fromJson(const nlohmann::json& j) {
    WebServiceInfo info;
    info.name = j.at("name").get<std::string>();
    info.local_port = j.at("local_port").get<int>();
    info.public_port = j.at("public_port").get<int>();
    info.domain = j.value("domain", "");
    info.status = j.value("status", WebServiceManager::kStatusEnabled);
    return info;
}

WebServiceManager::WebServiceManager(const ConfigManager& config, SessionManager& session, ProcessRunner& runner)
    : session_(session)
    , runner_(runner)
    , running_(false) {

    nlohmann::json section = config.getAgentConfig().value("webservices", nlohmann::json::object());
    try {
        proxy_ = section.value("proxy", "nginx");
        conf_dir_ = section.value("conf_dir", "/etc/nginx/conf.d");
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid webservices settings: ") + e.what());
    }

    registry_path_ = (fs::path(config.getHome()) / "webservices.json").string();

    spdlog::info("[WebServiceManager] Proxy used: {}", proxy_);
}

WebServiceManager::~WebServiceManager() {
    running_ = false;
}

void WebServiceManager::start() {
    spdlog::info("[WebServiceManager] Starting WebService Manager...");

    loadRegistry();
    reconcile();

    running_ = true;
    session_.addConnectListener([this](const std::string&) {
        if (running_) {
            registerRPCs();
        }
    });
    registerRPCs();

    spdlog::info("[WebServiceManager] WebService Manager started successfully");
}

void WebServiceManager::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[WebServiceManager] Stopping WebService Manager...");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (webservices_.empty()) {
        return;
    }

    std::vector<std::string> names;
    for (const auto& webservice : webservices_) {
        names.push_back(webservice.first);
    }
    for (const auto& name : names) {
        try {
            removeWebServiceLocked(name);
        } catch (const std::exception& e) {
            spdlog::error("[WebServiceManager] Failed to remove webservice {}: {}", name, e.what());
        }
    }

    try {
        reloadProxy();
    } catch (const ProcessError& e) {
        spdlog::warn("[WebServiceManager] Failed to reload {}: {}", proxy_, e.what());
    }
}

std::string WebServiceManager::artifactPath(const std::string& name) const {
    return (fs::path(conf_dir_) / (kArtifactPrefix + name + kArtifactSuffix)).string();
}

std::string WebServiceManager::renderConfig(int local_port, int public_port, const std::string& domain) {
    std::ostringstream conf;
    conf << "server {\n"
         << "    listen " << public_port << ";\n"
         << "    server_name " << (domain.empty() ? "_" : domain) << ";\n"
         << "\n"
         << "    location / {\n"
         << "        proxy_pass http://127.0.0.1:" << local_port << ";\n"
         << "        proxy_set_header Host $host;\n"
         << "        proxy_set_header X-Real-IP $remote_addr;\n"
         << "        proxy_set_header X-Forwarded-For $proxy_add_x_forwarded_for;\n"
         << "        proxy_set_header X-Forwarded-Proto $scheme;\n"
         << "    }\n"
         << "}\n";
    return conf.str();
}

WebServiceInfo WebServiceManager::enableWebService(const std::string& name, int local_port, int public_port,
                                                   const std::string& domain) {
    rpc::validateResourceName(name);
    if (local_port < 1 || local_port > 65535) {
        throw InvalidArgumentError("Invalid local_port: out of range");
    }
    if (public_port < 1 || public_port > 65535) {
        throw InvalidArgumentError("Invalid public_port: out of range");
    }
    for (char c : domain) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == ';' || c == '{' || c == '}') {
            throw InvalidArgumentError("Invalid domain '" + domain + "'");
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (webservices_.count(name) > 0) {
        throw AlreadyExistsError("Webservice " + name + " already enabled");
    }

    WebServiceInfo info;
    info.name = name;
    info.local_port = local_port;
    info.public_port = public_port;
    info.domain = domain;
    info.status = kStatusEnabled;

    std::string path = artifactPath(name);
    writeArtifact(info);

    try {
        reloadProxy();
    } catch (const ProcessError&) {
        removeArtifact(path);
        throw;
    }

    webservices_[name] = info;
    saveRegistryLocked();

    spdlog::info("[WebServiceManager] Webservice {} enabled (local:{} -> public:{})", name, local_port, public_port);
    return info;
}

void WebServiceManager::disableWebService(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool registered = webservices_.count(name) > 0;
    if (!registered && !fs::exists(artifactPath(name))) {
        spdlog::info("[WebServiceManager] Webservice {} is not enabled, nothing to do", name);
        return;
    }

    removeWebServiceLocked(name);

    try {
        reloadProxy();
    } catch (const ProcessError& e) {
        spdlog::warn("[WebServiceManager] Failed to reload {}: {}", proxy_, e.what());
    }
}

void WebServiceManager::removeWebServiceLocked(const std::string& name) {
    removeArtifact(artifactPath(name));

    if (webservices_.erase(name) > 0) {
        saveRegistryLocked();
    }
    spdlog::info("[WebServiceManager] Webservice {} disabled", name);
}

std::vector<WebServiceInfo> WebServiceManager::listWebServices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<WebServiceInfo> webservices;
    for (const auto& webservice : webservices_) {
        webservices.push_back(webservice.second);
    }
    return webservices;
}

nlohmann::json WebServiceManager::proxyInfo() const {
    return {
        {"type", proxy_},
        {"status", isProxyRunning() ? "running" : "stopped"}
    };
}

void WebServiceManager::reconcile() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    bool changed = false;

    for (const auto& [name, info] : webservices_) {
        if (fs::exists(artifactPath(name))) {
            continue;
        }
        spdlog::warn("[WebServiceManager] Proxy configuration for {} is missing, regenerating", name);
        try {
            writeArtifact(info);
            changed = true;
        } catch (const PersistenceError& e) {
            spdlog::error("[WebServiceManager] {}", e.what());
        }
    }

    std::error_code ec;
    fs::directory_iterator it(conf_dir_, ec);
    if (ec) {
        spdlog::warn("[WebServiceManager] Cannot scan {}: {}", conf_dir_, ec.message());
    } else {
        const std::string prefix = kArtifactPrefix;
        const std::string suffix = kArtifactSuffix;
        for (const auto& entry : it) {
            std::string file = entry.path().filename().string();
            if (file.size() <= prefix.size() + suffix.size() ||
                file.compare(0, prefix.size(), prefix) != 0 ||
                file.compare(file.size() - suffix.size(), suffix.size(), suffix) != 0) {
                continue;
            }

            std::string name = file.substr(prefix.size(), file.size() - prefix.size() - suffix.size());
            if (webservices_.count(name) > 0) {
                continue;
            }

            spdlog::warn("[WebServiceManager] Removing orphaned proxy configuration {}", file);
            try {
                if (removeArtifact(entry.path().string())) {
                    changed = true;
                }
            } catch (const PersistenceError& e) {
                spdlog::error("[WebServiceManager] {}", e.what());
            }
        }
    }

    if (changed) {
        try {
            reloadProxy();
        } catch (const ProcessError& e) {
            spdlog::error("[WebServiceManager] Reload after reconciliation failed: {}", e.what());
        }
    }
}

void WebServiceManager::writeArtifact(const WebServiceInfo& info) {
    std::string path = artifactPath(info.name);

    std::error_code ec;
    fs::create_directories(conf_dir_, ec);
    if (ec) {
        throw PersistenceError("Failed to create proxy configuration directory " + conf_dir_ + ": " + ec.message());
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw PersistenceError("Failed to write proxy configuration " + path);
    }
    file << renderConfig(info.local_port, info.public_port, info.domain);
    file.close();
    if (!file) {
        removeArtifact(path);
        throw PersistenceError("Failed to write proxy configuration " + path);
    }
}

bool WebServiceManager::removeArtifact(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec) {
        throw PersistenceError("Failed to remove proxy configuration " + path + ": " + ec.message());
    }
    return removed;
}

void WebServiceManager::reloadProxy() {
    CommandResult test = runner_.run({proxy_, "-t"});
    if (!test.ok()) {
        throw ProcessError(proxy_ + " config test failed: " + test.output);
    }

    CommandResult reload = runner_.run({proxy_, "-s", "reload"});
    if (!reload.ok()) {
        throw ProcessError(proxy_ + " reload failed: " + reload.output);
    }
}

bool WebServiceManager::isProxyRunning() const {
    try {
        return runner_.run({"pgrep", proxy_}).ok();
    } catch (const ProcessError& e) {
        spdlog::warn("[WebServiceManager] Cannot probe {}: {}", proxy_, e.what());
        return false;
    }
}

void WebServiceManager::loadRegistry() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    webservices_.clear();

    if (!fs::exists(registry_path_)) {
        spdlog::info("[WebServiceManager] No webservice registry at {}, starting empty", registry_path_);
        try {
            saveRegistryLocked();
        } catch (const PersistenceError& e) {
            spdlog::warn("[WebServiceManager] {}", e.what());
        }
        return;
    }

    try {
        nlohmann::json doc = readJsonFile(registry_path_);
        nlohmann::json webservices = doc.value("webservices", nlohmann::json::object());
        for (const auto& [name, entry] : webservices.items()) {
            webservices_[name] = WebServiceInfo::fromJson(entry);
        }
        spdlog::info("[WebServiceManager] Loaded {} webservice(s) from registry", webservices_.size());
    } catch (const PersistenceError& e) {
        spdlog::warn("[WebServiceManager] Failed to load webservices config: {}", e.what());
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("[WebServiceManager] Ignoring malformed webservice registry: {}", e.what());
        webservices_.clear();
    }
}

void WebServiceManager::saveRegistryLocked() {
    nlohmann::json webservices = nlohmann::json::object();
    for (const auto& webservice : webservices_) {
        webservices[webservice.first] = webservice.second.toJson();
    }
    writeJsonFile(registry_path_, {{"webservices", webservices}});
}

std::vector<rpc::Capability> WebServiceManager::capabilities() {
    return {
        {"EnableWebService", [this](const nlohmann::json& args) { return handleEnableWebService(args); }},
        {"DisableWebService", [this](const nlohmann::json& args) { return handleDisableWebService(args); }},
        {"WebServicesList", [this](const nlohmann::json& args) { return handleWebServicesList(args); }},
        {"ProxyInfo", [this](const nlohmann::json& args) { return handleProxyInfo(args); }}
    };
}

void WebServiceManager::registerRPCs() {
    session_.advertise(capabilities());
}

nlohmann::json WebServiceManager::handleEnableWebService(const nlohmann::json& args) {
    spdlog::info("[WebServiceManager] RPC EnableWebService called");
    return rpc::guard("EnableWebService", [&]() {
        std::string name = rpc::stringArg(args, 0, "name");
        int local_port = rpc::portArg(args, 1, "local_port");
        int public_port = rpc::portArg(args, 2, "public_port");
        std::string domain = rpc::optionalStringArg(args, 3, "domain").value_or("");

        WebServiceInfo info = enableWebService(name, local_port, public_port, domain);
        return rpc::success("Webservice " + name + " enabled", info.toJson());
    });
}

nlohmann::json WebServiceManager::handleDisableWebService(const nlohmann::json& args) {
    spdlog::info("[WebServiceManager] RPC DisableWebService called");
    return rpc::guard("DisableWebService", [&]() {
        std::string name = rpc::stringArg(args, 0, "name");
        rpc::validateResourceName(name);
        disableWebService(name);
        return rpc::success("Webservice " + name + " disabled");
    });
}

nlohmann::json WebServiceManager::handleWebServicesList(const nlohmann::json&) {
    spdlog::info("[WebServiceManager] RPC WebServicesList called");
    return rpc::guard("WebServicesList", [&]() {
        nlohmann::json webservices = nlohmann::json::array();
        for (const auto& info : listWebServices()) {
            webservices.push_back(info.toJson());
        }
        return rpc::success("Webservices list retrieved", {{"webservices", webservices}});
    });
}

nlohmann::json WebServiceManager::handleProxyInfo(const nlohmann::json&) {
    spdlog::info("[WebServiceManager] RPC ProxyInfo called");
    return rpc::guard("ProxyInfo", [&]() {
        return rpc::success("Proxy info retrieved", proxyInfo());
    });
}
