#pragma once

#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>
#include <nlohmann/json.hpp>

// Forward declarations
class ConfigManager;
class Board;
class MetricsCollector;
class ProcessRunner;
class Transport;
class SessionManager;
class DeviceManager;
class ServiceManager;
class WebServiceManager;
class StatusServer;

class Agent {
public:
    explicit Agent(std::unique_ptr<ConfigManager> config);

    // Injects the control-plane transport and process runner.
    Agent(std::unique_ptr<ConfigManager> config,
          std::unique_ptr<Transport> transport,
          std::unique_ptr<ProcessRunner> runner);
    ~Agent();

    // Throws on any startup failure; partially started components are
    // stopped again before the exception propagates.
    void start();
    void stop();
    bool isRunning() const { return running_; }

    Board& board() { return *board_; }
    SessionManager& session() { return *session_manager_; }
    ServiceManager& services() { return *service_manager_; }
    WebServiceManager& webservices() { return *webservice_manager_; }
    StatusServer* statusServer() { return status_server_.get(); }

private:
    // Core components
    std::unique_ptr<ConfigManager> config_manager_;
    std::unique_ptr<Board> board_;
    std::unique_ptr<MetricsCollector> metrics_collector_;
    std::unique_ptr<ProcessRunner> process_runner_;
    std::unique_ptr<SessionManager> session_manager_;
    std::unique_ptr<DeviceManager> device_manager_;
    std::unique_ptr<ServiceManager> service_manager_;
    std::unique_ptr<WebServiceManager> webservice_manager_;
    std::unique_ptr<StatusServer> status_server_;

    // Local status API
    bool rest_enabled_;
    std::string rest_address_;
    int rest_port_;

    // Threading
    std::atomic<bool> running_;
    std::thread reconcile_thread_;
    std::chrono::milliseconds reconcile_interval_;

    // Thread functions
    void reconcileLoop();

    void shutdownComponents();
};
