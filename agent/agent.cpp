#include "agent.h"
#include "board.h"
#include "config_manager.h"
#include "device_manager.h"
#include "errors.h"
#include "metrics_collector.h"
#include "mqtt_transport.h"
#include "process_runner.h"
#include "service_manager.h"
#include "session_manager.h"
#include "status_server.h"
#include "webservice_manager.h"
#include <spdlog/spdlog.h>

Agent::Agent(std::unique_ptr<ConfigManager> config)
    : Agent(std::move(config), std::make_unique<MqttTransport>(), std::make_unique<PosixProcessRunner>()) {
}

Agent::Agent(std::unique_ptr<ConfigManager> config,
             std::unique_ptr<Transport> transport,
             std::unique_ptr<ProcessRunner> runner)
    : config_manager_(std::move(config))
    , process_runner_(std::move(runner))
    , running_(false) {

    try {
        // Board first: everything else resolves identity and endpoint through it
        board_ = std::make_unique<Board>(*config_manager_);
        board_->load();

        metrics_collector_ = std::make_unique<MetricsCollector>();

        session_manager_ = std::make_unique<SessionManager>(
            *board_, SessionOptions::fromConfig(*config_manager_), std::move(transport));

        device_manager_ = std::make_unique<DeviceManager>(*board_, *session_manager_, *metrics_collector_);
        service_manager_ = std::make_unique<ServiceManager>(
            *config_manager_, *board_, *session_manager_, *process_runner_);
        webservice_manager_ = std::make_unique<WebServiceManager>(
            *config_manager_, *session_manager_, *process_runner_);

        nlohmann::json rest = config_manager_->getAgentConfig().value("rest", nlohmann::json::object());
        rest_enabled_ = rest.value("enabled", true);
        rest_address_ = rest.value("address", "0.0.0.0");
        rest_port_ = rest.value("port", 1474);
        if (rest_enabled_) {
            status_server_ = std::make_unique<StatusServer>(*board_, *session_manager_, *metrics_collector_);
        }

        reconcile_interval_ = service_manager_->reconcileInterval();

        spdlog::info("[Agent] Board {} ({}) initialized, status: {}", board_->name(), board_->uuid(), board_->status());

    } catch (const nlohmann::json::exception& e) {
        spdlog::error("[Agent] Failed to initialize agent: {}", e.what());
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    } catch (const std::exception& e) {
        spdlog::error("[Agent] Failed to initialize agent: {}", e.what());
        throw;
    }
}

Agent::~Agent() {
    stop();
}

void Agent::start() {
    if (running_) {
        spdlog::info("[Agent] Agent is already running");
        return;
    }

    spdlog::info("[Agent] Starting Lightning Rod...");
    running_ = true;

    try {
        if (status_server_ && !status_server_->start(rest_address_, rest_port_)) {
            throw AgentError("Failed to start REST API on " + rest_address_ + ":" + std::to_string(rest_port_));
        }

        spdlog::info("[Agent] Connecting to control plane...");
        session_manager_->connect();

        device_manager_->start();
        service_manager_->start();
        webservice_manager_->start();

        session_manager_->startKeepAlive();
        reconcile_thread_ = std::thread(&Agent::reconcileLoop, this);

    } catch (const std::exception& e) {
        spdlog::error("[Agent] Startup failed: {}", e.what());
        running_ = false;
        shutdownComponents();
        throw;
    }

    spdlog::info("[Agent] Lightning Rod started successfully");
}

void Agent::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    spdlog::info("[Agent] Stopping Lightning Rod...");

    if (reconcile_thread_.joinable()) {
        reconcile_thread_.join();
    }

    shutdownComponents();

    spdlog::info("[Agent] Lightning Rod stopped");
}

void Agent::shutdownComponents() {
    try {
        webservice_manager_->stop();
    } catch (const std::exception& e) {
        spdlog::error("[Agent] Error stopping webservice manager: {}", e.what());
    }

    try {
        service_manager_->stop();
    } catch (const std::exception& e) {
        spdlog::error("[Agent] Error stopping service manager: {}", e.what());
    }

    device_manager_->stop();
    session_manager_->stop();

    if (status_server_) {
        status_server_->stop();
    }
}

void Agent::reconcileLoop() {
    spdlog::info("[Agent] Reconcile loop started with interval: {}ms", reconcile_interval_.count());

    while (running_) {
        // Sleep for the reconcile interval
        auto start = std::chrono::steady_clock::now();
        while (running_ && (std::chrono::steady_clock::now() - start) < reconcile_interval_) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!running_) {
            break;
        }

        try {
            service_manager_->reconcile();
            webservice_manager_->reconcile();
        } catch (const std::exception& e) {
            spdlog::error("[Agent] Reconciliation failed: {}", e.what());
        }
    }

    spdlog::info("[Agent] Reconcile loop stopped");
}
