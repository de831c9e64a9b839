#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

namespace httplib {
class Server;
}

class Board;
class MetricsCollector;
class SessionManager;

// Read-only local HTTP API: /api/info, /api/status, /api/board and a
// small dashboard.
class StatusServer {
public:
    StatusServer(Board& board, SessionManager& session, MetricsCollector& metrics);
    ~StatusServer();

    StatusServer(const StatusServer&) = delete;
    StatusServer& operator=(const StatusServer&) = delete;

    // Port 0 binds an ephemeral port, see port(). Returns false if the
    // address cannot be bound.
    bool start(const std::string& address, int port);
    void stop();
    bool isRunning() const { return running_; }
    int port() const { return bound_port_; }

    nlohmann::json infoJson() const;
    nlohmann::json statusJson() const;
    nlohmann::json boardJson() const;
    std::string dashboardHtml() const;

private:
    Board& board_;
    SessionManager& session_;
    MetricsCollector& metrics_;

    std::unique_ptr<httplib::Server> server_;
    std::thread thread_;
    std::atomic<bool> running_;
    int bound_port_;

    void setupRoutes();
};
