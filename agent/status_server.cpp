#include "status_server.h"
#include "board.h"
#include "metrics_collector.h"
#include "session_manager.h"
#include "version.h"
#include <httplib.h>
#include <sstream>
#include <spdlog/spdlog.h>

namespace {

std::string escapeHtml(const std::string& text) {
    std::string escaped;
    for (char c : text) {
        switch (c) {
            case '&': escaped += "&amp;"; break;
            case '<': escaped += "&lt;"; break;
            case '>': escaped += "&gt;"; break;
            case '"': escaped += "&quot;"; break;
            default: escaped += c;
        }
    }
    return escaped;
}

void sendJson(httplib::Response& res, const nlohmann::json& body) {
    res.set_content(body.dump(2), "application/json");
}

}

StatusServer::StatusServer(Board& board, SessionManager& session, MetricsCollector& metrics)
    : board_(board)
    , session_(session)
    , metrics_(metrics)
    , running_(false)
    , bound_port_(0) {
}

StatusServer::~StatusServer() {
    stop();
}

bool StatusServer::start(const std::string& address, int port) {
    if (running_) {
        return true;
    }

    server_ = std::make_unique<httplib::Server>();
    setupRoutes();

    if (port == 0) {
        bound_port_ = server_->bind_to_any_port(address);
        if (bound_port_ < 0) {
            spdlog::error("[StatusServer] Failed to bind {}", address);
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(address, port)) {
            spdlog::error("[StatusServer] Failed to bind {}:{}", address, port);
            server_.reset();
            return false;
        }
        bound_port_ = port;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            spdlog::error("[StatusServer] Listener on port {} exited with an error", bound_port_);
        }
    });

    spdlog::info("[StatusServer] Listening on {}:{}", address, bound_port_);
    spdlog::info("[StatusServer] Dashboard available at http://localhost:{}/", bound_port_);
    return true;
}

void StatusServer::stop() {
    if (!running_) {
        return;
    }

    if (server_) {
        server_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    running_ = false;
    spdlog::info("[StatusServer] Stopped");
}

void StatusServer::setupRoutes() {
    server_->Get("/api/info", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, infoJson());
    });

    server_->Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, statusJson());
    });

    server_->Get("/api/board", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, boardJson());
    });

    server_->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(dashboardHtml(), "text/html");
    });

    server_->Get("/dashboard", [](const httplib::Request&, httplib::Response& res) {
        res.set_redirect("/");
    });
}

nlohmann::json StatusServer::infoJson() const {
    nlohmann::json info;
    info["version"] = kAgentVersion;

    info["board"] = {
        {"uuid", board_.uuid()},
        {"name", board_.name()},
        {"type", board_.type()},
        {"status", board_.status()}
    };

    info["session"] = {
        {"state", toString(session_.state())},
        {"connected", session_.isConnected()},
        {"id", board_.sessionId()}
    };

    std::optional<ControlPlaneEndpoint> endpoint = board_.selectedEndpoint();
    if (endpoint) {
        info["endpoint"] = {
            {"kind", board_.selectedEndpointKind()},
            {"url", endpoint->url},
            {"realm", endpoint->realm}
        };
    } else {
        info["endpoint"] = nullptr;
    }
    return info;
}

nlohmann::json StatusServer::statusJson() const {
    return metrics_.collectSystemMetrics();
}

nlohmann::json StatusServer::boardJson() const {
    return board_.toJson();
}

std::string StatusServer::dashboardHtml() const {
    nlohmann::json info = infoJson();
    nlohmann::json status = statusJson();

    std::ostringstream html;
    html << "<!DOCTYPE html>\n<html>\n<head>\n"
         << "<meta charset=\"utf-8\">\n"
         << "<meta http-equiv=\"refresh\" content=\"10\">\n"
         << "<title>Lightning Rod</title>\n"
         << "<style>body{font-family:sans-serif;margin:2em}td{padding:0.2em 1em}</style>\n"
         << "</head>\n<body>\n"
         << "<h1>Lightning Rod " << escapeHtml(kAgentVersion) << "</h1>\n"
         << "<table>\n"
         << "<tr><td>Board</td><td>" << escapeHtml(info["board"].value("name", "")) << "</td></tr>\n"
         << "<tr><td>UUID</td><td>" << escapeHtml(info["board"].value("uuid", "")) << "</td></tr>\n"
         << "<tr><td>Status</td><td>" << escapeHtml(info["board"].value("status", "")) << "</td></tr>\n"
         << "<tr><td>Session</td><td>" << escapeHtml(info["session"].value("state", "")) << "</td></tr>\n"
         << "<tr><td>CPU</td><td>" << status.value("cpu_pct", 0.0) << " %</td></tr>\n"
         << "<tr><td>Memory</td><td>" << status.value("mem_pct", 0.0) << " %</td></tr>\n"
         << "<tr><td>Disk</td><td>" << status.value("disk_pct", 0.0) << " %</td></tr>\n"
         << "<tr><td>Uptime</td><td>" << static_cast<long>(status.value("uptime_s", 0.0)) << " s</td></tr>\n"
         << "</table>\n"
         << "</body>\n</html>\n";
    return html.str();
}
