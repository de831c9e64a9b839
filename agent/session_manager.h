#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "rpc.h"
#include "transport.h"

class Board;
class ConfigManager;

enum class SessionState {
    Disconnected,
    Connecting,
    Connected
};

const char* toString(SessionState state);

struct SessionOptions {
    std::chrono::milliseconds reconnect_delay{10000};
    std::chrono::milliseconds alive_interval{600000};
    std::chrono::milliseconds call_timeout{30000};
    size_t dispatch_workers = 4;
    TransportOptions transport;

    static SessionOptions fromConfig(const ConfigManager& config);
};

// Owns the single control-plane session: connection lifecycle, keep-alive
// and reconnection, RPC registration/invocation and pub/sub on top of the
// transport. Inbound invocations run on an internal worker pool.
class SessionManager {
public:
    using EventHandler = std::function<void(const nlohmann::json& args)>;
    using ConnectListener = std::function<void(const std::string& session_id)>;

    SessionManager(Board& board, const SessionOptions& options, std::unique_ptr<Transport> transport);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Connection management. connect() throws TransportError and leaves the
    // session disconnected if any connect listener fails.
    void connect();
    void disconnect();
    void reconnect();
    bool isConnected() const;
    SessionState state() const { return state_; }
    std::string sessionId() const;

    // Keep-alive loop
    void startKeepAlive();
    void stop();

    // RPC; all throw NotConnectedError while disconnected
    void registerProcedure(const std::string& procedure, rpc::Handler handler);
    void unregisterProcedure(const std::string& procedure);
    nlohmann::json call(const std::string& procedure, const nlohmann::json& args);
    std::vector<std::string> registeredProcedures() const;

    // Pub/sub
    void subscribe(const std::string& topic, EventHandler handler);
    void unsubscribe(const std::string& topic);
    void publish(const std::string& topic, const nlohmann::json& args);

    // Capability registrar. Names are bound to the current session id, so
    // every advertiser re-runs its registration from a connect listener.
    std::string procedureName(const std::string& verb) const;
    std::vector<std::string> advertise(const std::vector<rpc::Capability>& capabilities);
    void addConnectListener(ConnectListener listener);

private:
    Board& board_;
    SessionOptions options_;
    std::unique_ptr<Transport> transport_;

    // Guards session state and registrations. Never taken on the transport's
    // network thread: close() joins that thread while this is held.
    mutable std::shared_mutex mutex_;
    std::atomic<SessionState> state_;
    std::string session_id_;
    std::map<std::string, rpc::Handler> procedures_;
    std::map<std::string, EventHandler> subscriptions_;

    // Topic routing, read on the network thread
    mutable std::mutex routing_mutex_;
    std::string realm_;
    std::string reply_topic_;

    // Outstanding calls
    std::mutex calls_mutex_;
    std::map<uint64_t, std::shared_ptr<std::promise<nlohmann::json>>> pending_calls_;
    std::atomic<uint64_t> next_call_id_;

    std::mutex listeners_mutex_;
    std::vector<ConnectListener> connect_listeners_;

    // Dispatch pool
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> jobs_;
    bool dispatch_stopping_;
    std::vector<std::thread> workers_;

    // Keep-alive
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stopping_;
    std::thread keepalive_thread_;

    // Private methods
    void keepAliveLoop();
    bool waitForStop(std::chrono::milliseconds duration);
    // False if any listener threw.
    bool notifyConnectListeners(const std::string& session_id);
    void failPendingCalls(const std::string& reason);
    void ensureConnected(const char* operation) const;

    void handleTransportMessage(const std::string& topic, const std::string& payload);
    void handleTransportLost();
    void handleInvocation(const std::string& procedure, const std::string& payload);
    void handleEvent(const std::string& topic, const std::string& payload);
    void handleReply(const std::string& payload);

    void dispatch(std::function<void()> job);
    void workerLoop();
    void stopDispatch();

    std::string requestTopic(const std::string& procedure) const;
    std::string eventTopic(const std::string& topic) const;
};
