#include "session_manager.h"
#include "board.h"
#include "config_manager.h"
#include "errors.h"
#include <spdlog/spdlog.h>

namespace {

std::chrono::milliseconds secondsSetting(const nlohmann::json& section, const char* key, double fallback) {
    double seconds = section.value(key, fallback);
    if (seconds < 0) {
        throw ConfigurationError(std::string("session.") + key + " must not be negative");
    }
    return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000));
}

}

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Disconnected: return "disconnected";
        case SessionState::Connecting: return "connecting";
        case SessionState::Connected: return "connected";
    }
    return "unknown";
}

SessionOptions SessionOptions::fromConfig(const ConfigManager& config) {
    nlohmann::json section = config.getAgentConfig().value("session", nlohmann::json::object());

    SessionOptions options;
    try {
        options.reconnect_delay = secondsSetting(section, "connection_timer", 10);
        options.alive_interval = secondsSetting(section, "alive_timer", 600);
        options.call_timeout = secondsSetting(section, "call_timeout", 30);
        options.dispatch_workers = section.value("dispatch_workers", size_t(4));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid session settings: ") + e.what());
    }
    if (options.dispatch_workers == 0) {
        options.dispatch_workers = 1;
    }

    options.transport.skip_cert_verify = config.skipCertVerify();
    options.transport.ca_file = config.getCaFile();
    return options;
}

SessionManager::SessionManager(Board& board, const SessionOptions& options, std::unique_ptr<Transport> transport)
    : board_(board)
    , options_(options)
    , transport_(std::move(transport))
    , state_(SessionState::Disconnected)
    , next_call_id_(1)
    , dispatch_stopping_(false)
    , stopping_(false) {

    transport_->setMessageHandler([this](const std::string& topic, const std::string& payload) {
        handleTransportMessage(topic, payload);
    });
    transport_->setDisconnectHandler([this]() {
        handleTransportLost();
    });

    for (size_t i = 0; i < options_.dispatch_workers; ++i) {
        workers_.emplace_back(&SessionManager::workerLoop, this);
    }
}

SessionManager::~SessionManager() {
    stop();
    transport_->setMessageHandler(nullptr);
    transport_->setDisconnectHandler(nullptr);
}

void SessionManager::connect() {
    std::string session_id;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (state_ == SessionState::Connected && transport_->isOpen()) {
            return;
        }

        ControlPlaneEndpoint endpoint = board_.requireEndpoint();
        state_ = SessionState::Connecting;

        spdlog::info("[SessionManager] Connecting to control plane: {} (realm: {})", endpoint.url, endpoint.realm);

        {
            std::lock_guard<std::mutex> routing(routing_mutex_);
            realm_ = endpoint.realm;
            reply_topic_.clear();
        }

        try {
            session_id = transport_->open(endpoint, options_.transport);
        } catch (const TransportError&) {
            state_ = SessionState::Disconnected;
            throw;
        }

        std::string reply_topic = endpoint.realm + "/reply/" + session_id;
        {
            std::lock_guard<std::mutex> routing(routing_mutex_);
            reply_topic_ = reply_topic;
        }

        try {
            transport_->subscribe(reply_topic);
            for (const auto& subscription : subscriptions_) {
                transport_->subscribe(eventTopic(subscription.first));
            }
        } catch (const TransportError&) {
            transport_->close();
            state_ = SessionState::Disconnected;
            throw;
        }

        // Registrations made under the previous session id are unreachable now.
        procedures_.clear();
        session_id_ = session_id;
        board_.setSessionId(session_id);
        state_ = SessionState::Connected;
    }

    spdlog::info("[SessionManager] Connected to control plane (session ID: {})", session_id);

    // A session whose capabilities could not be advertised is unreachable;
    // drop it so the keep-alive loop reconnects and advertises again.
    if (!notifyConnectListeners(session_id)) {
        disconnect();
        throw TransportError("Capability advertisement failed for session " + session_id);
    }
}

void SessionManager::disconnect() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        bool was_connected = state_ != SessionState::Disconnected;
        transport_->close();
        procedures_.clear();
        state_ = SessionState::Disconnected;

        if (was_connected) {
            spdlog::info("[SessionManager] Disconnected from control plane");
        }
    }

    failPendingCalls("Session closed");
}

void SessionManager::reconnect() {
    spdlog::info("[SessionManager] Attempting to reconnect to control plane...");

    disconnect();

    if (waitForStop(options_.reconnect_delay)) {
        spdlog::info("[SessionManager] Reconnect abandoned, shutting down");
        return;
    }

    connect();
    spdlog::info("[SessionManager] Successfully reconnected to control plane");
}

bool SessionManager::isConnected() const {
    return state_ == SessionState::Connected && transport_->isOpen();
}

std::string SessionManager::sessionId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return session_id_;
}

void SessionManager::startKeepAlive() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (keepalive_thread_.joinable() || stopping_) {
        return;
    }
    keepalive_thread_ = std::thread(&SessionManager::keepAliveLoop, this);
}

void SessionManager::stop() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();

    if (keepalive_thread_.joinable()) {
        keepalive_thread_.join();
    }

    disconnect();
    stopDispatch();
}

void SessionManager::keepAliveLoop() {
    spdlog::info("[SessionManager] Keep-alive loop started with interval: {}ms", options_.alive_interval.count());

    while (!waitForStop(options_.alive_interval)) {
        if (isConnected()) {
            continue;
        }

        spdlog::warn("[SessionManager] Connection lost, attempting to reconnect...");
        try {
            reconnect();
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] Reconnection failed: {}", e.what());
        }
    }

    spdlog::info("[SessionManager] Keep-alive loop stopped");
}

bool SessionManager::waitForStop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return stop_cv_.wait_for(lock, duration, [this]() { return stopping_; });
}

void SessionManager::addConnectListener(ConnectListener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    connect_listeners_.push_back(std::move(listener));
}

bool SessionManager::notifyConnectListeners(const std::string& session_id) {
    std::vector<ConnectListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        listeners = connect_listeners_;
    }

    bool all_succeeded = true;
    for (const auto& listener : listeners) {
        try {
            listener(session_id);
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] Connect listener failed for session {}: {}", session_id, e.what());
            all_succeeded = false;
        }
    }
    return all_succeeded;
}

void SessionManager::ensureConnected(const char* operation) const {
    if (state_ != SessionState::Connected) {
        throw NotConnectedError(std::string("Cannot ") + operation + ": not connected to control plane");
    }
}

std::string SessionManager::procedureName(const std::string& verb) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return rpc::procedureName(session_id_, board_.uuid(), verb);
}

std::vector<std::string> SessionManager::advertise(const std::vector<rpc::Capability>& capabilities) {
    std::vector<std::string> names;
    for (const auto& capability : capabilities) {
        std::string name = procedureName(capability.verb);
        registerProcedure(name, capability.handler);
        spdlog::info("[SessionManager] Registered RPC: {}", name);
        names.push_back(name);
    }
    return names;
}

void SessionManager::registerProcedure(const std::string& procedure, rpc::Handler handler) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ensureConnected("register procedure");

    try {
        transport_->subscribe(requestTopic(procedure));
    } catch (const TransportError& e) {
        throw TransportError("Failed to register procedure " + procedure + ": " + e.what());
    }

    procedures_[procedure] = std::move(handler);
    spdlog::debug("[SessionManager] Registered RPC procedure: {}", procedure);
}

void SessionManager::unregisterProcedure(const std::string& procedure) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ensureConnected("unregister procedure");

    if (procedures_.erase(procedure) == 0) {
        throw NotFoundError("Procedure " + procedure + " is not registered");
    }

    try {
        transport_->unsubscribe(requestTopic(procedure));
    } catch (const TransportError& e) {
        throw TransportError("Failed to unregister procedure " + procedure + ": " + e.what());
    }
    spdlog::debug("[SessionManager] Unregistered RPC procedure: {}", procedure);
}

std::vector<std::string> SessionManager::registeredProcedures() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& procedure : procedures_) {
        names.push_back(procedure.first);
    }
    return names;
}

nlohmann::json SessionManager::call(const std::string& procedure, const nlohmann::json& args) {
    uint64_t call_id = next_call_id_++;
    auto promise = std::make_shared<std::promise<nlohmann::json>>();
    std::future<nlohmann::json> future = promise->get_future();

    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ensureConnected("call procedure");

        std::string reply_to;
        {
            std::lock_guard<std::mutex> routing(routing_mutex_);
            reply_to = reply_topic_;
        }

        {
            std::lock_guard<std::mutex> calls(calls_mutex_);
            pending_calls_[call_id] = promise;
        }

        nlohmann::json request;
        request["id"] = call_id;
        request["reply_to"] = reply_to;
        request["args"] = args.is_array() ? args : nlohmann::json::array({args});

        try {
            transport_->publish(requestTopic(procedure), request.dump());
        } catch (const TransportError& e) {
            std::lock_guard<std::mutex> calls(calls_mutex_);
            pending_calls_.erase(call_id);
            throw TransportError("Failed to call procedure " + procedure + ": " + e.what());
        }
    }

    if (future.wait_for(options_.call_timeout) != std::future_status::ready) {
        std::lock_guard<std::mutex> calls(calls_mutex_);
        pending_calls_.erase(call_id);
        throw TimeoutError("Call to " + procedure + " timed out after " +
                           std::to_string(options_.call_timeout.count()) + "ms");
    }

    return future.get();
}

void SessionManager::subscribe(const std::string& topic, EventHandler handler) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ensureConnected("subscribe");

    try {
        transport_->subscribe(eventTopic(topic));
    } catch (const TransportError& e) {
        throw TransportError("Failed to subscribe to topic " + topic + ": " + e.what());
    }

    subscriptions_[topic] = std::move(handler);
    spdlog::debug("[SessionManager] Subscribed to topic: {}", topic);
}

void SessionManager::unsubscribe(const std::string& topic) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    ensureConnected("unsubscribe");

    if (subscriptions_.erase(topic) == 0) {
        throw NotFoundError("Not subscribed to topic " + topic);
    }
    transport_->unsubscribe(eventTopic(topic));
    spdlog::debug("[SessionManager] Unsubscribed from topic: {}", topic);
}

void SessionManager::publish(const std::string& topic, const nlohmann::json& args) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ensureConnected("publish");

    nlohmann::json event;
    event["args"] = args.is_array() ? args : nlohmann::json::array({args});

    try {
        transport_->publish(eventTopic(topic), event.dump());
    } catch (const TransportError& e) {
        throw TransportError("Failed to publish to topic " + topic + ": " + e.what());
    }
    spdlog::debug("[SessionManager] Published to topic: {}", topic);
}

std::string SessionManager::requestTopic(const std::string& procedure) const {
    std::lock_guard<std::mutex> routing(routing_mutex_);
    return realm_ + "/rpc/" + procedure;
}

std::string SessionManager::eventTopic(const std::string& topic) const {
    std::lock_guard<std::mutex> routing(routing_mutex_);
    return realm_ + "/event/" + topic;
}

void SessionManager::handleTransportLost() {
    // Runs on the network thread: flag only, the keep-alive loop reconnects.
    state_ = SessionState::Disconnected;
    spdlog::warn("[SessionManager] Control-plane session lost");
}

void SessionManager::handleTransportMessage(const std::string& topic, const std::string& payload) {
    std::string rpc_prefix;
    std::string event_prefix;
    std::string reply_topic;
    {
        std::lock_guard<std::mutex> routing(routing_mutex_);
        rpc_prefix = realm_ + "/rpc/";
        event_prefix = realm_ + "/event/";
        reply_topic = reply_topic_;
    }

    if (!reply_topic.empty() && topic == reply_topic) {
        handleReply(payload);
    } else if (topic.compare(0, rpc_prefix.size(), rpc_prefix) == 0) {
        std::string procedure = topic.substr(rpc_prefix.size());
        dispatch([this, procedure, payload]() { handleInvocation(procedure, payload); });
    } else if (topic.compare(0, event_prefix.size(), event_prefix) == 0) {
        std::string event_topic = topic.substr(event_prefix.size());
        dispatch([this, event_topic, payload]() { handleEvent(event_topic, payload); });
    } else {
        spdlog::debug("[SessionManager] Ignoring message on unexpected topic {}", topic);
    }
}

void SessionManager::handleReply(const std::string& payload) {
    nlohmann::json reply = nlohmann::json::parse(payload, nullptr, false);
    if (reply.is_discarded() || !reply.is_object() || !reply.contains("id")) {
        spdlog::warn("[SessionManager] Discarding malformed RPC reply");
        return;
    }
    // Call ids are issued from an unsigned counter; the parser types every
    // non-negative integer as unsigned.
    if (!reply["id"].is_number_unsigned()) {
        spdlog::warn("[SessionManager] Discarding RPC reply with invalid id: {}", reply["id"].dump());
        return;
    }

    uint64_t call_id = reply["id"].get<uint64_t>();
    std::shared_ptr<std::promise<nlohmann::json>> promise;
    {
        std::lock_guard<std::mutex> calls(calls_mutex_);
        auto it = pending_calls_.find(call_id);
        if (it == pending_calls_.end()) {
            spdlog::debug("[SessionManager] Reply for unknown or expired call {}", call_id);
            return;
        }
        promise = it->second;
        pending_calls_.erase(it);
    }

    if (reply.contains("error")) {
        std::string message = reply["error"].is_string() ? reply["error"].get<std::string>() : reply["error"].dump();
        promise->set_exception(std::make_exception_ptr(AgentError("Remote error: " + message)));
    } else {
        promise->set_value(reply.value("result", nlohmann::json()));
    }
}

void SessionManager::handleInvocation(const std::string& procedure, const std::string& payload) {
    nlohmann::json request = nlohmann::json::parse(payload, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        spdlog::warn("[SessionManager] Discarding malformed invocation of {}", procedure);
        return;
    }

    rpc::Handler handler;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = procedures_.find(procedure);
        if (it != procedures_.end()) {
            handler = it->second;
        }
    }

    nlohmann::json reply;
    reply["id"] = request.value("id", nlohmann::json());

    if (!handler) {
        reply["error"] = "no such procedure: " + procedure;
    } else {
        try {
            reply["result"] = handler(request.value("args", nlohmann::json::array()));
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] Procedure {} failed: {}", procedure, e.what());
            reply["error"] = e.what();
        }
    }

    if (!request.contains("reply_to")) {
        return;
    }
    if (!request["reply_to"].is_string()) {
        spdlog::warn("[SessionManager] Malformed invocation of {}: reply_to is not a string", procedure);
        return;
    }
    std::string reply_to = request["reply_to"].get<std::string>();
    if (reply_to.empty()) {
        return;
    }

    try {
        transport_->publish(reply_to, reply.dump());
    } catch (const TransportError& e) {
        spdlog::warn("[SessionManager] Could not deliver reply for {}: {}", procedure, e.what());
    }
}

void SessionManager::handleEvent(const std::string& topic, const std::string& payload) {
    nlohmann::json event = nlohmann::json::parse(payload, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        spdlog::warn("[SessionManager] Discarding malformed event on {}", topic);
        return;
    }

    EventHandler handler;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = subscriptions_.find(topic);
        if (it == subscriptions_.end()) {
            return;
        }
        handler = it->second;
    }

    try {
        handler(event.value("args", nlohmann::json::array()));
    } catch (const std::exception& e) {
        spdlog::error("[SessionManager] Event handler for {} failed: {}", topic, e.what());
    }
}

void SessionManager::failPendingCalls(const std::string& reason) {
    std::map<uint64_t, std::shared_ptr<std::promise<nlohmann::json>>> pending;
    {
        std::lock_guard<std::mutex> calls(calls_mutex_);
        pending.swap(pending_calls_);
    }

    for (auto& call : pending) {
        call.second->set_exception(std::make_exception_ptr(NotConnectedError(reason)));
    }
}

void SessionManager::dispatch(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (dispatch_stopping_) {
            return;
        }
        jobs_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
}

void SessionManager::workerLoop() {
    while (true) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return dispatch_stopping_ || !jobs_.empty(); });
            if (dispatch_stopping_) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("[SessionManager] Dispatch job failed: {}", e.what());
        }
    }
}

void SessionManager::stopDispatch() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        dispatch_stopping_ = true;
        jobs_.clear();
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}
