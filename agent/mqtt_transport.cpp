#include "mqtt_transport.h"
#include "errors.h"
#include <cstdint>
#include <cstring>
#include <mosquitto.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>

namespace {

constexpr int kKeepAliveSeconds = 60;

// The session manager owns reconnection; keep libmosquitto from racing it.
constexpr unsigned int kReconnectDelaySeconds = 3600;

std::once_flag g_mosquitto_init;

}

MqttTransport::MqttTransport()
    : mqtt_handle_(nullptr)
    , connected_(false)
    , connack_received_(false)
    , connack_result_(-1) {

    std::call_once(g_mosquitto_init, []() { mosquitto_lib_init(); });
}

MqttTransport::~MqttTransport() {
    close();
}

MqttTransport::BrokerAddress MqttTransport::parseBrokerUrl(const std::string& url) {
    BrokerAddress address;

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw TransportError("Invalid control-plane URL: " + url);
    }

    std::string scheme = url.substr(0, scheme_end);
    if (scheme == "mqtt" || scheme == "tcp") {
        address.tls = false;
        address.port = 1883;
    } else if (scheme == "mqtts" || scheme == "ssl" || scheme == "tls") {
        address.tls = true;
        address.port = 8883;
    } else {
        throw TransportError("Unsupported control-plane scheme '" + scheme + "' in " + url);
    }

    std::string authority = url.substr(scheme_end + 3);
    size_t path_pos = authority.find('/');
    if (path_pos != std::string::npos) {
        authority = authority.substr(0, path_pos);
    }

    size_t colon_pos = authority.find_last_of(':');
    if (colon_pos != std::string::npos) {
        std::string port = authority.substr(colon_pos + 1);
        try {
            size_t consumed = 0;
            address.port = std::stoi(port, &consumed);
            if (consumed != port.size() || address.port <= 0 || address.port > 65535) {
                throw TransportError("Invalid port in control-plane URL: " + url);
            }
        } catch (const std::logic_error&) {
            throw TransportError("Invalid port in control-plane URL: " + url);
        }
        authority = authority.substr(0, colon_pos);
    }

    if (authority.empty()) {
        throw TransportError("Missing host in control-plane URL: " + url);
    }
    address.host = authority;
    return address;
}

std::string MqttTransport::generateSessionId() {
    uint64_t value = 0;
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
        throw TransportError("Failed to generate session identifier");
    }

    // Same range as WAMP session ids: [1, 2^53]
    value &= (uint64_t(1) << 53) - 1;
    return std::to_string(value + 1);
}

std::string MqttTransport::open(const ControlPlaneEndpoint& endpoint, const TransportOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (mqtt_handle_) {
        destroyHandleLocked();
    }

    BrokerAddress address = parseBrokerUrl(endpoint.url);
    std::string session_id = generateSessionId();

    mqtt_handle_ = mosquitto_new(session_id.c_str(), true, this);
    if (!mqtt_handle_) {
        throw TransportError("Failed to create MQTT client instance");
    }

    mosquitto_connect_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata, int result) {
        static_cast<MqttTransport*>(userdata)->handleConnack(result);
    });

    mosquitto_disconnect_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata, int result) {
        static_cast<MqttTransport*>(userdata)->handleDisconnect(result);
    });

    mosquitto_message_callback_set(mqtt_handle_, [](struct mosquitto*, void* userdata,
                                                    const struct mosquitto_message* message) {
        std::string topic(message->topic);
        std::string payload(static_cast<char*>(message->payload), message->payloadlen);
        static_cast<MqttTransport*>(userdata)->handleMessage(topic, payload);
    });

    mosquitto_reconnect_delay_set(mqtt_handle_, kReconnectDelaySeconds, kReconnectDelaySeconds, false);

    if (address.tls) {
        try {
            setupTLS(options);
        } catch (const TransportError&) {
            destroyHandleLocked();
            throw;
        }
    }

    {
        std::lock_guard<std::mutex> connack_lock(connack_mutex_);
        connack_received_ = false;
        connack_result_ = -1;
    }

    int result = mosquitto_connect(mqtt_handle_, address.host.c_str(), address.port, kKeepAliveSeconds);
    if (result != MOSQ_ERR_SUCCESS) {
        std::string reason = mosquitto_strerror(result);
        destroyHandleLocked();
        throw TransportError("Failed to connect to " + endpoint.url + ": " + reason);
    }

    result = mosquitto_loop_start(mqtt_handle_);
    if (result != MOSQ_ERR_SUCCESS) {
        std::string reason = mosquitto_strerror(result);
        destroyHandleLocked();
        throw TransportError("Failed to start MQTT loop: " + reason);
    }

    bool acknowledged = false;
    int connack = -1;
    {
        std::unique_lock<std::mutex> connack_lock(connack_mutex_);
        acknowledged = connack_cv_.wait_for(connack_lock, options.connect_timeout,
                                            [this]() { return connack_received_; });
        connack = connack_result_;
    }

    if (!acknowledged) {
        destroyHandleLocked();
        throw TransportError("Timed out waiting for broker acknowledgement from " + endpoint.url);
    }
    if (connack != 0) {
        destroyHandleLocked();
        throw TransportError("Broker refused connection: " + std::string(mosquitto_connack_string(connack)));
    }

    connected_ = true;
    spdlog::info("[MqttTransport] Connected to {}:{} (realm {})", address.host, address.port, endpoint.realm);
    return session_id;
}

void MqttTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (mqtt_handle_) {
        destroyHandleLocked();
        spdlog::info("[MqttTransport] Disconnected from broker");
    }
}

bool MqttTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mqtt_handle_ != nullptr && connected_;
}

void MqttTransport::destroyHandleLocked() {
    connected_ = false;
    mosquitto_disconnect(mqtt_handle_);
    mosquitto_loop_stop(mqtt_handle_, true);
    mosquitto_destroy(mqtt_handle_);
    mqtt_handle_ = nullptr;
}

void MqttTransport::subscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mqtt_handle_ || !connected_) {
        throw TransportError("Not connected to broker");
    }

    int result = mosquitto_subscribe(mqtt_handle_, nullptr, topic.c_str(), 1);
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError("Failed to subscribe to topic " + topic + ": " + mosquitto_strerror(result));
    }
    spdlog::debug("[MqttTransport] Subscribed to topic: {}", topic);
}

void MqttTransport::unsubscribe(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mqtt_handle_ || !connected_) {
        throw TransportError("Not connected to broker");
    }

    int result = mosquitto_unsubscribe(mqtt_handle_, nullptr, topic.c_str());
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError("Failed to unsubscribe from topic " + topic + ": " + mosquitto_strerror(result));
    }
    spdlog::debug("[MqttTransport] Unsubscribed from topic: {}", topic);
}

void MqttTransport::publish(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!mqtt_handle_ || !connected_) {
        throw TransportError("Not connected to broker");
    }

    int result = mosquitto_publish(mqtt_handle_, nullptr, topic.c_str(),
                                   static_cast<int>(payload.size()), payload.data(), 1, false);
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError("Failed to publish to topic " + topic + ": " + mosquitto_strerror(result));
    }
}

void MqttTransport::setMessageHandler(MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    message_handler_ = std::move(handler);
}

void MqttTransport::setDisconnectHandler(DisconnectHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    disconnect_handler_ = std::move(handler);
}

void MqttTransport::setupTLS(const TransportOptions& options) {
    const char* ca_file = options.ca_file.empty() ? nullptr : options.ca_file.c_str();
    const char* ca_path = options.ca_file.empty() ? "/etc/ssl/certs" : nullptr;

    int result = mosquitto_tls_set(mqtt_handle_, ca_file, ca_path, nullptr, nullptr, nullptr);
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError(std::string("Failed to set TLS certificates: ") + mosquitto_strerror(result));
    }

    result = mosquitto_tls_opts_set(mqtt_handle_, options.skip_cert_verify ? 0 : 1, "tlsv1.2", nullptr);
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError(std::string("Failed to set TLS options: ") + mosquitto_strerror(result));
    }

    result = mosquitto_tls_insecure_set(mqtt_handle_, options.skip_cert_verify);
    if (result != MOSQ_ERR_SUCCESS) {
        throw TransportError(std::string("Failed to set TLS insecure mode: ") + mosquitto_strerror(result));
    }

    if (options.skip_cert_verify) {
        spdlog::warn("[MqttTransport] TLS certificate verification disabled");
    }
}

void MqttTransport::handleConnack(int result) {
    {
        std::lock_guard<std::mutex> lock(connack_mutex_);
        connack_received_ = true;
        connack_result_ = result;
    }
    connack_cv_.notify_all();
}

void MqttTransport::handleDisconnect(int reason) {
    bool was_connected = connected_.exchange(false);

    // reason 0 means we asked for it
    if (reason == 0 || !was_connected) {
        return;
    }

    spdlog::warn("[MqttTransport] Connection to broker lost: {}", mosquitto_strerror(reason));

    DisconnectHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = disconnect_handler_;
    }
    if (handler) {
        handler();
    }
}

void MqttTransport::handleMessage(const std::string& topic, const std::string& payload) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = message_handler_;
    }
    if (!handler) {
        return;
    }

    // Runs inside libmosquitto's C callback; nothing may propagate out of it.
    try {
        handler(topic, payload);
    } catch (const std::exception& e) {
        spdlog::error("[MqttTransport] Failed to handle message on {}: {}", topic, e.what());
    }
}
