#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include "transport.h"

// Forward declaration
struct mosquitto;

// Transport over an MQTT broker (libmosquitto). Each open() creates a fresh
// client whose random identifier doubles as the session identifier.
class MqttTransport : public Transport {
public:
    MqttTransport();
    ~MqttTransport() override;

    std::string open(const ControlPlaneEndpoint& endpoint, const TransportOptions& options) override;
    void close() override;
    bool isOpen() const override;

    void subscribe(const std::string& topic) override;
    void unsubscribe(const std::string& topic) override;
    void publish(const std::string& topic, const std::string& payload) override;

    void setMessageHandler(MessageHandler handler) override;
    void setDisconnectHandler(DisconnectHandler handler) override;

    struct BrokerAddress {
        std::string host;
        int port = 1883;
        bool tls = false;
    };

    // Accepts mqtt://, tcp:// (plain) and mqtts://, ssl://, tls:// (TLS).
    static BrokerAddress parseBrokerUrl(const std::string& url);

private:
    // Guards the client handle. Never taken from mosquitto callbacks, since
    // close() joins the network thread while holding it.
    mutable std::mutex mutex_;
    struct mosquitto* mqtt_handle_;
    std::atomic<bool> connected_;

    std::mutex handlers_mutex_;
    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;

    std::mutex connack_mutex_;
    std::condition_variable connack_cv_;
    bool connack_received_;
    int connack_result_;

    // Private methods
    void setupTLS(const TransportOptions& options);
    void destroyHandleLocked();
    void handleConnack(int result);
    void handleDisconnect(int reason);
    void handleMessage(const std::string& topic, const std::string& payload);
    static std::string generateSessionId();
};
