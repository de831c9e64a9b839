#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "board.h"

struct TransportOptions {
    bool skip_cert_verify = true;
    std::string ca_file;
    std::chrono::milliseconds connect_timeout{10000};
};

// Message-oriented link to the control plane. open() returns the
// identifier of the new session; every successful open yields a new one.
class Transport {
public:
    using MessageHandler = std::function<void(const std::string& topic, const std::string& payload)>;
    using DisconnectHandler = std::function<void()>;

    virtual ~Transport() = default;

    // Throws TransportError on failure.
    virtual std::string open(const ControlPlaneEndpoint& endpoint, const TransportOptions& options) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Throw TransportError on failure.
    virtual void subscribe(const std::string& topic) = 0;
    virtual void unsubscribe(const std::string& topic) = 0;
    virtual void publish(const std::string& topic, const std::string& payload) = 0;

    // Handlers are invoked from the transport's own network thread.
    virtual void setMessageHandler(MessageHandler handler) = 0;
    virtual void setDisconnectHandler(DisconnectHandler handler) = 0;
};
