#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class MetricsCollector;

// Board-type specific behaviour behind DeviceInfo/DeviceStatus.
class Device {
public:
    virtual ~Device() = default;

    virtual std::string identify() const = 0;
    virtual nlohmann::json describe() const = 0;
    virtual nlohmann::json healthCheck() = 0;
};

class GenericDevice : public Device {
public:
    GenericDevice(const std::string& type, MetricsCollector& metrics);

    std::string identify() const override { return type_; }
    nlohmann::json describe() const override;
    nlohmann::json healthCheck() override;

protected:
    std::string type_;
    MetricsCollector& metrics_;
};

// Single-board computers exposing their model through the device tree
// (Raspberry Pi, Jetson, RK3588 boards).
class DeviceTreeDevice : public GenericDevice {
public:
    DeviceTreeDevice(const std::string& type, MetricsCollector& metrics,
                     const std::string& model_path = "/proc/device-tree/model");

    nlohmann::json describe() const override;

private:
    std::string model_path_;
};

// Maps board types to Device implementations; unknown types get a
// GenericDevice.
class DeviceRegistry {
public:
    using Factory = std::function<std::unique_ptr<Device>(const std::string& type, MetricsCollector& metrics)>;

    DeviceRegistry();

    void add(const std::string& type, Factory factory);
    bool contains(const std::string& type) const;
    std::vector<std::string> types() const;

    std::unique_ptr<Device> create(const std::string& type, MetricsCollector& metrics) const;

private:
    std::map<std::string, Factory> factories_;
};

std::string hostName();
