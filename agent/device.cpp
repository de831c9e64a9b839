#include "device.h"
#include "metrics_collector.h"
#include <fstream>
#include <iterator>
#include <unistd.h>

std::string hostName() {
    char buffer[256];
    if (gethostname(buffer, sizeof(buffer)) != 0) {
        return "unknown";
    }
    buffer[sizeof(buffer) - 1] = '\0';
    return buffer;
}

GenericDevice::GenericDevice(const std::string& type, MetricsCollector& metrics)
    : type_(type)
    , metrics_(metrics) {
}

nlohmann::json GenericDevice::describe() const {
    return {
        {"type", type_},
        {"hostname", hostName()}
    };
}

nlohmann::json GenericDevice::healthCheck() {
    nlohmann::json metrics = metrics_.collectSystemMetrics();

    nlohmann::json status;
    status["status"] = "online";
    status["health"] = metrics_.determineSystemStatus(metrics.value("cpu_pct", 0.0),
                                                      metrics.value("mem_pct", 0.0),
                                                      metrics.value("disk_pct", 0.0));
    status["uptime"] = metrics.value("uptime_s", 0.0);
    status["metrics"] = metrics;
    return status;
}

DeviceTreeDevice::DeviceTreeDevice(const std::string& type, MetricsCollector& metrics, const std::string& model_path)
    : GenericDevice(type, metrics)
    , model_path_(model_path) {
}

nlohmann::json DeviceTreeDevice::describe() const {
    nlohmann::json info = GenericDevice::describe();

    std::ifstream file(model_path_);
    if (file.is_open()) {
        std::string model((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        // device-tree strings are NUL terminated
        while (!model.empty() && (model.back() == '\0' || model.back() == '\n')) {
            model.pop_back();
        }
        info["model"] = model;
    }
    return info;
}

DeviceRegistry::DeviceRegistry() {
    auto device_tree = [](const std::string& type, MetricsCollector& metrics) -> std::unique_ptr<Device> {
        return std::make_unique<DeviceTreeDevice>(type, metrics);
    };
    add("raspberry", device_tree);
    add("jetson", device_tree);
    add("rk3588", device_tree);
}

void DeviceRegistry::add(const std::string& type, Factory factory) {
    factories_[type] = std::move(factory);
}

bool DeviceRegistry::contains(const std::string& type) const {
    return factories_.count(type) > 0;
}

std::vector<std::string> DeviceRegistry::types() const {
    std::vector<std::string> types;
    for (const auto& factory : factories_) {
        types.push_back(factory.first);
    }
    return types;
}

std::unique_ptr<Device> DeviceRegistry::create(const std::string& type, MetricsCollector& metrics) const {
    auto it = factories_.find(type);
    if (it == factories_.end()) {
        return std::make_unique<GenericDevice>(type, metrics);
    }
    return it->second(type, metrics);
}
