#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Host resource figures for the status API and DeviceStatus.
class MetricsCollector {
public:
    explicit MetricsCollector(const std::string& proc_root = "/proc");
    ~MetricsCollector();

    // {cpu_pct, mem_pct, disk_pct, uptime_s, timestamp}
    nlohmann::json collectSystemMetrics();

    // Individual metric collection
    double getCpuUsage();
    double getMemoryUsage();
    double getDiskUsage(const std::string& path = "/");
    double getUptimeSeconds();

    // "degraded" when any figure is above its threshold, else "normal"
    std::string determineSystemStatus(double cpu_pct, double mem_pct, double disk_pct) const;

private:
    std::string proc_root_;

    // Previous /proc/stat sample; CPU usage is the delta between calls
    std::mutex cpu_mutex_;
    uint64_t last_cpu_total_;
    uint64_t last_cpu_idle_;

    static constexpr double CPU_THRESHOLD = 90.0;
    static constexpr double MEMORY_THRESHOLD = 90.0;
    static constexpr double DISK_THRESHOLD = 90.0;
};
