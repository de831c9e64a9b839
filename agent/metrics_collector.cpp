#include "metrics_collector.h"
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <sys/statvfs.h>

MetricsCollector::MetricsCollector(const std::string& proc_root)
    : proc_root_(proc_root)
    , last_cpu_total_(0)
    , last_cpu_idle_(0) {
}

MetricsCollector::~MetricsCollector() {
}

nlohmann::json MetricsCollector::collectSystemMetrics() {
    nlohmann::json metrics;

    metrics["cpu_pct"] = getCpuUsage();
    metrics["mem_pct"] = getMemoryUsage();
    metrics["disk_pct"] = getDiskUsage("/");
    metrics["uptime_s"] = getUptimeSeconds();
    metrics["timestamp"] = std::time(nullptr);

    return metrics;
}

double MetricsCollector::getCpuUsage() {
    try {
        std::ifstream stat(proc_root_ + "/stat");
        if (!stat.is_open()) {
            throw std::runtime_error("Cannot open " + proc_root_ + "/stat");
        }

        std::string label;
        stat >> label;
        if (label != "cpu") {
            throw std::runtime_error("Unexpected /proc/stat format");
        }

        // user nice system idle iowait irq softirq steal
        uint64_t total = 0;
        uint64_t idle = 0;
        for (int i = 0; i < 8; ++i) {
            uint64_t value = 0;
            if (!(stat >> value)) {
                break;
            }
            total += value;
            if (i == 3 || i == 4) {
                idle += value;
            }
        }

        std::lock_guard<std::mutex> lock(cpu_mutex_);
        uint64_t total_delta = total - last_cpu_total_;
        uint64_t idle_delta = idle - last_cpu_idle_;
        last_cpu_total_ = total;
        last_cpu_idle_ = idle;

        if (total_delta == 0) {
            return 0.0;
        }
        return (static_cast<double>(total_delta - idle_delta) / total_delta) * 100.0;
    } catch (const std::exception& e) {
        spdlog::warn("[MetricsCollector] Error getting CPU usage: {}", e.what());
    }

    return 0.0;
}

double MetricsCollector::getMemoryUsage() {
    try {
        std::ifstream meminfo(proc_root_ + "/meminfo");
        if (!meminfo.is_open()) {
            throw std::runtime_error("Cannot open " + proc_root_ + "/meminfo");
        }

        std::string line;
        long mem_total = 0, mem_available = 0;

        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string label;
            long value = 0;
            iss >> label >> value;

            if (label == "MemTotal:") {
                mem_total = value;
            } else if (label == "MemAvailable:") {
                mem_available = value;
            }

            if (mem_total > 0 && mem_available > 0) {
                break;
            }
        }

        if (mem_total > 0) {
            return ((double)(mem_total - mem_available) / mem_total) * 100.0;
        }
    } catch (const std::exception& e) {
        spdlog::warn("[MetricsCollector] Error getting memory usage: {}", e.what());
    }

    return 0.0;
}

double MetricsCollector::getDiskUsage(const std::string& path) {
    struct statvfs fs_stat;
    if (statvfs(path.c_str(), &fs_stat) != 0) {
        spdlog::warn("[MetricsCollector] Error getting disk usage for {}", path);
        return 0.0;
    }

    double total = static_cast<double>(fs_stat.f_blocks) * fs_stat.f_frsize;
    double available = static_cast<double>(fs_stat.f_bavail) * fs_stat.f_frsize;
    if (total <= 0) {
        return 0.0;
    }
    return ((total - available) / total) * 100.0;
}

double MetricsCollector::getUptimeSeconds() {
    std::ifstream uptime(proc_root_ + "/uptime");
    double seconds = 0.0;
    if (!uptime.is_open() || !(uptime >> seconds)) {
        spdlog::warn("[MetricsCollector] Cannot read {}/uptime", proc_root_);
        return 0.0;
    }
    return seconds;
}

std::string MetricsCollector::determineSystemStatus(double cpu_pct, double mem_pct, double disk_pct) const {
    if (cpu_pct > CPU_THRESHOLD ||
        mem_pct > MEMORY_THRESHOLD ||
        disk_pct > DISK_THRESHOLD) {
        return "degraded";
    }

    return "normal";
}
