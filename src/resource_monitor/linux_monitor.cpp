/**
 * @file linux_monitor.cpp
 * @brief LinuxMonitor: reads CPU and memory metrics from /proc.
 *
 * Sampling is performed by a dedicated std::jthread at a configurable
 * interval. The latest snapshot is published atomically for lock-free reads
 * by the admission controller.
 */

#include "resource_monitor/monitor.hpp"

#include <chrono>
#include <condition_variable>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace game_factory {

using CpuTimes = LinuxMonitor::CpuTimesInternal;

namespace {

std::vector<std::string> read_file_lines(const std::string& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(std::move(line));
    }
    return lines;
}

/**
 * @brief Parse the aggregate CPU line from /proc/stat.
 * Format: "cpu user nice system idle iowait irq softirq steal ..."
 */
CpuTimes parse_cpu_line(const std::string& line) {
    CpuTimes times;
    std::istringstream iss(line);
    std::string label;
    iss >> label >> times.user >> times.nice >> times.system >> times.idle
        >> times.iowait >> times.irq >> times.softirq >> times.steal;
    return times;
}

CpuTimes read_cpu_times() {
    auto lines = read_file_lines("/proc/stat");
    if (lines.empty() || !lines[0].starts_with("cpu ")) return CpuTimes{};
    return parse_cpu_line(lines[0]);
}

float compute_cpu_percent(const CpuTimes& prev, const CpuTimes& curr) {
    auto prev_total = prev.user + prev.nice + prev.system + prev.idle
                    + prev.iowait + prev.irq + prev.softirq + prev.steal;
    auto curr_total = curr.user + curr.nice + curr.system + curr.idle
                    + curr.iowait + curr.irq + curr.softirq + curr.steal;
    auto prev_active = prev.user + prev.nice + prev.system
                     + prev.irq + prev.softirq + prev.steal;
    auto curr_active = curr.user + curr.nice + curr.system
                     + curr.irq + curr.softirq + curr.steal;

    if (curr_total <= prev_total || curr_active < prev_active) return 0.0f;
    uint64_t total_delta = curr_total - prev_total;
    uint64_t active_delta = curr_active - prev_active;
    return 100.0f * static_cast<float>(active_delta) / static_cast<float>(total_delta);
}

struct MemInfo {
    uint64_t total_kb{0};
    uint64_t available_kb{0};
};

MemInfo parse_meminfo() {
    MemInfo info;
    for (const auto& line : read_file_lines("/proc/meminfo")) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            iss >> info.total_kb;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            iss >> info.available_kb;
        }
    }
    return info;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// LinuxMonitor implementation
// ─────────────────────────────────────────────

LinuxMonitor::LinuxMonitor(HostId host_id, uint32_t sampling_interval_ms)
    : host_id_(std::move(host_id)), interval_ms_(sampling_interval_ms) {}

LinuxMonitor::~LinuxMonitor() {
    stop();
}

void LinuxMonitor::start() {
    if (sampling_thread_.joinable()) return;

    prev_cpu_times_ = read_cpu_times();

    // Publish a memory-only snapshot so read() succeeds before the first
    // CPU delta is available.
    auto initial = std::make_shared<ResourceSnapshot>();
    initial->host_id = host_id_;
    initial->timestamp = std::chrono::system_clock::now();
    auto mem = parse_meminfo();
    initial->memory_total_bytes = mem.total_kb * 1024;
    initial->memory_available_bytes = mem.available_kb * 1024;
    latest_.store(initial);

    sampling_thread_ = std::jthread([this](std::stop_token stop) {
        sampling_loop(stop);
    });
}

void LinuxMonitor::stop() {
    if (sampling_thread_.joinable()) {
        sampling_thread_.request_stop();
        sampling_thread_.join();
    }
}

Result<ResourceSnapshot> LinuxMonitor::read() {
    auto snapshot = latest_.load();
    if (!snapshot) {
        return Error{ErrorCode::Internal, "No host snapshot available yet"};
    }
    return *snapshot;
}

float LinuxMonitor::cpu_usage() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->cpu_usage_percent : 0.0f;
}

uint64_t LinuxMonitor::memory_available() {
    auto snapshot = latest_.load();
    return snapshot ? snapshot->memory_available_bytes : 0;
}

void LinuxMonitor::on_cpu_threshold(float percent, ThresholdCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    cpu_callbacks_.push_back({percent, std::move(cb)});
}

void LinuxMonitor::on_memory_threshold(float percent, ThresholdCallback cb) {
    std::lock_guard lock(callbacks_mutex_);
    memory_callbacks_.push_back({percent, std::move(cb)});
}

void LinuxMonitor::sampling_loop(std::stop_token stop) {
    std::mutex wait_mutex;
    std::condition_variable_any wait_cv;

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(wait_mutex);
            wait_cv.wait_for(lock, stop, std::chrono::milliseconds(interval_ms_),
                             [] { return false; });
        }
        if (stop.stop_requested()) break;

        auto snapshot = sample_once();
        latest_.store(std::make_shared<ResourceSnapshot>(snapshot));
        check_thresholds(snapshot);
    }
}

ResourceSnapshot LinuxMonitor::sample_once() {
    ResourceSnapshot snap;
    snap.host_id = host_id_;
    snap.timestamp = std::chrono::system_clock::now();

    auto curr = read_cpu_times();
    snap.cpu_usage_percent = compute_cpu_percent(prev_cpu_times_, curr);
    prev_cpu_times_ = curr;

    auto mem = parse_meminfo();
    snap.memory_total_bytes = mem.total_kb * 1024;
    snap.memory_available_bytes = mem.available_kb * 1024;

    return snap;
}

void LinuxMonitor::check_thresholds(const ResourceSnapshot& snap) {
    std::lock_guard lock(callbacks_mutex_);
    for (const auto& [threshold, cb] : cpu_callbacks_) {
        if (snap.cpu_usage_percent >= threshold) {
            cb(snap);
        }
    }
    for (const auto& [threshold, cb] : memory_callbacks_) {
        if (snap.memory_usage_percent() >= threshold) {
            cb(snap);
        }
    }
}

}  // namespace game_factory
