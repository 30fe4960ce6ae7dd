/**
 * @file monitor.hpp
 * @brief Host resource monitor implementations.
 *
 * Provides LinuxMonitor (reads from /proc) and MockMonitor (testing).
 * Both satisfy the ResourceMonitorLike concept and feed the admission
 * controller's host CPU and memory checks.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace game_factory {

/**
 * @brief Callback invoked when a resource threshold is crossed.
 */
using ThresholdCallback = std::function<void(const ResourceSnapshot&)>;

// ─────────────────────────────────────────────
// LinuxMonitor
// ─────────────────────────────────────────────

/**
 * @brief Reads host CPU and memory from Linux pseudo-filesystems.
 *
 * Runs a dedicated sampling thread (std::jthread) and publishes the latest
 * snapshot atomically, so admission checks never touch /proc themselves.
 *
 * Data sources:
 *   /proc/stat     aggregate CPU utilization (delta between samples)
 *   /proc/meminfo  MemTotal and MemAvailable
 */
class LinuxMonitor {
public:
    explicit LinuxMonitor(HostId host_id, uint32_t sampling_interval_ms = 1000);
    ~LinuxMonitor();

    // Non-copyable
    LinuxMonitor(const LinuxMonitor&) = delete;
    LinuxMonitor& operator=(const LinuxMonitor&) = delete;

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t memory_available();
    void start();
    void stop();

    // Threshold observers
    void on_cpu_threshold(float percent, ThresholdCallback cb);
    void on_memory_threshold(float percent, ThresholdCallback cb);

    struct CpuTimesInternal {
        uint64_t user{0}, nice{0}, system{0}, idle{0};
        uint64_t iowait{0}, irq{0}, softirq{0}, steal{0};
    };

private:
    void sampling_loop(std::stop_token stop);
    ResourceSnapshot sample_once();
    void check_thresholds(const ResourceSnapshot& snap);

    HostId host_id_;
    uint32_t interval_ms_;
    std::jthread sampling_thread_;
    std::atomic<std::shared_ptr<ResourceSnapshot>> latest_;

    CpuTimesInternal prev_cpu_times_{};

    std::mutex callbacks_mutex_;
    std::vector<std::pair<float, ThresholdCallback>> cpu_callbacks_;
    std::vector<std::pair<float, ThresholdCallback>> memory_callbacks_;
};

// ─────────────────────────────────────────────
// MockMonitor
// ─────────────────────────────────────────────

/**
 * @brief Mock resource monitor for testing and the demo mode.
 *
 * Returns predetermined resource sequences or a static snapshot.
 * Thread-safe, since admission checks run on request threads.
 */
class MockMonitor {
public:
    explicit MockMonitor(HostId host_id, uint32_t sampling_interval_ms = 0);

    // ResourceMonitorLike interface
    Result<ResourceSnapshot> read();
    float cpu_usage();
    uint64_t memory_available();
    void start();
    void stop();

    // Test helpers: configure what snapshots are returned
    void push_snapshot(ResourceSnapshot snapshot);
    void set_static_snapshot(ResourceSnapshot snapshot);
    void set_cpu(float percent);
    void set_memory(uint64_t available, uint64_t total);
    void set_failing(bool failing);

private:
    HostId host_id_;
    mutable std::mutex mutex_;
    std::vector<ResourceSnapshot> sequence_;
    size_t index_{0};
    ResourceSnapshot static_snapshot_;
    bool use_static_{true};
    bool failing_{false};
};

// Verify concept satisfaction at compile time
static_assert(ResourceMonitorLike<LinuxMonitor>);
static_assert(ResourceMonitorLike<MockMonitor>);

}  // namespace game_factory
