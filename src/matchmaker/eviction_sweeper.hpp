/**
 * @file eviction_sweeper.hpp
 * @brief Background removal of lapsed matchmaker entries.
 */

#pragma once

#include "core/logger.hpp"
#include "executor/periodic_task.hpp"
#include "matchmaker/liveness_registry.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>

namespace game_factory {

class EvictionSweeper {
public:
    EvictionSweeper(LivenessRegistry& registry,
                    Duration interval,
                    Logger& logger,
                    MetricsCollector& metrics);

    void start() { task_.start(); }
    void stop() { task_.stop(); }

    /// One sweep on the calling thread; returns the number of evicted entries.
    size_t sweep_once();

    [[nodiscard]] bool running() const noexcept { return task_.running(); }
    [[nodiscard]] uint64_t total_evicted() const noexcept { return total_evicted_.load(); }
    [[nodiscard]] uint64_t sweeps() const noexcept { return task_.ticks(); }

private:
    LivenessRegistry& registry_;
    Logger& logger_;
    MetricsCollector& metrics_;
    std::atomic<uint64_t> total_evicted_{0};
    PeriodicTask task_;     // last: joins before the members above go away
};

}  // namespace game_factory
