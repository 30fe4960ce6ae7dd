/**
 * @file eviction_sweeper.cpp
 * @brief EvictionSweeper implementation.
 */

#include "matchmaker/eviction_sweeper.hpp"

namespace game_factory {

EvictionSweeper::EvictionSweeper(LivenessRegistry& registry,
                                 Duration interval,
                                 Logger& logger,
                                 MetricsCollector& metrics)
    : registry_(registry)
    , logger_(logger)
    , metrics_(metrics)
    , task_("liveness-sweeper", interval, [this] { sweep_once(); }, logger) {}

size_t EvictionSweeper::sweep_once() {
    auto evicted = registry_.sweep();
    for (const auto& id : evicted) {
        metrics_.record_liveness_eviction(id);
        logger_.info("Matchmaker: evicted stale server " + id);
    }
    if (!evicted.empty()) {
        total_evicted_.fetch_add(evicted.size());
        logger_.info("Matchmaker: sweep removed " + std::to_string(evicted.size())
                     + " server(s), " + std::to_string(registry_.size()) + " remaining");
    }
    return evicted.size();
}

}  // namespace game_factory
