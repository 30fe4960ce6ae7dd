/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for GameServerFactory interfaces.
 *
 * Host monitors are sampled on every admission decision, so they are bound
 * statically through a concept instead of a virtual interface.
 */

#pragma once

#include "core/types.hpp"
#include "core/result.hpp"

#include <concepts>

namespace game_factory {

// ─────────────────────────────────────────────
// ResourceMonitorLike
// ─────────────────────────────────────────────

/**
 * @concept ResourceMonitorLike
 * @brief Constrains types that can provide host resource snapshots.
 */
template <typename T>
concept ResourceMonitorLike = requires(T monitor) {
    { monitor.read() } -> std::same_as<Result<ResourceSnapshot>>;
    { monitor.cpu_usage() } -> std::convertible_to<float>;
    { monitor.memory_available() } -> std::convertible_to<uint64_t>;
    { monitor.start() } -> std::same_as<void>;
    { monitor.stop() } -> std::same_as<void>;
};

}  // namespace game_factory
