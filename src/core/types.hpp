/**
 * @file types.hpp
 * @brief Fundamental types used throughout GameServerFactory.
 *
 * Defines ServerId, InstanceStatus, ResourceUsage, ResourceSnapshot and the
 * other shared vocabulary types. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace game_factory {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ServerId = std::string;
using HostId = std::string;
using ImageRef = std::string;
using ContainerRef = std::string;
using Port = uint16_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ─────────────────────────────────────────────
// Host Resource Snapshot
// ─────────────────────────────────────────────

/**
 * @brief A point-in-time snapshot of the host's CPU and memory.
 *
 * Read from /proc by LinuxMonitor and consulted by the admission controller
 * before every provisioning attempt.
 */
struct ResourceSnapshot {
    HostId host_id;
    Timestamp timestamp;

    float cpu_usage_percent{0.0f};                    ///< Aggregate CPU [0.0, 100.0]
    uint64_t memory_available_bytes{0};
    uint64_t memory_total_bytes{0};

    [[nodiscard]] constexpr float memory_usage_percent() const noexcept {
        if (memory_total_bytes == 0) return 0.0f;
        return 100.0f * static_cast<float>(memory_total_bytes - memory_available_bytes)
               / static_cast<float>(memory_total_bytes);
    }
};

// ─────────────────────────────────────────────
// Container Resource Usage
// ─────────────────────────────────────────────

/**
 * @brief Last observed usage of a single container.
 *
 * Refreshed on demand from the container runtime, never continuously.
 */
struct ResourceUsage {
    float cpu_percent{0.0f};
    double memory_mb{0.0};
    double memory_limit_mb{0.0};
    double network_rx_mb{0.0};
    double network_tx_mb{0.0};
    std::optional<Timestamp> observed_at;
};

// ─────────────────────────────────────────────
// Instance Status
// ─────────────────────────────────────────────

/**
 * @brief Lifecycle of a provisioned game server.
 *
 * provisioning -> running -> (stopped | error) -> removed.
 * There is no restart edge; a new instance must be provisioned.
 */
enum class InstanceStatus : uint8_t {
    Provisioning,
    Running,
    Stopped,
    Error,
    Removed
};

[[nodiscard]] constexpr std::string_view to_string(InstanceStatus status) noexcept {
    switch (status) {
        case InstanceStatus::Provisioning: return "provisioning";
        case InstanceStatus::Running:      return "running";
        case InstanceStatus::Stopped:      return "stopped";
        case InstanceStatus::Error:        return "error";
        case InstanceStatus::Removed:      return "removed";
    }
    return "unknown";
}

/// Statuses counted against admission ceilings and port uniqueness.
[[nodiscard]] constexpr bool is_active(InstanceStatus status) noexcept {
    return status == InstanceStatus::Provisioning || status == InstanceStatus::Running;
}

/**
 * @brief Whether the state machine permits moving from @p from to @p to.
 */
[[nodiscard]] constexpr bool is_valid_transition(InstanceStatus from, InstanceStatus to) noexcept {
    switch (from) {
        case InstanceStatus::Provisioning:
            return to == InstanceStatus::Running || to == InstanceStatus::Removed;
        case InstanceStatus::Running:
            return to == InstanceStatus::Stopped || to == InstanceStatus::Error
                || to == InstanceStatus::Removed;
        case InstanceStatus::Stopped:
        case InstanceStatus::Error:
            return to == InstanceStatus::Removed;
        case InstanceStatus::Removed:
            return false;
    }
    return false;
}

}  // namespace game_factory
