/**
 * @file admission_controller.cpp
 * @brief AdmissionController implementation.
 */

#include "provisioning/admission_controller.hpp"

#include <cstdio>

namespace game_factory {

namespace {

std::string percent(float value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", static_cast<double>(value));
    return buf;
}

}  // anonymous namespace

AdmissionController::AdmissionController(AdmissionConfig config,
                                         const ServerRegistry& registry,
                                         HostProbe host_probe,
                                         Logger& logger)
    : config_(config)
    , registry_(registry)
    , host_probe_(std::move(host_probe))
    , logger_(logger) {}

AdmissionDecision AdmissionController::can_admit() const {
    auto active = registry_.active_count();
    if (active >= config_.max_containers) {
        return {false, "Maximum container limit reached (" + std::to_string(active)
                       + "/" + std::to_string(config_.max_containers) + ")"};
    }

    if (!host_probe_) {
        return {true, "OK"};
    }

    auto snapshot = host_probe_();
    if (!snapshot) {
        logger_.warn("Admission: host resources unavailable, skipping host checks: "
                     + snapshot.error().message);
        return {true, "OK"};
    }

    if (snapshot->cpu_usage_percent > config_.max_cpu_percent) {
        return {false, "CPU usage too high (" + percent(snapshot->cpu_usage_percent) + ")"};
    }

    float memory_used = snapshot->memory_usage_percent();
    if (memory_used > config_.max_memory_percent) {
        return {false, "Memory usage too high (" + percent(memory_used) + ")"};
    }

    // Reservations count the new container too.
    auto projected = static_cast<float>(active + 1);
    if (config_.cpu_reservation_percent > 0.0f) {
        float reserved = projected * config_.cpu_reservation_percent;
        if (reserved > config_.max_cpu_percent) {
            return {false, "CPU reservation exceeded (" + percent(reserved) + " reserved)"};
        }
    }

    if (config_.memory_reservation_mb > 0 && snapshot->memory_total_bytes > 0) {
        uint64_t reserved_bytes = static_cast<uint64_t>(active + 1)
                                  * config_.memory_reservation_mb * 1024ULL * 1024ULL;
        auto reserved_pct = 100.0f * static_cast<float>(reserved_bytes)
                            / static_cast<float>(snapshot->memory_total_bytes);
        if (reserved_pct > config_.max_memory_percent) {
            return {false, "Memory reservation exceeded (" + percent(reserved_pct) + " reserved)"};
        }
    }

    return {true, "OK"};
}

}  // namespace game_factory
