/**
 * @file admission_controller.hpp
 * @brief Advisory admission control for new provisioning attempts.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "registry/server_registry.hpp"

#include <functional>
#include <string>

namespace game_factory {

struct AdmissionDecision {
    bool allowed{true};
    std::string reason;
};

/**
 * @brief The {can_admit} capability the provisioning pipeline depends on.
 */
class IAdmissionPolicy {
public:
    virtual ~IAdmissionPolicy() = default;
    [[nodiscard]] virtual AdmissionDecision can_admit() const = 0;
};

/// Reads the current host snapshot.
using HostProbe = std::function<Result<ResourceSnapshot>()>;

/**
 * @brief Adapt any ResourceMonitorLike to a HostProbe.
 *
 * The monitor must outlive the returned probe.
 */
template <ResourceMonitorLike M>
HostProbe host_probe_for(M& monitor) {
    return [&monitor]() { return monitor.read(); };
}

/**
 * @brief Compares current totals against configured ceilings.
 *
 * Checks, in order: active container count, host CPU, host memory, and
 * when enabled the aggregate per-container reservations. It never
 * reserves anything. A failed host read skips the host checks.
 */
class AdmissionController : public IAdmissionPolicy {
public:
    AdmissionController(AdmissionConfig config,
                        const ServerRegistry& registry,
                        HostProbe host_probe,
                        Logger& logger);

    [[nodiscard]] AdmissionDecision can_admit() const override;

    [[nodiscard]] const AdmissionConfig& config() const noexcept { return config_; }

private:
    AdmissionConfig config_;
    const ServerRegistry& registry_;
    HostProbe host_probe_;
    Logger& logger_;
};

}  // namespace game_factory
