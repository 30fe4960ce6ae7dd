/**
 * @file provisioning_pipeline.hpp
 * @brief validate -> admit -> build -> allocate port -> launch -> register.
 *
 * Every container runtime call happens before the registry lock is taken;
 * the registry only ever sees finished outcomes. Each failure path undoes
 * what the attempt already did (port lease, built image), so a failed
 * provision leaves no record and no leased port behind.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "provisioning/admission_controller.hpp"
#include "provisioning/code_inspector.hpp"
#include "provisioning/port_allocator.hpp"
#include "provisioning/scaffold.hpp"
#include "registry/server_registry.hpp"
#include "runtime/container_runtime.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace game_factory {

struct PipelineOptions {
    uint64_t max_code_bytes = 1048576;
    uint32_t log_tail_lines = 200;
    bool reject_unsafe_code = true;
    Duration idle_timeout{std::chrono::minutes(30)};
    ScaffoldOptions scaffold;
};

/// Derive pipeline options from the [factory], [runtime] and [matchmaker] tables.
[[nodiscard]] PipelineOptions pipeline_options_from(const Config& config);

class ProvisioningPipeline {
public:
    ProvisioningPipeline(PipelineOptions options,
                         ServerRegistry& registry,
                         PortAllocator& ports,
                         const IAdmissionPolicy& admission,
                         IContainerRuntime& runtime,
                         const IClock& clock,
                         Logger& logger,
                         MetricsCollector& metrics);

    ProvisioningPipeline(const ProvisioningPipeline&) = delete;
    ProvisioningPipeline& operator=(const ProvisioningPipeline&) = delete;

    /**
     * @brief Turn @p user_code into a running game server.
     *
     * Errors: InvalidInput (empty, oversized or rejected code, empty name),
     * ResourceExhausted (admission denied), BuildFailed, NoPortAvailable,
     * LaunchFailed.
     */
    Result<GameServerInstance> provision(std::string_view user_code,
                                         std::string name,
                                         std::string description);

    /// Stop the container; a no-op success when it is no longer running.
    Result<GameServerInstance> stop(const ServerId& id);

    /// Stop if running, delete container and image, release the port, drop the record.
    Result<void> remove(const ServerId& id);

    /// Live stats, or the cached snapshot when the runtime cannot answer.
    Result<ResourceUsage> refresh_stats(const ServerId& id);

    /// Live log tail, or the cached tail when the runtime cannot answer.
    Result<std::vector<std::string>> fetch_logs(const ServerId& id, uint32_t tail);

    /**
     * @brief Detect a crashed container.
     *
     * A running instance whose container has exited or vanished moves to
     * error, keeping the last log lines. Runtime failures leave the status
     * untouched.
     */
    Result<GameServerInstance> refresh_status(const ServerId& id);

    /// refresh_status() over every running instance; returns how many moved to error.
    size_t refresh_all();

    /// Record that @p id reported activity with @p connections players attached.
    Result<GameServerInstance> record_activity(const ServerId& id, uint32_t connections);

    /// Running instances with no connections and no activity for longer than idle_timeout.
    [[nodiscard]] std::vector<GameServerInstance> idle_instances() const;

    /// stop() every idle instance; returns how many were stopped.
    size_t stop_idle();

    [[nodiscard]] const PipelineOptions& options() const noexcept { return options_; }

private:
    Result<void> validate(std::string_view user_code, const std::string& name) const;
    void discard_image(const ImageRef& image, const ServerId& id);
    [[nodiscard]] std::vector<std::string> retain_tail(std::vector<std::string> lines) const;

    PipelineOptions options_;
    ServerRegistry& registry_;
    PortAllocator& ports_;
    const IAdmissionPolicy& admission_;
    IContainerRuntime& runtime_;
    const IClock& clock_;
    Logger& logger_;
    MetricsCollector& metrics_;
    CodeInspector inspector_;
};

}  // namespace game_factory
