/**
 * @file provisioning_pipeline.cpp
 * @brief ProvisioningPipeline implementation.
 */

#include "provisioning/provisioning_pipeline.hpp"

#include "core/id.hpp"

#include <algorithm>
#include <chrono>

namespace game_factory {

namespace {

Duration elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - start);
}

std::vector<std::string> last_n(const std::vector<std::string>& lines, size_t n) {
    if (lines.size() <= n) return lines;
    return std::vector<std::string>(lines.end() - static_cast<std::ptrdiff_t>(n), lines.end());
}

}  // anonymous namespace

PipelineOptions pipeline_options_from(const Config& config) {
    PipelineOptions options;
    options.max_code_bytes = config.factory.max_code_bytes;
    options.log_tail_lines = config.factory.log_tail_lines;
    options.reject_unsafe_code = config.factory.reject_unsafe_code;
    options.idle_timeout = Duration{config.factory.idle_timeout_ms};
    options.scaffold.image_prefix = config.runtime.image_prefix;
    options.scaffold.container_port = config.runtime.container_port;
    options.scaffold.matchmaker_url = config.factory.matchmaker_url;
    options.scaffold.network = config.runtime.network;
    options.scaffold.max_players = config.matchmaker.default_max_players;
    return options;
}

ProvisioningPipeline::ProvisioningPipeline(PipelineOptions options,
                                           ServerRegistry& registry,
                                           PortAllocator& ports,
                                           const IAdmissionPolicy& admission,
                                           IContainerRuntime& runtime,
                                           const IClock& clock,
                                           Logger& logger,
                                           MetricsCollector& metrics)
    : options_(std::move(options))
    , registry_(registry)
    , ports_(ports)
    , admission_(admission)
    , runtime_(runtime)
    , clock_(clock)
    , logger_(logger)
    , metrics_(metrics) {}

// ─────────────────────────────────────────────
// Provision
// ─────────────────────────────────────────────

Result<void> ProvisioningPipeline::validate(std::string_view user_code,
                                            const std::string& name) const {
    if (user_code.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return Error{ErrorCode::InvalidInput, "User code is empty"};
    }
    if (user_code.size() > options_.max_code_bytes) {
        return Error{ErrorCode::InvalidInput,
                     "User code too large (" + std::to_string(user_code.size()) + " > "
                     + std::to_string(options_.max_code_bytes) + " bytes)"};
    }
    if (name.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Error{ErrorCode::InvalidInput, "Server name is empty"};
    }

    auto report = inspector_.inspect(user_code);
    for (const auto& issue : report.issues) {
        logger_.debug("Code inspection: line " + std::to_string(issue.line) + " ["
                      + std::string(to_string(issue.severity)) + "] " + issue.message);
    }
    if (!report.is_valid()) {
        if (options_.reject_unsafe_code) {
            return Error{ErrorCode::InvalidInput, "Code rejected: " + report.summary()};
        }
        logger_.warn("Code inspection failed but unsafe code is allowed: " + report.summary());
    }
    return Result<void>{};
}

Result<GameServerInstance> ProvisioningPipeline::provision(std::string_view user_code,
                                                           std::string name,
                                                           std::string description) {
    auto started = std::chrono::steady_clock::now();
    const std::string label = name;
    auto fail = [&](Error error) -> Result<GameServerInstance> {
        metrics_.record_provision_failure(error.code, elapsed_since(started));
        logger_.warn("Provision '" + label + "' failed [" + std::string(to_string(error.code))
                     + "]: " + error.message);
        return error;
    };

    // 1. Validate
    if (auto valid = validate(user_code, name); !valid) {
        return fail(valid.error());
    }

    // 2. Admission
    auto decision = admission_.can_admit();
    if (!decision.allowed) {
        metrics_.record_admission_denied(decision.reason);
        return fail(Error{ErrorCode::ResourceExhausted, decision.reason});
    }

    // 3. Scaffold
    auto server_id = generate_short_id("");
    while (registry_.contains(server_id)) {
        server_id = generate_short_id("");
    }
    auto descriptor = make_build_descriptor(server_id, name, user_code, options_.scaffold);

    // 4. Build
    logger_.info("Building image " + descriptor.image_tag + " for '" + name + "'");
    auto image = runtime_.build_image(descriptor);
    if (!image) {
        return fail(Error{ErrorCode::BuildFailed, image.error().message});
    }

    // 5. Port
    auto port = ports_.allocate();
    if (!port) {
        discard_image(*image, server_id);
        return fail(port.error());
    }

    // 6. Launch
    auto run_options = make_run_options(server_id, name, options_.scaffold);
    run_options.env["SERVER_ID"] = server_id;
    run_options.env["PUBLIC_PORT"] = std::to_string(*port);

    auto container = runtime_.run_container(
        *image, PortBinding{.host_port = *port, .container_port = options_.scaffold.container_port},
        run_options);
    if (!container) {
        ports_.release(*port);
        discard_image(*image, server_id);
        return fail(Error{ErrorCode::LaunchFailed, container.error().message});
    }

    // 7. Register
    GameServerInstance instance;
    instance.server_id = server_id;
    instance.name = std::move(name);
    instance.description = std::move(description);
    instance.status = InstanceStatus::Running;
    instance.container_ref = *container;
    instance.image_ref = *image;
    instance.port = *port;
    instance.last_activity = clock_.now();

    if (auto inserted = registry_.insert(instance); !inserted) {
        if (auto removed = runtime_.remove(*container); !removed) {
            logger_.error("Could not remove orphaned container " + *container + ": "
                          + removed.error().message);
        }
        ports_.release(*port);
        discard_image(*image, server_id);
        return fail(inserted.error());
    }

    auto stored = registry_.get(server_id);
    if (!stored) {
        return fail(stored.error());
    }

    metrics_.record_provision_success(server_id, *port, elapsed_since(started));
    metrics_.record_status_change(server_id, InstanceStatus::Provisioning, InstanceStatus::Running);
    logger_.info("Provisioned " + server_id + " ('" + stored->name + "') on port "
                 + std::to_string(*port) + " container=" + container->substr(0, 12));
    return stored;
}

void ProvisioningPipeline::discard_image(const ImageRef& image, const ServerId& id) {
    if (auto removed = runtime_.remove_image(image); !removed) {
        logger_.warn("Could not remove image " + image + " of " + id + ": "
                     + removed.error().message);
    }
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<GameServerInstance> ProvisioningPipeline::stop(const ServerId& id) {
    auto current = registry_.get(id);
    if (!current) {
        return current.error();
    }
    if (current->status != InstanceStatus::Running || !current->container_ref) {
        return current;
    }

    const auto& container = *current->container_ref;
    if (auto stopped = runtime_.stop(container); !stopped) {
        // Already exited or gone counts as stopped.
        auto state = runtime_.state(container);
        if (!state || *state == ContainerState::Running || *state == ContainerState::Unknown) {
            logger_.warn("Stop " + id + " failed: " + stopped.error().message);
            return Error{ErrorCode::RuntimeUnavailable, stopped.error().message};
        }
    }

    bool changed = false;
    auto updated = registry_.update(id, [&](GameServerInstance& inst) {
        if (inst.status == InstanceStatus::Running) {
            inst.status = InstanceStatus::Stopped;
            changed = true;
        }
    });
    if (!updated) {
        return updated.error();
    }

    if (changed) {
        metrics_.record_status_change(id, InstanceStatus::Running, InstanceStatus::Stopped);
        logger_.info("Stopped " + id);
    }
    return updated;
}

Result<void> ProvisioningPipeline::remove(const ServerId& id) {
    auto current = registry_.get(id);
    if (!current) {
        return current.error();
    }

    if (current->container_ref) {
        const auto& container = *current->container_ref;
        if (current->status == InstanceStatus::Running) {
            if (auto stopped = runtime_.stop(container); !stopped) {
                logger_.warn("Stop before remove of " + id + " failed: "
                             + stopped.error().message);
            }
        }
        if (auto removed = runtime_.remove(container); !removed) {
            logger_.error("Remove " + id + " failed: " + removed.error().message);
            return Error{ErrorCode::RuntimeUnavailable, removed.error().message};
        }
    }
    if (current->image_ref) {
        discard_image(*current->image_ref, id);
    }

    if (auto erased = registry_.erase(id); !erased) {
        return erased;
    }
    if (current->port) {
        ports_.release(*current->port);
    }

    metrics_.record_status_change(id, current->status, InstanceStatus::Removed);
    logger_.info("Removed " + id);
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Observation
// ─────────────────────────────────────────────

Result<ResourceUsage> ProvisioningPipeline::refresh_stats(const ServerId& id) {
    auto current = registry_.get(id);
    if (!current) {
        return current.error();
    }
    if (!current->container_ref) {
        return current->resource_usage;
    }

    auto usage = runtime_.stats(*current->container_ref);
    if (!usage) {
        logger_.debug("Stats for " + id + " unavailable, serving cached: "
                      + usage.error().message);
        return current->resource_usage;
    }

    auto fresh = *usage;
    fresh.observed_at = clock_.now();
    auto updated = registry_.update(id, [&](GameServerInstance& inst) {
        inst.resource_usage = fresh;
    });
    if (!updated) {
        logger_.debug("Server " + id + " removed while refreshing stats");
    }
    return fresh;
}

Result<std::vector<std::string>> ProvisioningPipeline::fetch_logs(const ServerId& id,
                                                                 uint32_t tail) {
    auto current = registry_.get(id);
    if (!current) {
        return current.error();
    }
    if (!current->container_ref) {
        return last_n(current->logs, tail);
    }

    auto lines = runtime_.logs(*current->container_ref,
                               std::max(tail, options_.log_tail_lines));
    if (!lines) {
        logger_.debug("Logs for " + id + " unavailable, serving cached: "
                      + lines.error().message);
        return last_n(current->logs, tail);
    }

    auto retained = retain_tail(*lines);
    auto updated = registry_.update(id, [&](GameServerInstance& inst) {
        inst.logs = retained;
    });
    if (!updated) {
        logger_.debug("Server " + id + " removed while fetching logs");
    }
    return last_n(*lines, tail);
}

std::vector<std::string> ProvisioningPipeline::retain_tail(std::vector<std::string> lines) const {
    if (lines.size() > options_.log_tail_lines) {
        lines.erase(lines.begin(),
                    lines.end() - static_cast<std::ptrdiff_t>(options_.log_tail_lines));
    }
    return lines;
}

Result<GameServerInstance> ProvisioningPipeline::refresh_status(const ServerId& id) {
    auto current = registry_.get(id);
    if (!current) {
        return current.error();
    }
    if (current->status != InstanceStatus::Running || !current->container_ref) {
        return current;
    }

    const auto& container = *current->container_ref;
    auto state = runtime_.state(container);
    if (!state) {
        logger_.debug("State of " + id + " unavailable: " + state.error().message);
        return current;
    }
    if (*state != ContainerState::Exited && *state != ContainerState::Missing) {
        return current;
    }

    std::optional<std::vector<std::string>> last_logs;
    if (*state == ContainerState::Exited) {
        if (auto lines = runtime_.logs(container, options_.log_tail_lines)) {
            last_logs = retain_tail(*lines);
        }
    }

    bool changed = false;
    auto updated = registry_.update(id, [&](GameServerInstance& inst) {
        if (inst.status != InstanceStatus::Running) return;
        inst.status = InstanceStatus::Error;
        if (last_logs) inst.logs = *last_logs;
        changed = true;
    });
    if (!updated) {
        return updated.error();
    }

    if (changed) {
        metrics_.record_status_change(id, InstanceStatus::Running, InstanceStatus::Error);
        logger_.warn("Server " + id + " container " + std::string(to_string(*state))
                     + ", marked error");
    }
    return updated;
}

size_t ProvisioningPipeline::refresh_all() {
    size_t failed = 0;
    for (const auto& inst : registry_.list(InstanceStatus::Running)) {
        auto refreshed = refresh_status(inst.server_id);
        if (refreshed && refreshed->status == InstanceStatus::Error) {
            ++failed;
        }
    }
    return failed;
}

// ─────────────────────────────────────────────
// Idle reaping
// ─────────────────────────────────────────────

Result<GameServerInstance> ProvisioningPipeline::record_activity(const ServerId& id,
                                                                 uint32_t connections) {
    auto now = clock_.now();
    return registry_.update(id, [&](GameServerInstance& inst) {
        inst.last_activity = now;
        inst.connection_count = connections;
    });
}

std::vector<GameServerInstance> ProvisioningPipeline::idle_instances() const {
    auto now = clock_.now();
    std::vector<GameServerInstance> idle;
    for (auto& inst : registry_.list(InstanceStatus::Running)) {
        if (inst.connection_count == 0 && now - inst.last_activity > options_.idle_timeout) {
            idle.push_back(std::move(inst));
        }
    }
    return idle;
}

size_t ProvisioningPipeline::stop_idle() {
    size_t stopped = 0;
    for (const auto& inst : idle_instances()) {
        auto idle_for = std::chrono::duration_cast<std::chrono::seconds>(
            clock_.now() - inst.last_activity);
        logger_.info("Stopping idle server " + inst.server_id + " (no activity for "
                     + std::to_string(idle_for.count()) + "s)");
        auto result = stop(inst.server_id);
        if (!result) {
            logger_.warn("Idle stop of " + inst.server_id + " failed: " + result.error().message);
            continue;
        }
        if (result->status == InstanceStatus::Stopped) ++stopped;
    }
    return stopped;
}

}  // namespace game_factory
