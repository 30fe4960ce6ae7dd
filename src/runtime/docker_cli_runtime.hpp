/**
 * @file docker_cli_runtime.hpp
 * @brief IContainerRuntime backed by the docker command-line client.
 */

#pragma once

#include "core/config.hpp"
#include "runtime/container_runtime.hpp"
#include "runtime/process.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace game_factory {

/**
 * @brief Drives `docker build/run/stop/rm/rmi/stats/logs/inspect`.
 *
 * Each call spawns one docker process with RuntimeConfig::command_timeout_ms
 * as its deadline. Build contexts are written under RuntimeConfig::work_dir
 * and deleted once the build finishes. The image tag doubles as ImageRef.
 */
class DockerCliRuntime : public IContainerRuntime {
public:
    explicit DockerCliRuntime(RuntimeConfig config);

    /// Create the bridge network containers attach to, if missing.
    Result<void> ensure_network();

    /// `docker version` round trip.
    Result<std::string> server_version();

    Result<ImageRef> build_image(const BuildDescriptor& descriptor) override;
    Result<ContainerRef> run_container(const ImageRef& image,
                                       const PortBinding& binding,
                                       const RunOptions& options) override;
    Result<void> stop(const ContainerRef& container) override;
    Result<void> remove(const ContainerRef& container) override;
    Result<void> remove_image(const ImageRef& image) override;
    Result<ResourceUsage> stats(const ContainerRef& container) override;
    Result<std::vector<std::string>> logs(const ContainerRef& container,
                                          uint32_t tail) override;
    Result<ContainerState> state(const ContainerRef& container) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "docker"; }

private:
    Result<CommandOutput> run(std::vector<std::string> args, ErrorCode failure_code);
    Result<std::filesystem::path> write_context(const BuildDescriptor& descriptor);

    RuntimeConfig config_;
};

/**
 * @brief Parse a docker size string ("12.5MiB", "1.2kB", "3GB") into MB.
 */
double parse_docker_size_mb(std::string_view text);

/**
 * @brief Parse one `docker stats --format "{{.CPUPerc}}|{{.MemUsage}}|{{.NetIO}}"` line.
 */
Result<ResourceUsage> parse_docker_stats_line(std::string_view line);

/**
 * @brief Map `docker inspect -f {{.State.Status}}` output to ContainerState.
 */
ContainerState parse_docker_state(std::string_view status);

}  // namespace game_factory
