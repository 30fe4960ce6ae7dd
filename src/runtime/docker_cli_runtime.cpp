/**
 * @file docker_cli_runtime.cpp
 * @brief DockerCliRuntime implementation.
 */

#include "runtime/docker_cli_runtime.hpp"

#include "core/id.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace game_factory {

namespace {

std::string trim(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(std::move(line));
    }
    return lines;
}

/// Best single-line description of a failed docker command.
std::string failure_detail(const CommandOutput& out) {
    auto err = trim(out.stderr_text);
    if (!err.empty()) return err;
    auto std_out = trim(out.stdout_text);
    if (!std_out.empty()) return std_out;
    return "exit code " + std::to_string(out.exit_code);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Parsing helpers
// ─────────────────────────────────────────────

double parse_docker_size_mb(std::string_view text) {
    auto s = trim(text);
    if (s.empty()) return 0.0;

    size_t pos = 0;
    while (pos < s.size() && (std::isdigit(static_cast<unsigned char>(s[pos])) || s[pos] == '.')) {
        ++pos;
    }
    if (pos == 0) return 0.0;

    double value = std::strtod(s.substr(0, pos).c_str(), nullptr);
    auto unit = trim(s.substr(pos));

    if (unit == "B")                    return value / (1024.0 * 1024.0);
    if (unit == "kB" || unit == "KB")   return value / 1000.0;
    if (unit == "KiB")                  return value / 1024.0;
    if (unit == "MB")                   return value;
    if (unit == "MiB")                  return value;
    if (unit == "GB")                   return value * 1000.0;
    if (unit == "GiB")                  return value * 1024.0;
    if (unit == "TB")                   return value * 1000.0 * 1000.0;
    if (unit == "TiB")                  return value * 1024.0 * 1024.0;
    return value;
}

Result<ResourceUsage> parse_docker_stats_line(std::string_view line) {
    // "0.25%|12.5MiB / 1.944GiB|1.2kB / 3.4kB"
    auto first = line.find('|');
    auto second = first == std::string_view::npos ? first : line.find('|', first + 1);
    if (first == std::string_view::npos || second == std::string_view::npos) {
        return Error{ErrorCode::RuntimeUnavailable,
                     "Unexpected docker stats output: " + std::string{line}};
    }

    ResourceUsage usage;
    auto cpu = trim(line.substr(0, first));
    if (!cpu.empty() && cpu.back() == '%') cpu.pop_back();
    usage.cpu_percent = static_cast<float>(std::strtod(cpu.c_str(), nullptr));

    auto split_pair = [](std::string_view field) -> std::pair<std::string, std::string> {
        auto slash = field.find('/');
        if (slash == std::string_view::npos) return {trim(field), {}};
        return {trim(field.substr(0, slash)), trim(field.substr(slash + 1))};
    };

    auto [mem_used, mem_limit] = split_pair(line.substr(first + 1, second - first - 1));
    usage.memory_mb = parse_docker_size_mb(mem_used);
    usage.memory_limit_mb = parse_docker_size_mb(mem_limit);

    auto [net_rx, net_tx] = split_pair(line.substr(second + 1));
    usage.network_rx_mb = parse_docker_size_mb(net_rx);
    usage.network_tx_mb = parse_docker_size_mb(net_tx);

    return usage;
}

ContainerState parse_docker_state(std::string_view status) {
    auto s = trim(status);
    if (s == "running" || s == "restarting") return ContainerState::Running;
    if (s == "exited" || s == "dead" || s == "created" || s == "removing") {
        return ContainerState::Exited;
    }
    return ContainerState::Unknown;
}

// ─────────────────────────────────────────────
// DockerCliRuntime
// ─────────────────────────────────────────────

DockerCliRuntime::DockerCliRuntime(RuntimeConfig config)
    : config_(std::move(config)) {}

Result<CommandOutput> DockerCliRuntime::run(std::vector<std::string> args, ErrorCode failure_code) {
    args.insert(args.begin(), config_.docker_binary);
    auto out = run_command(args, config_.command_timeout_ms);
    if (!out) {
        return Error{failure_code, out.error().message};
    }
    if (!out->ok()) {
        return Error{failure_code, failure_detail(*out)};
    }
    return out;
}

Result<void> DockerCliRuntime::ensure_network() {
    auto probe = run_command({config_.docker_binary, "network", "inspect", config_.network},
                             config_.command_timeout_ms);
    if (!probe) {
        return probe.error();
    }
    if (probe->ok()) {
        return Result<void>{};
    }

    auto created = run({"network", "create", "--driver", "bridge",
                        "--label", "created_by=game_server_factory", config_.network},
                       ErrorCode::RuntimeUnavailable);
    if (!created) {
        return created.error();
    }
    return Result<void>{};
}

Result<std::string> DockerCliRuntime::server_version() {
    auto out = run({"version", "--format", "{{.Server.Version}}"}, ErrorCode::RuntimeUnavailable);
    if (!out) {
        return out.error();
    }
    return trim(out->stdout_text);
}

Result<std::filesystem::path> DockerCliRuntime::write_context(const BuildDescriptor& descriptor) {
    std::error_code ec;
    auto dir = config_.work_dir / ("build-" + generate_short_id(""));
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::BuildFailed,
                     "Cannot create build context " + dir.string() + ": " + ec.message()};
    }

    for (const auto& [relative, content] : descriptor.files) {
        auto path = dir / relative;
        std::filesystem::create_directories(path.parent_path(), ec);
        std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
        ofs << content;
        if (!ofs) {
            std::filesystem::remove_all(dir, ec);
            return Error{ErrorCode::BuildFailed, "Cannot write build file " + path.string()};
        }
    }
    return dir;
}

Result<ImageRef> DockerCliRuntime::build_image(const BuildDescriptor& descriptor) {
    if (descriptor.files.find("Dockerfile") == descriptor.files.end()) {
        return Error{ErrorCode::BuildFailed, "Build descriptor has no Dockerfile"};
    }

    auto context = write_context(descriptor);
    if (!context) {
        return context.error();
    }

    std::vector<std::string> args = {"build", "--quiet", "--rm", "--force-rm",
                                     "-t", descriptor.image_tag};
    for (const auto& [key, value] : descriptor.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(context->string());

    auto out = run(std::move(args), ErrorCode::BuildFailed);

    std::error_code ec;
    std::filesystem::remove_all(*context, ec);

    if (!out) {
        return out.error();
    }
    return ImageRef{descriptor.image_tag};
}

Result<ContainerRef> DockerCliRuntime::run_container(const ImageRef& image,
                                                     const PortBinding& binding,
                                                     const RunOptions& options) {
    std::vector<std::string> args = {"run", "--detach",
                                     "--restart", "unless-stopped",
                                     "-p", std::to_string(binding.host_port) + ":"
                                           + std::to_string(binding.container_port)};
    if (!options.container_name.empty()) {
        args.push_back("--name");
        args.push_back(options.container_name);
    }
    if (!options.network.empty()) {
        args.push_back("--network");
        args.push_back(options.network);
    }
    for (const auto& [key, value] : options.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }
    for (const auto& [key, value] : options.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    args.push_back(image);

    auto out = run(std::move(args), ErrorCode::LaunchFailed);
    if (!out) {
        // A failed `docker run` may still leave a created container behind.
        if (!options.container_name.empty()) {
            auto cleanup = run_command({config_.docker_binary, "rm", "-f", options.container_name},
                                       config_.command_timeout_ms);
            if (!cleanup) {
                out.error().message += " (cleanup failed: " + cleanup.error().message + ")";
            }
        }
        return out.error();
    }

    auto id = trim(out->stdout_text);
    if (id.empty()) {
        return Error{ErrorCode::LaunchFailed, "docker run returned no container id"};
    }
    return ContainerRef{id};
}

Result<void> DockerCliRuntime::stop(const ContainerRef& container) {
    auto out = run({"stop", "-t", std::to_string(config_.stop_timeout_s), container},
                   ErrorCode::RuntimeUnavailable);
    if (!out) {
        return out.error();
    }
    return Result<void>{};
}

Result<void> DockerCliRuntime::remove(const ContainerRef& container) {
    auto out = run({"rm", "-f", container}, ErrorCode::RuntimeUnavailable);
    if (!out) {
        if (out.error().message.find("No such container") != std::string::npos) {
            return Result<void>{};
        }
        return out.error();
    }
    return Result<void>{};
}

Result<void> DockerCliRuntime::remove_image(const ImageRef& image) {
    auto out = run({"rmi", "-f", image}, ErrorCode::RuntimeUnavailable);
    if (!out) {
        if (out.error().message.find("No such image") != std::string::npos) {
            return Result<void>{};
        }
        return out.error();
    }
    return Result<void>{};
}

Result<ResourceUsage> DockerCliRuntime::stats(const ContainerRef& container) {
    auto out = run({"stats", "--no-stream", "--format",
                    "{{.CPUPerc}}|{{.MemUsage}}|{{.NetIO}}", container},
                   ErrorCode::RuntimeUnavailable);
    if (!out) {
        return out.error();
    }
    auto lines = split_lines(out->stdout_text);
    if (lines.empty()) {
        return Error{ErrorCode::RuntimeUnavailable, "docker stats returned nothing"};
    }
    return parse_docker_stats_line(lines.front());
}

Result<std::vector<std::string>> DockerCliRuntime::logs(const ContainerRef& container,
                                                       uint32_t tail) {
    auto out = run({"logs", "--timestamps", "--tail", std::to_string(tail), container},
                   ErrorCode::RuntimeUnavailable);
    if (!out) {
        return out.error();
    }
    // Container stdout and stderr arrive on the matching docker streams.
    auto lines = split_lines(out->stdout_text);
    auto err_lines = split_lines(out->stderr_text);
    lines.insert(lines.end(), err_lines.begin(), err_lines.end());
    return lines;
}

Result<ContainerState> DockerCliRuntime::state(const ContainerRef& container) {
    auto out = run_command({config_.docker_binary, "inspect", "-f", "{{.State.Status}}", container},
                           config_.command_timeout_ms);
    if (!out) {
        return out.error();
    }
    if (!out->ok()) {
        auto detail = failure_detail(*out);
        if (detail.find("No such") != std::string::npos) {
            return ContainerState::Missing;
        }
        return Error{ErrorCode::RuntimeUnavailable, detail};
    }
    return parse_docker_state(out->stdout_text);
}

}  // namespace game_factory
