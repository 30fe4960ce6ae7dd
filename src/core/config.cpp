/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>

namespace game_factory {

namespace {

Error config_error(std::string message) {
    return Error{ErrorCode::ConfigError, std::move(message)};
}

/**
 * Read an unsigned integer key into @p out. A missing key or a value of
 * another type keeps the default; a value that does not fit @p T is an error.
 */
template <typename T>
std::optional<Error> read_unsigned(toml::node_view<toml::node> table, std::string_view section,
                                   std::string_view key, T& out) {
    auto value = table[key].value<int64_t>();
    if (!value) return std::nullopt;
    if (*value < 0 || static_cast<uint64_t>(*value) > std::numeric_limits<T>::max()) {
        return config_error(std::string{section} + "." + std::string{key}
                            + " out of range: " + std::to_string(*value));
    }
    out = static_cast<T>(*value);
    return std::nullopt;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    Config config;
    std::optional<Error> range_error;
    auto read = [&range_error](std::string_view section, toml::node_view<toml::node> table,
                               std::string_view key, auto& out) {
        if (!range_error) range_error = read_unsigned(table, section, key, out);
    };

    try {
        auto tbl = toml::parse_file(path.string());

        // [factory]
        if (auto factory = tbl["factory"]; factory.is_table()) {
            config.factory.id = factory["id"].value_or(std::string{"factory-01"});
            read("factory", factory, "max_code_bytes", config.factory.max_code_bytes);
            read("factory", factory, "log_tail_lines", config.factory.log_tail_lines);
            config.factory.matchmaker_url =
                factory["matchmaker_url"].value_or(std::string{"http://localhost:8000"});
            config.factory.reject_unsafe_code = factory["reject_unsafe_code"].value_or(true);
            read("factory", factory, "status_refresh_interval_ms",
                 config.factory.status_refresh_interval_ms);
            read("factory", factory, "idle_timeout_ms", config.factory.idle_timeout_ms);
        }

        // [ports]
        if (auto ports = tbl["ports"]; ports.is_table()) {
            read("ports", ports, "base", config.ports.base);
            read("ports", ports, "end", config.ports.end);
        }

        // [admission]
        if (auto admission = tbl["admission"]; admission.is_table()) {
            read("admission", admission, "max_containers", config.admission.max_containers);
            config.admission.max_cpu_percent =
                static_cast<float>(admission["max_cpu_percent"].value_or(80.0));
            config.admission.max_memory_percent =
                static_cast<float>(admission["max_memory_percent"].value_or(80.0));
            config.admission.cpu_reservation_percent =
                static_cast<float>(admission["cpu_reservation_percent"].value_or(0.0));
            read("admission", admission, "memory_reservation_mb",
                 config.admission.memory_reservation_mb);
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            config.runtime.backend = runtime["backend"].value_or(std::string{"docker"});
            config.runtime.docker_binary = runtime["docker_binary"].value_or(std::string{"docker"});
            config.runtime.image_prefix = runtime["image_prefix"].value_or(std::string{"game-server"});
            config.runtime.network = runtime["network"].value_or(std::string{"game-network"});
            read("runtime", runtime, "container_port", config.runtime.container_port);
            read("runtime", runtime, "command_timeout_ms", config.runtime.command_timeout_ms);
            read("runtime", runtime, "stop_timeout_s", config.runtime.stop_timeout_s);
            config.runtime.work_dir = runtime["work_dir"].value_or(std::string{"/tmp/game_factory"});
        }

        // [matchmaker]
        if (auto matchmaker = tbl["matchmaker"]; matchmaker.is_table()) {
            read("matchmaker", matchmaker, "heartbeat_timeout_ms",
                 config.matchmaker.heartbeat_timeout_ms);
            read("matchmaker", matchmaker, "sweep_interval_ms",
                 config.matchmaker.sweep_interval_ms);
            read("matchmaker", matchmaker, "eviction_grace_ms",
                 config.matchmaker.eviction_grace_ms);
            read("matchmaker", matchmaker, "default_max_players",
                 config.matchmaker.default_max_players);
        }

        // [monitor]
        if (auto monitor = tbl["monitor"]; monitor.is_table()) {
            read("monitor", monitor, "sampling_interval_ms", config.monitor.sampling_interval_ms);
            config.monitor.mock = monitor["mock"].value_or(false);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            read("telemetry", telemetry, "max_file_size_mb", config.telemetry.max_file_size_mb);
            read("telemetry", telemetry, "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }

    if (range_error) {
        return *range_error;
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Config default_config() {
    return Config{};
}

Result<void> validate_config(const Config& config) {
    if (config.ports.base == 0 || config.ports.end < config.ports.base) {
        return config_error("ports.base must be non-zero and not greater than ports.end");
    }
    if (config.factory.idle_timeout_ms == 0) {
        return config_error("factory.idle_timeout_ms must be positive");
    }
    if (config.admission.max_containers == 0) {
        return config_error("admission.max_containers must be positive");
    }
    if (config.factory.max_code_bytes == 0) {
        return config_error("factory.max_code_bytes must be positive");
    }
    auto percent_ok = [](float p) { return p > 0.0f && p <= 100.0f; };
    if (!percent_ok(config.admission.max_cpu_percent)
        || !percent_ok(config.admission.max_memory_percent)) {
        return config_error("admission ceilings must be within (0, 100]");
    }
    if (config.matchmaker.heartbeat_timeout_ms == 0) {
        return config_error("matchmaker.heartbeat_timeout_ms must be positive");
    }
    if (config.matchmaker.sweep_interval_ms == 0
        || config.matchmaker.sweep_interval_ms >= config.matchmaker.heartbeat_timeout_ms) {
        return config_error("matchmaker.sweep_interval_ms must be positive and shorter "
                            "than heartbeat_timeout_ms");
    }
    if (config.runtime.backend != "docker" && config.runtime.backend != "mock") {
        return config_error("runtime.backend must be \"docker\" or \"mock\", got \""
                            + config.runtime.backend + "\"");
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return config_error("Unknown telemetry.log_level: " + config.telemetry.log_level);
    }
    return Result<void>{};
}

}  // namespace game_factory
