/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace game_factory {

struct FactoryConfig {
    std::string id = "factory-01";
    uint64_t max_code_bytes = 1048576;
    uint32_t log_tail_lines = 200;
    std::string matchmaker_url = "http://localhost:8000";
    bool reject_unsafe_code = true;
    uint32_t status_refresh_interval_ms = 15000;
    uint32_t idle_timeout_ms = 1800000;     ///< Running with no connections this long is stopped
};

struct PortConfig {
    uint16_t base = 8081;
    uint16_t end = 9080;                ///< Inclusive
};

struct AdmissionConfig {
    uint32_t max_containers = 50;
    float max_cpu_percent = 80.0f;
    float max_memory_percent = 80.0f;
    float cpu_reservation_percent = 0.0f;   ///< Per running container, 0 = off
    uint64_t memory_reservation_mb = 0;     ///< Per running container, 0 = off
};

struct RuntimeConfig {
    std::string backend = "docker";     ///< "docker", "mock"
    std::string docker_binary = "docker";
    std::string image_prefix = "game-server";
    std::string network = "game-network";
    uint16_t container_port = 8080;
    uint32_t command_timeout_ms = 120000;
    uint32_t stop_timeout_s = 10;
    std::filesystem::path work_dir = "/tmp/game_factory";
};

struct MatchmakerConfig {
    uint32_t heartbeat_timeout_ms = 30000;
    uint32_t sweep_interval_ms = 10000;
    uint32_t eviction_grace_ms = 0;
    uint32_t default_max_players = 20;
};

struct MonitorConfig {
    uint32_t sampling_interval_ms = 1000;
    bool mock = false;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 10;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    FactoryConfig factory;
    PortConfig ports;
    AdmissionConfig admission;
    RuntimeConfig runtime;
    MatchmakerConfig matchmaker;
    MonitorConfig monitor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing tables and keys keep their defaults. The result is validated
 * before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Check cross-field constraints (port range, ceilings, timings).
 */
Result<void> validate_config(const Config& config);

}  // namespace game_factory
