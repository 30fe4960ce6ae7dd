/**
 * @file main.cpp
 * @brief GameServerFactory daemon entry point.
 *
 * Wires all modules into the provisioning and liveness services:
 *   Config → Logger → Monitor → Runtime → Registries → Pipeline → Sweeper → Refresher
 */

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/periodic_task.hpp"
#include "matchmaker/eviction_sweeper.hpp"
#include "matchmaker/liveness_registry.hpp"
#include "provisioning/admission_controller.hpp"
#include "provisioning/port_allocator.hpp"
#include "provisioning/provisioning_pipeline.hpp"
#include "registry/server_registry.hpp"
#include "resource_monitor/monitor.hpp"
#include "runtime/docker_cli_runtime.hpp"
#include "runtime/mock_runtime.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace game_factory;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║        GameServerFactory v1.0.0           ║
  ║   Sandboxed Game Server Provisioning      ║
  ║   and Matchmaker Liveness Registry        ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string factory_id;
    std::string log_dir;
    bool mock = false;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--factory-id" && i + 1 < argc) {
            args.factory_id = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--mock") {
            args.mock = true;
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: game_factory [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --factory-id <id>    Factory identifier\n"
                      << "  --log-dir <path>     Log output directory\n"
                      << "  --mock               Use the in-process runtime and mock host monitor\n"
                      << "  --demo               Provision a sample game against the mock runtime, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

constexpr std::string_view DEMO_GAME = R"(let gameState = { clickCount: 0, players: {} };

function initGame() {
  return gameState;
}

function handlePlayerAction(state, action, data) {
  if (action === 'click') {
    state.clickCount += 1;
  }
  return state;
}

module.exports = { initGame, handlePlayerAction };
)";

/**
 * @brief Provision one sample game on the mock runtime, register it with the
 *        matchmaker, print both listings, then tear everything down.
 */
int run_demo(const Config& config, Logger& logger, MetricsCollector& metrics) {
    logger.info("=== Demo Mode ===");

    SystemClock clock;
    MockMonitor monitor(config.factory.id);
    monitor.set_cpu(35.0f);
    monitor.start();

    MockRuntime runtime;
    ServerRegistry registry(clock);
    PortAllocator ports(config.ports, [&registry] { return registry.leased_ports(); });
    AdmissionController admission(config.admission, registry, host_probe_for(monitor), logger);
    ProvisioningPipeline pipeline(pipeline_options_from(config), registry, ports, admission,
                                  runtime, clock, logger, metrics);
    LivenessRegistry matchmaker(liveness_options_from(config.matchmaker), clock, logger);

    auto created = pipeline.provision(DEMO_GAME, "Demo Clicker", "Click counter demo");
    if (!created) {
        logger.error("Demo provision failed: " + created.error().message);
        return 1;
    }
    std::cout << "Provisioned " << created->server_id << " '" << created->name
              << "' on port " << *created->port << "\n";

    auto registered = matchmaker.register_server(RegistrationRequest{
        .server_id = created->server_id,
        .ip = "127.0.0.1",
        .port = *created->port,
        .name = created->name,
        .max_players = std::nullopt,
        .current_players = 0,
        .metadata = {{"created_by", "game_server_factory"}, {"game_type", "custom"}},
    });
    if (!registered) {
        logger.error("Demo registration failed: " + registered.error().message);
        return 1;
    }

    std::cout << "\nInstances:\n";
    for (const auto& inst : registry.list()) {
        std::cout << "  " << inst.server_id << "  " << to_string(inst.status)
                  << "  port " << (inst.port ? std::to_string(*inst.port) : "-")
                  << "  " << inst.name << "\n";
    }

    std::cout << "\nMatchmaker (active):\n";
    for (const auto& entry : matchmaker.list(true)) {
        std::cout << "  " << entry.server_id << "  " << entry.ip << ":" << entry.port
                  << "  " << entry.name << "  " << entry.current_players << "/"
                  << entry.max_players << "\n";
    }

    auto logs = pipeline.fetch_logs(created->server_id, 10);
    if (logs) {
        std::cout << "\nLogs:\n";
        for (const auto& line : *logs) std::cout << "  " << line << "\n";
    }

    if (auto stopped = pipeline.stop(created->server_id); !stopped) {
        logger.warn("Demo stop failed: " + stopped.error().message);
    }
    if (auto removed = pipeline.remove(created->server_id); !removed) {
        logger.warn("Demo remove failed: " + removed.error().message);
    }
    if (auto gone = matchmaker.unregister(created->server_id); !gone) {
        logger.warn("Demo unregister failed: " + gone.error().message);
    }

    monitor.stop();
    logger.info("=== Demo Complete ===");
    return 0;
}

std::unique_ptr<IContainerRuntime> make_runtime(const RuntimeConfig& config, Logger& logger) {
    if (config.backend == "mock") {
        logger.warn("Using in-process mock container runtime");
        return std::make_unique<MockRuntime>();
    }

    auto docker = std::make_unique<DockerCliRuntime>(config);
    auto version = docker->server_version();
    if (!version) {
        logger.error("Docker is not reachable: " + version.error().message);
        return nullptr;
    }
    logger.info("Docker server version " + *version);

    if (auto network = docker->ensure_network(); !network) {
        logger.error("Could not prepare network '" + config.network + "': "
                     + network.error().message);
        return nullptr;
    }
    return docker;
}

/**
 * @brief Long-running service: sweeper, status refresher and status logging
 *        until SIGINT/SIGTERM.
 */
template <ResourceMonitorLike M>
int run_factory(const Config& config, Logger& logger, MetricsCollector& metrics, M& monitor) {
    monitor.start();
    logger.info("Resource monitor started (interval: "
                + std::to_string(config.monitor.sampling_interval_ms) + "ms)");

    auto runtime = make_runtime(config.runtime, logger);
    if (!runtime) {
        monitor.stop();
        return 1;
    }

    SystemClock clock;
    ServerRegistry registry(clock);
    PortAllocator ports(config.ports, [&registry] { return registry.leased_ports(); });
    AdmissionController admission(config.admission, registry, host_probe_for(monitor), logger);
    ProvisioningPipeline pipeline(pipeline_options_from(config), registry, ports, admission,
                                  *runtime, clock, logger, metrics);
    logger.info("Provisioning pipeline ready: runtime=" + std::string(runtime->name())
                + ", ports " + std::to_string(config.ports.base) + "-"
                + std::to_string(config.ports.end)
                + ", max containers " + std::to_string(config.admission.max_containers));

    LivenessRegistry matchmaker(liveness_options_from(config.matchmaker), clock, logger);
    EvictionSweeper sweeper(matchmaker, Duration{config.matchmaker.sweep_interval_ms},
                            logger, metrics);
    sweeper.start();
    logger.info("Liveness sweeper started (timeout: "
                + std::to_string(config.matchmaker.heartbeat_timeout_ms) + "ms, interval: "
                + std::to_string(config.matchmaker.sweep_interval_ms) + "ms)");

    PeriodicTask refresher("status-refresh",
                           Duration{config.factory.status_refresh_interval_ms},
                           [&pipeline, &logger] {
                               auto crashed = pipeline.refresh_all();
                               if (crashed > 0) {
                                   logger.warn(std::to_string(crashed)
                                               + " server(s) found crashed");
                               }
                               auto idle = pipeline.stop_idle();
                               if (idle > 0) {
                                   logger.info(std::to_string(idle)
                                               + " idle server(s) stopped");
                               }
                           },
                           logger);
    refresher.start();

    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    uint64_t loop_count = 0;
    while (!g_shutdown_requested) {
        // Status line every 30 seconds at 100ms intervals
        if (loop_count % 300 == 0 && loop_count > 0) {
            auto snap = monitor.read();
            if (snap) {
                metrics.record_host_snapshot(*snap);
            }
            auto counts = registry.status_counts();
            auto live = matchmaker.summary();
            logger.info("Status: "
                + std::to_string(counts[InstanceStatus::Running]) + " running, "
                + std::to_string(counts[InstanceStatus::Stopped]) + " stopped, "
                + std::to_string(counts[InstanceStatus::Error]) + " error, "
                + std::to_string(ports.leased_count()) + " ports leased, "
                + std::to_string(live.active_servers) + "/"
                + std::to_string(live.total_registered) + " matchmaker servers active, "
                + std::to_string(live.total_players) + " players");
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        ++loop_count;
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    refresher.stop();
    sweeper.stop();
    monitor.stop();
    metrics.flush();

    logger.info("GameServerFactory stopped.");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        if (std::filesystem::exists(args.config_path)) {
            std::cerr << "Invalid config: " << config_result.error().message << std::endl;
            return 2;
        }
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.factory_id.empty()) config.factory.id = args.factory_id;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (args.mock || args.demo_mode) {
        config.runtime.backend = "mock";
        config.monitor.mock = true;
    }

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid config: " << valid.error().message << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "game_factory",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }
    Logger logger(std::move(log_sink), parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    MetricsCollector metrics(std::move(metrics_sink));
    logger.info("GameServerFactory starting...");
    logger.info("Factory ID: " + config.factory.id);
    logger.info("Matchmaker URL: " + config.factory.matchmaker_url);

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    if (args.demo_mode) {
        return run_demo(config, logger, metrics);
    }

    int rc = 0;
    if (config.monitor.mock) {
        MockMonitor monitor(config.factory.id, config.monitor.sampling_interval_ms);
        rc = run_factory(config, logger, metrics, monitor);
    } else {
        LinuxMonitor monitor(config.factory.id, config.monitor.sampling_interval_ms);
        monitor.on_cpu_threshold(config.admission.max_cpu_percent,
                                 [&logger](const ResourceSnapshot& snap) {
            logger.warn("Host CPU above admission ceiling: "
                        + std::to_string(static_cast<int>(snap.cpu_usage_percent)) + "%");
        });
        monitor.on_memory_threshold(config.admission.max_memory_percent,
                                    [&logger](const ResourceSnapshot& snap) {
            logger.warn("Host memory above admission ceiling: "
                        + std::to_string(static_cast<int>(snap.memory_usage_percent())) + "%");
        });
        rc = run_factory(config, logger, metrics, monitor);
    }

    logger.flush();
    return rc;
}
