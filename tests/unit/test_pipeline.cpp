/**
 * @file test_pipeline.cpp
 * @brief Unit tests for ProvisioningPipeline against MockRuntime.
 */

#include "provisioning/provisioning_pipeline.hpp"
#include "resource_monitor/monitor.hpp"
#include "runtime/mock_runtime.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace game_factory;
using namespace std::chrono_literals;

namespace {

const std::string kGame = R"(
function initGame() {
  return { clickCount: 0 };
}

function handleConnection(socket, state) {
  socket.on('click', () => { state.clickCount++; });
}

module.exports = { initGame, handleConnection };
)";

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

size_t count_events(const std::vector<std::string>& lines, const std::string& event) {
    auto needle = R"("event":")" + event + "\"";
    return static_cast<size_t>(std::count_if(lines.begin(), lines.end(),
        [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
}

}  // namespace

class PipelineTest : public ::testing::Test {
protected:
    ManualClock clock_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
    std::vector<std::string> events_;
    MetricsCollector metrics_{std::make_unique<CaptureSink>(events_)};
    MockMonitor monitor_{"host"};
    MockRuntime runtime_;
    ServerRegistry registry_{clock_};
    PortAllocator ports_{PortConfig{.base = 8081, .end = 8085},
                         [this] { return registry_.leased_ports(); },
                         [](Port) { return true; }};
    AdmissionConfig admission_cfg_;
    AdmissionController admission_{admission_cfg_, registry_, host_probe_for(monitor_), logger_};
    ProvisioningPipeline pipeline_{PipelineOptions{}, registry_, ports_, admission_, runtime_,
                                   clock_, logger_, metrics_};

    GameServerInstance provision_ok(const std::string& name = "Demo") {
        auto inst = pipeline_.provision(kGame, name, "test server");
        EXPECT_TRUE(inst.has_value()) << inst.error().message;
        return inst.has_value() ? *inst : GameServerInstance{};
    }
};

// ─── Provision ───────────────────────────────

TEST_F(PipelineTest, ProvisionHappyPath) {
    auto inst = provision_ok("Demo Clicker");

    EXPECT_EQ(inst.status, InstanceStatus::Running);
    EXPECT_EQ(inst.name, "Demo Clicker");
    EXPECT_EQ(inst.description, "test server");
    EXPECT_EQ(inst.port, Port{8081});
    EXPECT_EQ(inst.server_id.size(), 12u);
    ASSERT_TRUE(inst.container_ref.has_value());
    ASSERT_TRUE(inst.image_ref.has_value());
    EXPECT_EQ(*inst.image_ref, "game-server:" + inst.server_id);

    EXPECT_TRUE(runtime_.has_container(*inst.container_ref));
    EXPECT_TRUE(ports_.is_leased(8081));
    EXPECT_EQ(runtime_.bound_ports(), (std::vector<Port>{8081}));
    EXPECT_EQ(count_events(events_, "provision_result"), 1u);
    EXPECT_EQ(count_events(events_, "status_change"), 1u);
}

TEST_F(PipelineTest, BuildContainsWrappedUserCode) {
    auto inst = provision_ok();
    auto build = runtime_.last_build();
    ASSERT_TRUE(build.has_value());
    ASSERT_EQ(build->files.count("user_game.js"), 1u);
    EXPECT_NE(build->files.at("user_game.js").find("clickCount"), std::string::npos);
    EXPECT_EQ(build->labels.at("server_id"), inst.server_id);
}

TEST_F(PipelineTest, SuccessivePortsAreDistinct) {
    auto a = provision_ok("a");
    auto b = provision_ok("b");
    EXPECT_EQ(a.port, Port{8081});
    EXPECT_EQ(b.port, Port{8082});
    EXPECT_NE(a.server_id, b.server_id);
}

TEST_F(PipelineTest, EmptyCodeRejected) {
    auto r = pipeline_.provision("   \n", "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(runtime_.calls().total(), 0u);
}

TEST_F(PipelineTest, EmptyNameRejected) {
    auto r = pipeline_.provision(kGame, "", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
}

TEST_F(PipelineTest, OversizedCodeRejected) {
    std::string big(PipelineOptions{}.max_code_bytes + 1, 'x');
    auto r = pipeline_.provision(big, "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(runtime_.calls().total(), 0u);
}

TEST_F(PipelineTest, UnsafeCodeRejected) {
    auto r = pipeline_.provision("const fs = require('fs');\nmodule.exports = {};\n",
                                 "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
    EXPECT_NE(r.error().message.find("Code rejected"), std::string::npos);
    EXPECT_EQ(runtime_.calls().build, 0u);
}

TEST_F(PipelineTest, LongSingleLineIsHandled) {
    const std::string padding(120'000, ' ');

    auto ok = pipeline_.provision("// see require" + padding + "\nmodule.exports = {};\n",
                                  "Long", "");
    ASSERT_TRUE(ok.has_value()) << ok.error().message;
    EXPECT_EQ(ok->status, InstanceStatus::Running);

    auto unsafe = pipeline_.provision("eval" + padding + "(1);\nmodule.exports = {};\n",
                                      "Long", "");
    ASSERT_FALSE(unsafe.has_value());
    EXPECT_EQ(unsafe.error().code, ErrorCode::InvalidInput);
}

TEST_F(PipelineTest, AdmissionDeniedTouchesNothing) {
    monitor_.set_cpu(99.0f);

    auto r = pipeline_.provision(kGame, "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::ResourceExhausted);
    EXPECT_NE(r.error().message.find("CPU usage too high"), std::string::npos);
    EXPECT_EQ(runtime_.calls().total(), 0u);
    EXPECT_EQ(ports_.leased_count(), 0u);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(count_events(events_, "admission_denied"), 1u);
}

TEST_F(PipelineTest, BuildFailureLeavesNoTrace) {
    runtime_.fail(MockRuntime::Op::Build, "npm install failed");

    auto r = pipeline_.provision(kGame, "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::BuildFailed);
    EXPECT_EQ(r.error().message, "npm install failed");
    EXPECT_EQ(ports_.leased_count(), 0u);
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(runtime_.calls().run, 0u);
}

TEST_F(PipelineTest, LaunchFailureReleasesPortAndImage) {
    runtime_.fail(MockRuntime::Op::Run, "port is already allocated");

    auto r = pipeline_.provision(kGame, "Demo", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::LaunchFailed);
    EXPECT_FALSE(ports_.is_leased(8081));
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(runtime_.image_count(), 0u);
    EXPECT_EQ(runtime_.container_count(), 0u);

    // The released port goes to the next request
    runtime_.succeed(MockRuntime::Op::Run);
    auto next = provision_ok();
    EXPECT_EQ(next.port, Port{8081});
}

TEST_F(PipelineTest, PortExhaustion) {
    for (int i = 0; i < 5; ++i) provision_ok("s" + std::to_string(i));

    auto r = pipeline_.provision(kGame, "overflow", "");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NoPortAvailable);
    EXPECT_EQ(runtime_.image_count(), 5u);
    EXPECT_EQ(registry_.size(), 5u);
}

// ─── Stop / Remove ───────────────────────────

TEST_F(PipelineTest, StopIsIdempotent) {
    auto inst = provision_ok();

    auto first = pipeline_.stop(inst.server_id);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->status, InstanceStatus::Stopped);

    auto second = pipeline_.stop(inst.server_id);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->status, InstanceStatus::Stopped);
    EXPECT_EQ(runtime_.calls().stop, 1u);

    // Port stays leased until removal
    EXPECT_TRUE(ports_.is_leased(*inst.port));
}

TEST_F(PipelineTest, StopToleratesVanishedContainer) {
    auto inst = provision_ok();
    runtime_.set_state(*inst.container_ref, ContainerState::Missing);

    auto r = pipeline_.stop(inst.server_id);
    ASSERT_TRUE(r.has_value()) << r.error().message;
    EXPECT_EQ(r->status, InstanceStatus::Stopped);
}

TEST_F(PipelineTest, StopFailureWhileRunning) {
    auto inst = provision_ok();
    runtime_.fail(MockRuntime::Op::Stop, "daemon unreachable");

    auto r = pipeline_.stop(inst.server_id);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::RuntimeUnavailable);
    EXPECT_EQ(registry_.get(inst.server_id)->status, InstanceStatus::Running);
}

TEST_F(PipelineTest, StopUnknown) {
    auto r = pipeline_.stop("nope");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST_F(PipelineTest, RemoveReleasesEverything) {
    auto inst = provision_ok();

    ASSERT_TRUE(pipeline_.remove(inst.server_id).has_value());
    EXPECT_FALSE(registry_.contains(inst.server_id));
    EXPECT_FALSE(ports_.is_leased(*inst.port));
    EXPECT_FALSE(runtime_.has_container(*inst.container_ref));
    EXPECT_FALSE(runtime_.has_image(*inst.image_ref));

    auto again = pipeline_.remove(inst.server_id);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::NotFound);

    auto gone = pipeline_.stop(inst.server_id);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
}

TEST_F(PipelineTest, RemoveFailureKeepsRecord) {
    auto inst = provision_ok();
    runtime_.fail(MockRuntime::Op::Remove, "device busy");

    auto r = pipeline_.remove(inst.server_id);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::RuntimeUnavailable);
    EXPECT_TRUE(registry_.contains(inst.server_id));
    EXPECT_TRUE(ports_.is_leased(*inst.port));
}

TEST_F(PipelineTest, RemoveToleratesImageCleanupFailure) {
    auto inst = provision_ok();
    runtime_.fail(MockRuntime::Op::RemoveImage);

    EXPECT_TRUE(pipeline_.remove(inst.server_id).has_value());
    EXPECT_FALSE(registry_.contains(inst.server_id));
}

// ─── Observation ─────────────────────────────

TEST_F(PipelineTest, RefreshStatsCachesSnapshot) {
    auto inst = provision_ok();
    ResourceUsage usage;
    usage.cpu_percent = 12.5f;
    usage.memory_mb = 48.0;
    runtime_.set_stats(*inst.container_ref, usage);

    auto live = pipeline_.refresh_stats(inst.server_id);
    ASSERT_TRUE(live.has_value());
    EXPECT_FLOAT_EQ(live->cpu_percent, 12.5f);
    EXPECT_EQ(live->observed_at, clock_.now());

    runtime_.fail(MockRuntime::Op::Stats);
    auto cached = pipeline_.refresh_stats(inst.server_id);
    ASSERT_TRUE(cached.has_value());
    EXPECT_DOUBLE_EQ(cached->memory_mb, 48.0);
}

TEST_F(PipelineTest, FetchLogsFallsBackToCache) {
    auto inst = provision_ok();
    runtime_.append_log(*inst.container_ref, "player joined");
    runtime_.append_log(*inst.container_ref, "player left");

    auto live = pipeline_.fetch_logs(inst.server_id, 2);
    ASSERT_TRUE(live.has_value());
    EXPECT_EQ(*live, (std::vector<std::string>{"player joined", "player left"}));

    runtime_.fail(MockRuntime::Op::Logs);
    auto cached = pipeline_.fetch_logs(inst.server_id, 10);
    ASSERT_TRUE(cached.has_value());
    ASSERT_EQ(cached->size(), 3u);
    EXPECT_EQ(cached->front(), "Game server listening on port 8080");
}

TEST_F(PipelineTest, RefreshStatusMarksExitedAsError) {
    auto inst = provision_ok();
    runtime_.append_log(*inst.container_ref, "TypeError: state is undefined");
    runtime_.set_state(*inst.container_ref, ContainerState::Exited);

    auto r = pipeline_.refresh_status(inst.server_id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, InstanceStatus::Error);
    ASSERT_FALSE(r->logs.empty());
    EXPECT_EQ(r->logs.back(), "TypeError: state is undefined");

    // Error instances can only be removed
    EXPECT_EQ(pipeline_.stop(inst.server_id)->status, InstanceStatus::Error);
    EXPECT_TRUE(pipeline_.remove(inst.server_id).has_value());
}

TEST_F(PipelineTest, RefreshStatusIgnoresRuntimeOutage) {
    auto inst = provision_ok();
    runtime_.fail(MockRuntime::Op::State);

    auto r = pipeline_.refresh_status(inst.server_id);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->status, InstanceStatus::Running);
}

TEST_F(PipelineTest, RefreshAllCountsFailures) {
    auto a = provision_ok("a");
    auto b = provision_ok("b");
    provision_ok("c");
    runtime_.set_state(*a.container_ref, ContainerState::Exited);
    runtime_.set_state(*b.container_ref, ContainerState::Missing);

    EXPECT_EQ(pipeline_.refresh_all(), 2u);
    EXPECT_EQ(registry_.list(InstanceStatus::Error).size(), 2u);
    EXPECT_EQ(registry_.list(InstanceStatus::Running).size(), 1u);
}

// ─── Idle reaping ────────────────────────────

TEST_F(PipelineTest, LaunchCountsAsActivity) {
    auto inst = provision_ok();
    EXPECT_EQ(inst.last_activity, clock_.now());
    EXPECT_EQ(inst.connection_count, 0u);
}

TEST_F(PipelineTest, IdleServerIsStopped) {
    auto idle = provision_ok("idle");
    auto busy = provision_ok("busy");
    ASSERT_TRUE(pipeline_.record_activity(busy.server_id, 3).has_value());

    // Exactly at the timeout is not yet idle
    clock_.advance(30min);
    EXPECT_TRUE(pipeline_.idle_instances().empty());
    EXPECT_EQ(pipeline_.stop_idle(), 0u);

    clock_.advance(1s);
    auto candidates = pipeline_.idle_instances();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].server_id, idle.server_id);

    EXPECT_EQ(pipeline_.stop_idle(), 1u);
    EXPECT_EQ(registry_.get(idle.server_id)->status, InstanceStatus::Stopped);
    EXPECT_EQ(registry_.get(busy.server_id)->status, InstanceStatus::Running);
    EXPECT_TRUE(ports_.is_leased(*idle.port));

    // Stopped servers are no longer candidates
    EXPECT_EQ(pipeline_.stop_idle(), 0u);
}

TEST_F(PipelineTest, ActivityResetsIdleTimer) {
    auto inst = provision_ok();
    clock_.advance(20min);
    auto touched = pipeline_.record_activity(inst.server_id, 0);
    ASSERT_TRUE(touched.has_value());
    EXPECT_EQ(touched->last_activity, clock_.now());

    clock_.advance(20min);
    EXPECT_EQ(pipeline_.stop_idle(), 0u);
    clock_.advance(11min);
    EXPECT_EQ(pipeline_.stop_idle(), 1u);
}

TEST_F(PipelineTest, ConnectedPlayersPreventIdleStop) {
    auto inst = provision_ok();
    ASSERT_TRUE(pipeline_.record_activity(inst.server_id, 1).has_value());
    clock_.advance(2h);
    EXPECT_EQ(pipeline_.stop_idle(), 0u);

    ASSERT_TRUE(pipeline_.record_activity(inst.server_id, 0).has_value());
    clock_.advance(31min);
    EXPECT_EQ(pipeline_.stop_idle(), 1u);
}

TEST_F(PipelineTest, ActivityForUnknownServer) {
    auto r = pipeline_.record_activity("nope", 1);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(PipelineOptionsTest, DerivedFromConfig) {
    auto config = default_config();
    config.runtime.image_prefix = "gs";
    config.factory.log_tail_lines = 25;
    config.matchmaker.default_max_players = 8;
    config.factory.idle_timeout_ms = 60000;

    auto options = pipeline_options_from(config);
    EXPECT_EQ(options.idle_timeout, 1min);
    EXPECT_EQ(options.scaffold.image_prefix, "gs");
    EXPECT_EQ(options.log_tail_lines, 25u);
    EXPECT_EQ(options.scaffold.max_players, 8u);
    EXPECT_EQ(options.scaffold.network, "game-network");
}
