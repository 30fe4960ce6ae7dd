/**
 * @file test_eviction_sweeper.cpp
 * @brief Unit tests for the liveness EvictionSweeper.
 */

#include "matchmaker/eviction_sweeper.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <thread>

using namespace game_factory;
using namespace std::chrono_literals;

class EvictionSweeperTest : public ::testing::Test {
protected:
    ManualClock clock_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
    MetricsCollector metrics_{std::make_unique<NullSink>()};
    LivenessRegistry registry_{LivenessOptions{}, clock_, logger_};

    ServerId add(const std::string& ip) {
        RegistrationRequest req;
        req.ip = ip;
        req.port = 8080;
        req.name = "room";
        auto id = registry_.register_server(req);
        EXPECT_TRUE(id.has_value());
        return id.has_value() ? *id : ServerId{};
    }
};

TEST_F(EvictionSweeperTest, SweepOnceEvictsOnlyLapsed) {
    EvictionSweeper sweeper(registry_, 1s, logger_, metrics_);
    add("10.0.0.1");
    clock_.advance(20s);
    auto fresh = add("10.0.0.2");
    clock_.advance(15s);

    EXPECT_EQ(sweeper.sweep_once(), 1u);
    EXPECT_EQ(sweeper.total_evicted(), 1u);
    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_TRUE(registry_.get(fresh).has_value());

    EXPECT_EQ(sweeper.sweep_once(), 0u);
}

TEST_F(EvictionSweeperTest, BackgroundSweepEvicts) {
    EvictionSweeper sweeper(registry_, 10ms, logger_, metrics_);
    auto id = add("10.0.0.1");
    clock_.advance(31s);

    sweeper.start();
    EXPECT_TRUE(sweeper.running());

    for (int i = 0; i < 100 && registry_.size() > 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    sweeper.stop();

    EXPECT_FALSE(sweeper.running());
    EXPECT_EQ(registry_.size(), 0u);
    EXPECT_EQ(registry_.get(id).error().code, ErrorCode::NotFound);
    EXPECT_EQ(sweeper.total_evicted(), 1u);
    EXPECT_GE(sweeper.sweeps(), 1u);
}

TEST_F(EvictionSweeperTest, LiveEntriesSurviveBackgroundSweeps) {
    EvictionSweeper sweeper(registry_, 5ms, logger_, metrics_);
    add("10.0.0.1");

    sweeper.start();
    std::this_thread::sleep_for(60ms);
    sweeper.stop();

    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(sweeper.total_evicted(), 0u);
}
