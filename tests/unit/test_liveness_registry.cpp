/**
 * @file test_liveness_registry.cpp
 * @brief Unit tests for the matchmaker LivenessRegistry.
 */

#include "matchmaker/liveness_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace game_factory;
using namespace std::chrono_literals;

class LivenessRegistryTest : public ::testing::Test {
protected:
    ManualClock clock_;
    Logger logger_{std::make_unique<NullSink>(), LogLevel::Error};
    LivenessRegistry registry_{LivenessOptions{}, clock_, logger_};

    static RegistrationRequest request(std::string ip, Port port, std::string name) {
        RegistrationRequest req;
        req.ip = std::move(ip);
        req.port = port;
        req.name = std::move(name);
        return req;
    }

    ServerId register_ok(RegistrationRequest req) {
        auto id = registry_.register_server(std::move(req));
        EXPECT_TRUE(id.has_value()) << id.error().message;
        return id.has_value() ? *id : ServerId{};
    }
};

// ─── Registration ────────────────────────────

TEST_F(LivenessRegistryTest, RegisterAssignsId) {
    auto id = register_ok(request("192.168.1.100", 8080, "X"));
    EXPECT_FALSE(id.empty());

    auto entry = registry_.get(id);
    ASSERT_TRUE(entry.has_value()) << entry.error().message;
    EXPECT_EQ(entry->ip, "192.168.1.100");
    EXPECT_EQ(entry->port, 8080);
    EXPECT_EQ(entry->name, "X");
    EXPECT_EQ(entry->max_players, 20u);
    EXPECT_EQ(entry->current_players, 0u);
    EXPECT_TRUE(entry->active);
    EXPECT_EQ(entry->registered_at, clock_.now());
}

TEST_F(LivenessRegistryTest, CallerChosenId) {
    auto req = request("10.0.0.1", 8081, "Factory server");
    req.server_id = "a1b2c3d4e5f6";
    req.max_players = 8;
    req.current_players = 3;
    req.metadata = {{"created_by", "game_server_factory"}};

    EXPECT_EQ(register_ok(req), "a1b2c3d4e5f6");
    auto entry = registry_.get("a1b2c3d4e5f6");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->max_players, 8u);
    EXPECT_EQ(entry->current_players, 3u);
    EXPECT_EQ(entry->metadata.at("created_by"), "game_server_factory");
}

TEST_F(LivenessRegistryTest, SameAddressKeepsId) {
    auto first = register_ok(request("10.0.0.1", 8081, "Room"));
    clock_.advance(5s);
    auto second = register_ok(request("10.0.0.1", 8081, "Room renamed"));

    EXPECT_EQ(first, second);
    EXPECT_EQ(registry_.size(), 1u);
    auto entry = registry_.get(first);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "Room renamed");
    EXPECT_EQ(entry->last_heartbeat, clock_.now());
    EXPECT_EQ(entry->registered_at, clock_.now() - 5s);
}

TEST_F(LivenessRegistryTest, CallerIdConflict) {
    auto req = request("10.0.0.1", 8081, "A");
    req.server_id = "shared";
    register_ok(req);

    auto other = request("10.0.0.2", 8081, "B");
    other.server_id = "shared";
    auto r = registry_.register_server(other);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
    EXPECT_EQ(registry_.get("shared")->ip, "10.0.0.1");
}

TEST_F(LivenessRegistryTest, NewIdReplacesOldAtSameAddress) {
    auto old_id = register_ok(request("10.0.0.1", 8081, "A"));

    auto req = request("10.0.0.1", 8081, "A");
    req.server_id = "restarted";
    register_ok(req);

    EXPECT_EQ(registry_.size(), 1u);
    EXPECT_EQ(registry_.get(old_id).error().code, ErrorCode::NotFound);
    EXPECT_TRUE(registry_.get("restarted").has_value());
}

TEST_F(LivenessRegistryTest, Validation) {
    EXPECT_FALSE(registry_.register_server(request("", 8080, "X")).has_value());
    EXPECT_FALSE(registry_.register_server(request("1.2.3.4", 0, "X")).has_value());
    EXPECT_FALSE(registry_.register_server(request("1.2.3.4", 8080, "")).has_value());
    EXPECT_FALSE(registry_.register_server(
        request("1.2.3.4", 8080, std::string(101, 'n'))).has_value());

    auto too_many = request("1.2.3.4", 8080, "X");
    too_many.max_players = 101;
    auto r = registry_.register_server(too_many);
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);

    auto none = request("1.2.3.4", 8080, "X");
    none.max_players = 0;
    EXPECT_FALSE(registry_.register_server(none).has_value());

    auto empty_id = request("1.2.3.4", 8080, "X");
    empty_id.server_id = "";
    EXPECT_FALSE(registry_.register_server(empty_id).has_value());

    EXPECT_EQ(registry_.size(), 0u);
}

// ─── Liveness window ─────────────────────────

TEST_F(LivenessRegistryTest, LapsedEntryIsGoneThenNotFound) {
    auto id = register_ok(request("192.168.1.100", 8080, "X"));

    clock_.advance(29s);
    EXPECT_TRUE(registry_.get(id).has_value());

    clock_.advance(1s);  // exactly at the timeout
    auto lapsed = registry_.get(id);
    ASSERT_FALSE(lapsed.has_value());
    EXPECT_EQ(lapsed.error().code, ErrorCode::Gone);
    EXPECT_TRUE(registry_.list(true).empty());
    EXPECT_EQ(registry_.list(false).size(), 1u);
    EXPECT_FALSE(registry_.list(false)[0].active);

    auto evicted = registry_.sweep();
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], id);

    auto gone = registry_.get(id);
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error().code, ErrorCode::NotFound);
    EXPECT_EQ(registry_.heartbeat(id).error().code, ErrorCode::NotFound);
}

TEST_F(LivenessRegistryTest, HeartbeatExtendsWindow) {
    auto id = register_ok(request("10.0.0.1", 8081, "A"));

    clock_.advance(20s);
    ASSERT_TRUE(registry_.heartbeat(id, 7).has_value());
    clock_.advance(20s);

    auto entry = registry_.get(id);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->current_players, 7u);
    EXPECT_TRUE(registry_.sweep().empty());
}

TEST_F(LivenessRegistryTest, HeartbeatWithoutCountKeepsPlayers) {
    auto req = request("10.0.0.1", 8081, "A");
    req.current_players = 4;
    auto id = register_ok(req);

    ASSERT_TRUE(registry_.heartbeat(id).has_value());
    EXPECT_EQ(registry_.get(id)->current_players, 4u);
}

TEST_F(LivenessRegistryTest, HeartbeatRevivesUnsweptEntry) {
    auto id = register_ok(request("10.0.0.1", 8081, "A"));
    clock_.advance(45s);
    EXPECT_EQ(registry_.get(id).error().code, ErrorCode::Gone);

    ASSERT_TRUE(registry_.heartbeat(id).has_value());
    EXPECT_TRUE(registry_.get(id).has_value());
}

TEST_F(LivenessRegistryTest, EvictionGraceDelaysSweep) {
    LivenessOptions options;
    options.eviction_grace = 10s;
    LivenessRegistry registry(options, clock_, logger_);

    auto id = registry.register_server(request("10.0.0.1", 8081, "A"));
    ASSERT_TRUE(id.has_value());

    clock_.advance(35s);
    EXPECT_EQ(registry.get(*id).error().code, ErrorCode::Gone);
    EXPECT_TRUE(registry.sweep().empty());

    clock_.advance(5s);
    EXPECT_EQ(registry.sweep().size(), 1u);
}

// ─── Queries ─────────────────────────────────

TEST_F(LivenessRegistryTest, ListOrderedByRegistration) {
    auto a = register_ok(request("10.0.0.1", 8081, "A"));
    clock_.advance(1s);
    auto b = register_ok(request("10.0.0.2", 8081, "B"));

    auto all = registry_.list();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].server_id, a);
    EXPECT_EQ(all[1].server_id, b);
}

TEST_F(LivenessRegistryTest, Unregister) {
    auto id = register_ok(request("10.0.0.1", 8081, "A"));
    ASSERT_TRUE(registry_.unregister(id).has_value());
    EXPECT_EQ(registry_.unregister(id).error().code, ErrorCode::NotFound);

    // The address is free again and gets a fresh id
    auto again = register_ok(request("10.0.0.1", 8081, "A"));
    EXPECT_NE(again, id);
}

TEST_F(LivenessRegistryTest, Summary) {
    auto a = request("10.0.0.1", 8081, "A");
    a.current_players = 3;
    register_ok(a);
    clock_.advance(25s);

    auto b = request("10.0.0.2", 8081, "B");
    b.current_players = 5;
    register_ok(b);
    clock_.advance(10s);  // A lapsed, B live

    auto s = registry_.summary();
    EXPECT_EQ(s.total_registered, 2u);
    EXPECT_EQ(s.active_servers, 1u);
    EXPECT_EQ(s.total_players, 5u);
    EXPECT_EQ(s.heartbeat_timeout, 30s);
}

TEST(LivenessOptionsTest, FromConfig) {
    MatchmakerConfig cfg;
    cfg.heartbeat_timeout_ms = 20000;
    cfg.eviction_grace_ms = 500;
    cfg.default_max_players = 12;

    auto options = liveness_options_from(cfg);
    EXPECT_EQ(options.heartbeat_timeout, std::chrono::milliseconds(20000));
    EXPECT_EQ(options.eviction_grace, std::chrono::milliseconds(500));
    EXPECT_EQ(options.default_max_players, 12u);
}
