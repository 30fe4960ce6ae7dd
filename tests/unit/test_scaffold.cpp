/**
 * @file test_scaffold.cpp
 * @brief Unit tests for the game server build scaffold.
 */

#include "provisioning/scaffold.hpp"

#include <gtest/gtest.h>

using namespace game_factory;

TEST(ScaffoldTest, WrapAddsDefaultExport) {
    auto wrapped = wrap("function initGame() { return {}; }");
    EXPECT_EQ(wrapped.rfind("function initGame()", 0), 0u);
    EXPECT_NE(wrapped.find("module.exports"), std::string::npos);
    EXPECT_NE(wrapped.find("handlePlayerAction"), std::string::npos);
}

TEST(ScaffoldTest, WrapKeepsExistingExport) {
    const std::string code = "module.exports = { initGame: () => ({}) };\n";
    EXPECT_EQ(wrap(code), code);
}

TEST(ScaffoldTest, Names) {
    EXPECT_EQ(image_tag_for("game-server", "a1b2c3d4e5f6"), "game-server:a1b2c3d4e5f6");
    EXPECT_EQ(container_name_for("a1b2c3d4e5f6"), "game-server-a1b2c3d4e5f6");
}

TEST(ScaffoldTest, BuildDescriptorFiles) {
    ScaffoldOptions options;
    options.image_prefix = "gs";
    options.container_port = 3000;
    options.matchmaker_url = "http://mm:8000";

    auto d = make_build_descriptor("abc123", "Room \"One\"", "let x = 1;", options);

    EXPECT_EQ(d.image_tag, "gs:abc123");
    ASSERT_EQ(d.files.size(), 4u);
    EXPECT_NE(d.files.at("Dockerfile").find("EXPOSE 3000"), std::string::npos);
    EXPECT_NE(d.files.at("package.json").find("socket.io"), std::string::npos);
    EXPECT_EQ(d.files.at("user_game.js").rfind("let x = 1;", 0), 0u);

    const auto& server = d.files.at("server.js");
    EXPECT_NE(server.find(R"("http://mm:8000")"), std::string::npos);
    EXPECT_NE(server.find(R"("Room \"One\"")"), std::string::npos);
    EXPECT_EQ(server.find("{{"), std::string::npos);

    EXPECT_EQ(d.labels.at("created_by"), "game_server_factory");
    EXPECT_EQ(d.labels.at("server_id"), "abc123");
}

TEST(ScaffoldTest, RunOptions) {
    ScaffoldOptions options;
    options.network = "game-network";
    options.max_players = 8;

    auto run = make_run_options("abc123", "Demo", options);
    EXPECT_EQ(run.container_name, "game-server-abc123");
    EXPECT_EQ(run.network, "game-network");
    EXPECT_EQ(run.env.at("PORT"), "8080");
    EXPECT_EQ(run.env.at("ROOM_NAME"), "Demo");
    EXPECT_EQ(run.env.at("MAX_PLAYERS"), "8");
    EXPECT_EQ(run.env.at("MATCHMAKER_URL"), "http://localhost:8000");
    EXPECT_EQ(run.labels.at("server_name"), "Demo");
}
