/**
 * @file scaffold.hpp
 * @brief Turns uploaded game code into a buildable Node.js server image.
 *
 * All functions here are pure: same inputs, same files.
 */

#pragma once

#include "core/types.hpp"
#include "runtime/container_runtime.hpp"

#include <string>
#include <string_view>

namespace game_factory {

struct ScaffoldOptions {
    std::string image_prefix = "game-server";
    Port container_port = 8080;
    std::string matchmaker_url = "http://localhost:8000";
    std::string network;
    uint32_t max_players = 20;
};

/**
 * @brief Make @p user_code loadable as the game module.
 *
 * Code that already assigns `module.exports` is returned untouched;
 * otherwise a default export block is appended that picks up
 * `initGame`/`handlePlayerAction` when defined and falls back to a click
 * counter.
 */
[[nodiscard]] std::string wrap(std::string_view user_code);

/// `<prefix>:<server_id>`
[[nodiscard]] std::string image_tag_for(std::string_view prefix, const ServerId& server_id);

/// `game-server-<server_id>`
[[nodiscard]] std::string container_name_for(const ServerId& server_id);

/**
 * @brief Build context for one game server.
 *
 * Files: Dockerfile, package.json, server.js (HTTP + socket.io host that
 * self-registers with the matchmaker and heartbeats) and user_game.js
 * (the wrapped user code).
 */
[[nodiscard]] BuildDescriptor make_build_descriptor(const ServerId& server_id,
                                                    std::string_view name,
                                                    std::string_view user_code,
                                                    const ScaffoldOptions& options);

/// Container name, network, environment and labels for `run_container`.
[[nodiscard]] RunOptions make_run_options(const ServerId& server_id,
                                          std::string_view name,
                                          const ScaffoldOptions& options);

}  // namespace game_factory
