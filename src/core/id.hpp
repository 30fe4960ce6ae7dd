/**
 * @file id.hpp
 * @brief Random identifier generation for servers and liveness entries.
 */

#pragma once

#include <string>
#include <string_view>

namespace game_factory {

/**
 * @brief RFC 4122 version 4 UUID in canonical 8-4-4-4-12 form.
 */
std::string generate_uuid();

/**
 * @brief Short id: @p prefix followed by 12 hex digits of a fresh UUID.
 *
 * Used for server ids, which end up in container names and image tags and
 * therefore must stay short and lowercase.
 */
std::string generate_short_id(std::string_view prefix);

}  // namespace game_factory
