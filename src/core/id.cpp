/**
 * @file id.cpp
 * @brief UUID generation backed by a thread-local Mersenne Twister.
 */

#include "core/id.hpp"

#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace game_factory {

namespace {

using Uuid = std::array<uint8_t, 16>;

Uuid random_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    Uuid id{};
    for (auto& b : id) {
        b = static_cast<uint8_t>(rng());
    }

    // RFC 4122 variant + version 4
    id[6] = (id[6] & 0x0F) | 0x40;
    id[8] = (id[8] & 0x3F) | 0x80;
    return id;
}

}  // anonymous namespace

std::string generate_uuid() {
    auto id = random_uuid();
    std::ostringstream oss;
    for (size_t i = 0; i < id.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(id[i]);
    }
    return oss.str();
}

std::string generate_short_id(std::string_view prefix) {
    auto uuid = generate_uuid();
    std::string hex;
    hex.reserve(12);
    for (char c : uuid) {
        if (c == '-') continue;
        hex += c;
        if (hex.size() == 12) break;
    }
    return std::string{prefix} + hex;
}

}  // namespace game_factory
