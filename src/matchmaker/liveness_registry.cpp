/**
 * @file liveness_registry.cpp
 * @brief LivenessRegistry implementation.
 */

#include "matchmaker/liveness_registry.hpp"

#include "core/id.hpp"

#include <algorithm>

namespace game_factory {

LivenessOptions liveness_options_from(const MatchmakerConfig& config) {
    return LivenessOptions{
        .heartbeat_timeout = Duration{config.heartbeat_timeout_ms},
        .eviction_grace = Duration{config.eviction_grace_ms},
        .default_max_players = config.default_max_players,
    };
}

LivenessRegistry::LivenessRegistry(LivenessOptions options, const IClock& clock, Logger& logger)
    : options_(options)
    , clock_(clock)
    , logger_(logger) {}

std::string LivenessRegistry::address_key(const std::string& ip, Port port) {
    return ip + ":" + std::to_string(port);
}

bool LivenessRegistry::is_live(const MatchmakerEntry& entry, Timestamp now) const noexcept {
    return now - entry.last_heartbeat < options_.heartbeat_timeout;
}

MatchmakerEntry LivenessRegistry::view(const MatchmakerEntry& entry, Timestamp now) const {
    MatchmakerEntry copy = entry;
    copy.active = is_live(entry, now);
    return copy;
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<ServerId> LivenessRegistry::register_server(RegistrationRequest request) {
    if (request.ip.empty()) {
        return Error{ErrorCode::InvalidInput, "ip is required"};
    }
    if (request.port == 0) {
        return Error{ErrorCode::InvalidInput, "port must be in 1-65535"};
    }
    if (request.name.empty() || request.name.size() > MAX_NAME_LENGTH) {
        return Error{ErrorCode::InvalidInput,
                     "name must be 1-" + std::to_string(MAX_NAME_LENGTH) + " characters"};
    }
    uint32_t max_players = request.max_players.value_or(options_.default_max_players);
    if (max_players == 0 || max_players > MAX_PLAYERS_LIMIT) {
        return Error{ErrorCode::InvalidInput,
                     "max_players must be in 1-" + std::to_string(MAX_PLAYERS_LIMIT)};
    }
    if (request.server_id && request.server_id->empty()) {
        return Error{ErrorCode::InvalidInput, "server_id must not be empty"};
    }

    auto key = address_key(request.ip, request.port);
    auto now = clock_.now();

    std::lock_guard lock(mutex_);

    ServerId id;
    if (request.server_id) {
        id = *request.server_id;
        auto existing = entries_.find(id);
        if (existing != entries_.end()
            && address_key(existing->second.ip, existing->second.port) != key) {
            return Error{ErrorCode::InvalidInput, "server_id already in use: " + id};
        }
        // The address may still point at an older id; that entry is replaced.
        auto by_addr = by_address_.find(key);
        if (by_addr != by_address_.end() && by_addr->second != id) {
            entries_.erase(by_addr->second);
        }
    } else if (auto by_addr = by_address_.find(key); by_addr != by_address_.end()) {
        id = by_addr->second;
    } else {
        do {
            id = generate_uuid();
        } while (entries_.count(id) > 0);
    }

    auto it = entries_.find(id);
    bool fresh = it == entries_.end();
    if (fresh) {
        it = entries_.emplace(id, MatchmakerEntry{}).first;
        it->second.server_id = id;
        it->second.registered_at = now;
    }

    auto& entry = it->second;
    entry.ip = std::move(request.ip);
    entry.port = request.port;
    entry.name = std::move(request.name);
    entry.max_players = max_players;
    entry.current_players = request.current_players;
    entry.metadata = std::move(request.metadata);
    entry.last_heartbeat = now;
    by_address_[key] = id;

    if (fresh) {
        logger_.info("Matchmaker: registered " + id + " '" + entry.name + "' at " + key);
    } else {
        logger_.debug("Matchmaker: refreshed " + id + " at " + key);
    }
    return id;
}

Result<void> LivenessRegistry::heartbeat(const ServerId& id,
                                         std::optional<uint32_t> current_players) {
    auto now = clock_.now();
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }
    it->second.last_heartbeat = now;
    if (current_players) {
        it->second.current_players = *current_players;
    }
    return Result<void>{};
}

Result<void> LivenessRegistry::unregister(const ServerId& id) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }
    by_address_.erase(address_key(it->second.ip, it->second.port));
    entries_.erase(it);
    logger_.info("Matchmaker: unregistered " + id);
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<MatchmakerEntry> LivenessRegistry::get(const ServerId& id) const {
    auto now = clock_.now();
    std::lock_guard lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }
    if (!is_live(it->second, now)) {
        return Error{ErrorCode::Gone, "Server is inactive: " + id};
    }
    return view(it->second, now);
}

std::vector<MatchmakerEntry> LivenessRegistry::list(bool active_only) const {
    auto now = clock_.now();
    std::vector<MatchmakerEntry> result;
    {
        std::lock_guard lock(mutex_);
        result.reserve(entries_.size());
        for (const auto& [id, entry] : entries_) {
            if (active_only && !is_live(entry, now)) continue;
            result.push_back(view(entry, now));
        }
    }
    std::sort(result.begin(), result.end(),
              [](const MatchmakerEntry& a, const MatchmakerEntry& b) {
                  if (a.registered_at != b.registered_at) return a.registered_at < b.registered_at;
                  return a.server_id < b.server_id;
              });
    return result;
}

LivenessSummary LivenessRegistry::summary() const {
    auto now = clock_.now();
    LivenessSummary out;
    out.heartbeat_timeout = options_.heartbeat_timeout;

    std::lock_guard lock(mutex_);
    out.total_registered = entries_.size();
    for (const auto& [id, entry] : entries_) {
        if (!is_live(entry, now)) continue;
        ++out.active_servers;
        out.total_players += entry.current_players;
    }
    return out;
}

size_t LivenessRegistry::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

// ─────────────────────────────────────────────
// Eviction
// ─────────────────────────────────────────────

std::vector<ServerId> LivenessRegistry::sweep() {
    auto now = clock_.now();
    auto limit = options_.heartbeat_timeout + options_.eviction_grace;
    std::vector<ServerId> evicted;

    std::lock_guard lock(mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.last_heartbeat >= limit) {
            evicted.push_back(it->first);
            by_address_.erase(address_key(it->second.ip, it->second.port));
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

}  // namespace game_factory
