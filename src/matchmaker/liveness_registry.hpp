/**
 * @file liveness_registry.hpp
 * @brief Matchmaker registry of self-reporting game servers.
 *
 * Servers register themselves and heartbeat periodically. Liveness is
 * always computed from `last_heartbeat` against the injected clock, so an
 * entry that has lapsed reads as expired even before the EvictionSweeper
 * removes it.
 */

#pragma once

#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace game_factory {

struct MatchmakerEntry {
    ServerId server_id;
    std::string ip;
    Port port{0};
    std::string name;
    uint32_t max_players{20};
    uint32_t current_players{0};
    std::map<std::string, std::string> metadata;
    Timestamp registered_at{};
    Timestamp last_heartbeat{};

    /// Computed at read time, never stored.
    bool active{false};
};

struct RegistrationRequest {
    std::optional<ServerId> server_id;      ///< Caller-chosen id, accepted when unused
    std::string ip;
    Port port{0};
    std::string name;
    std::optional<uint32_t> max_players;    ///< Defaults to LivenessOptions::default_max_players
    uint32_t current_players{0};
    std::map<std::string, std::string> metadata;
};

struct LivenessSummary {
    size_t active_servers{0};
    size_t total_registered{0};
    uint64_t total_players{0};
    Duration heartbeat_timeout{0};
};

struct LivenessOptions {
    Duration heartbeat_timeout{30000};
    Duration eviction_grace{0};             ///< Extra time before a lapsed entry is swept
    uint32_t default_max_players{20};
};

[[nodiscard]] LivenessOptions liveness_options_from(const MatchmakerConfig& config);

class LivenessRegistry {
public:
    static constexpr size_t MAX_NAME_LENGTH = 100;
    static constexpr uint32_t MAX_PLAYERS_LIMIT = 100;

    LivenessRegistry(LivenessOptions options, const IClock& clock, Logger& logger);

    /**
     * @brief Add a server, or refresh the one already known at ip:port.
     *
     * With a caller id: accepted when unused or already bound to the same
     * ip:port, otherwise InvalidInput. Without one: an existing entry for
     * ip:port is refreshed and keeps its id; else a fresh id is generated.
     */
    Result<ServerId> register_server(RegistrationRequest request);

    /**
     * @brief Refresh `last_heartbeat` (and the player count when given).
     *
     * NotFound once the entry has been swept or unregistered. A lapsed
     * entry that has not been swept yet becomes active again.
     */
    Result<void> heartbeat(const ServerId& id, std::optional<uint32_t> current_players = std::nullopt);

    /// NotFound if unknown, Gone if lapsed but not yet swept.
    [[nodiscard]] Result<MatchmakerEntry> get(const ServerId& id) const;

    /// Ordered by registration time.
    [[nodiscard]] std::vector<MatchmakerEntry> list(bool active_only = true) const;

    Result<void> unregister(const ServerId& id);

    /// Remove every entry with now - last_heartbeat >= timeout + grace; returns their ids.
    std::vector<ServerId> sweep();

    [[nodiscard]] LivenessSummary summary() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] const LivenessOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] bool is_live(const MatchmakerEntry& entry, Timestamp now) const noexcept;
    [[nodiscard]] MatchmakerEntry view(const MatchmakerEntry& entry, Timestamp now) const;
    static std::string address_key(const std::string& ip, Port port);

    LivenessOptions options_;
    const IClock& clock_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::unordered_map<ServerId, MatchmakerEntry> entries_;
    std::unordered_map<std::string, ServerId> by_address_;
};

}  // namespace game_factory
