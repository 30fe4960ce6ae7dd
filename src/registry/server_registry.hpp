/**
 * @file server_registry.hpp
 * @brief Authoritative in-memory table of provisioned game servers.
 */

#pragma once

#include "core/clock.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace game_factory {

/**
 * @brief One provisioned game server.
 *
 * `container_ref` is set exactly when a launch succeeded. `logs` holds the
 * retained tail only, oldest line first.
 */
struct GameServerInstance {
    ServerId server_id;
    std::string name;
    std::string description;
    InstanceStatus status{InstanceStatus::Provisioning};

    std::optional<ContainerRef> container_ref;
    std::optional<ImageRef> image_ref;
    std::optional<Port> port;

    Timestamp created_at{};
    Timestamp updated_at{};
    Timestamp last_activity{};          ///< Launch or last reported activity
    uint32_t connection_count{0};       ///< As last reported by the game server

    ResourceUsage resource_usage;
    std::vector<std::string> logs;
};

/**
 * @brief Thread-safe keyed store of GameServerInstance.
 *
 * Readers share the lock, writers take it exclusively. Nothing here calls
 * out to the container runtime or the port allocator, so the lock is
 * always held briefly.
 */
class ServerRegistry {
public:
    using Mutator = std::function<void(GameServerInstance&)>;

    explicit ServerRegistry(const IClock& clock);

    /// Insert or replace. Refuses a port already used by another active instance.
    Result<void> upsert(GameServerInstance instance);

    /// Like upsert(), but an existing record with the same id is an error.
    Result<void> insert(GameServerInstance instance);

    /**
     * @brief Apply @p mutate to the stored record under the write lock.
     *
     * The mutator must not block. A status change it makes is checked
     * against is_valid_transition() and rolled back when illegal.
     */
    Result<GameServerInstance> update(const ServerId& id, const Mutator& mutate);

    /// Move @p id to @p to; returns the previous status.
    Result<InstanceStatus> transition(const ServerId& id, InstanceStatus to);

    Result<void> erase(const ServerId& id);

    [[nodiscard]] Result<GameServerInstance> get(const ServerId& id) const;

    /// Copy of every record, oldest first.
    [[nodiscard]] std::vector<GameServerInstance> list() const;

    [[nodiscard]] std::vector<GameServerInstance> list(InstanceStatus status) const;

    /// Ports attached to any record still in the table.
    [[nodiscard]] std::vector<Port> leased_ports() const;

    /// Number of records in provisioning or running.
    [[nodiscard]] size_t active_count() const;

    [[nodiscard]] std::map<InstanceStatus, size_t> status_counts() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const ServerId& id) const;

private:
    /// Caller holds the write lock.
    Result<void> store_locked(GameServerInstance instance, bool replace);

    const IClock& clock_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<ServerId, GameServerInstance> servers_;
};

}  // namespace game_factory
