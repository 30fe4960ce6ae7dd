/**
 * @file server_registry.cpp
 * @brief ServerRegistry implementation.
 */

#include "registry/server_registry.hpp"

#include <algorithm>
#include <mutex>

namespace game_factory {

namespace {

void sort_by_creation(std::vector<GameServerInstance>& servers) {
    std::sort(servers.begin(), servers.end(),
              [](const GameServerInstance& a, const GameServerInstance& b) {
                  if (a.created_at != b.created_at) return a.created_at < b.created_at;
                  return a.server_id < b.server_id;
              });
}

}  // anonymous namespace

ServerRegistry::ServerRegistry(const IClock& clock)
    : clock_(clock) {}

// ─────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────

Result<void> ServerRegistry::upsert(GameServerInstance instance) {
    std::unique_lock lock(mutex_);
    return store_locked(std::move(instance), true);
}

Result<void> ServerRegistry::insert(GameServerInstance instance) {
    std::unique_lock lock(mutex_);
    return store_locked(std::move(instance), false);
}

Result<void> ServerRegistry::store_locked(GameServerInstance instance, bool replace) {
    if (instance.server_id.empty()) {
        return Error{ErrorCode::InvalidInput, "Instance has no server_id"};
    }

    auto it = servers_.find(instance.server_id);
    if (it != servers_.end() && !replace) {
        return Error{ErrorCode::Internal, "Server id already registered: " + instance.server_id};
    }

    if (instance.port && is_active(instance.status)) {
        for (const auto& [id, other] : servers_) {
            if (id != instance.server_id && other.port == instance.port
                && is_active(other.status)) {
                return Error{ErrorCode::Internal,
                             "Port " + std::to_string(*instance.port)
                             + " already used by " + id};
            }
        }
    }

    auto now = clock_.now();
    if (it != servers_.end()) {
        instance.created_at = it->second.created_at;
    } else if (instance.created_at == Timestamp{}) {
        instance.created_at = now;
    }
    instance.updated_at = now;

    servers_.insert_or_assign(instance.server_id, std::move(instance));
    return Result<void>{};
}

Result<GameServerInstance> ServerRegistry::update(const ServerId& id, const Mutator& mutate) {
    std::unique_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }

    auto& record = it->second;
    auto before = record.status;
    mutate(record);
    record.server_id = id;

    if (record.status != before && !is_valid_transition(before, record.status)) {
        auto attempted = record.status;
        record.status = before;
        return Error{ErrorCode::InvalidInput,
                     "Illegal status transition " + std::string(to_string(before))
                     + " -> " + std::string(to_string(attempted)) + " for " + id};
    }

    record.updated_at = clock_.now();
    return record;
}

Result<InstanceStatus> ServerRegistry::transition(const ServerId& id, InstanceStatus to) {
    InstanceStatus previous = to;
    auto updated = update(id, [&](GameServerInstance& inst) {
        previous = inst.status;
        inst.status = to;
    });
    if (!updated) {
        return updated.error();
    }
    return previous;
}

Result<void> ServerRegistry::erase(const ServerId& id) {
    std::unique_lock lock(mutex_);
    if (servers_.erase(id) == 0) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }
    return Result<void>{};
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

Result<GameServerInstance> ServerRegistry::get(const ServerId& id) const {
    std::shared_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end()) {
        return Error{ErrorCode::NotFound, "Server not found: " + id};
    }
    return it->second;
}

std::vector<GameServerInstance> ServerRegistry::list() const {
    std::vector<GameServerInstance> result;
    {
        std::shared_lock lock(mutex_);
        result.reserve(servers_.size());
        for (const auto& [id, inst] : servers_) {
            result.push_back(inst);
        }
    }
    sort_by_creation(result);
    return result;
}

std::vector<GameServerInstance> ServerRegistry::list(InstanceStatus status) const {
    std::vector<GameServerInstance> result;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, inst] : servers_) {
            if (inst.status == status) result.push_back(inst);
        }
    }
    sort_by_creation(result);
    return result;
}

std::vector<Port> ServerRegistry::leased_ports() const {
    std::shared_lock lock(mutex_);
    std::vector<Port> ports;
    for (const auto& [id, inst] : servers_) {
        if (inst.port) ports.push_back(*inst.port);
    }
    return ports;
}

size_t ServerRegistry::active_count() const {
    std::shared_lock lock(mutex_);
    return static_cast<size_t>(
        std::count_if(servers_.begin(), servers_.end(),
                      [](const auto& entry) { return is_active(entry.second.status); }));
}

std::map<InstanceStatus, size_t> ServerRegistry::status_counts() const {
    std::shared_lock lock(mutex_);
    std::map<InstanceStatus, size_t> counts;
    for (const auto& [id, inst] : servers_) {
        ++counts[inst.status];
    }
    return counts;
}

size_t ServerRegistry::size() const {
    std::shared_lock lock(mutex_);
    return servers_.size();
}

bool ServerRegistry::contains(const ServerId& id) const {
    std::shared_lock lock(mutex_);
    return servers_.count(id) > 0;
}

}  // namespace game_factory
