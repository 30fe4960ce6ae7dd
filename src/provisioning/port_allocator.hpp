/**
 * @file port_allocator.hpp
 * @brief Host port leasing from a bounded range.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <mutex>
#include <set>
#include <vector>

namespace game_factory {

/**
 * @brief Non-blocking bind-and-release check on 0.0.0.0:@p port (TCP).
 */
[[nodiscard]] bool is_port_bindable(Port port);

/**
 * @brief Leases host ports from an inclusive range in ascending order.
 *
 * A port is handed out only if it is not leased here, not attached to a
 * registry record (LeaseSource), and the probe reports it free on the
 * host. The lease is recorded before allocate() returns, so concurrent
 * callers never receive the same port; it stays leased until release().
 *
 * Lock order: the allocator lock is taken before anything LeaseSource
 * locks. Nothing may call back into the allocator from a LeaseSource.
 */
class PortAllocator {
public:
    using LeaseSource = std::function<std::vector<Port>()>;
    using PortProbe = std::function<bool(Port)>;

    explicit PortAllocator(PortConfig range,
                           LeaseSource external_leases = {},
                           PortProbe probe = is_port_bindable);

    PortAllocator(const PortAllocator&) = delete;
    PortAllocator& operator=(const PortAllocator&) = delete;

    /// Lease the lowest free port, or NoPortAvailable.
    Result<Port> allocate();

    /// Return @p port to the pool. Returns false if it was not leased.
    bool release(Port port);

    [[nodiscard]] bool is_leased(Port port) const;
    [[nodiscard]] size_t leased_count() const;
    [[nodiscard]] size_t capacity() const noexcept;

private:
    PortConfig range_;
    LeaseSource external_leases_;
    PortProbe probe_;

    mutable std::mutex mutex_;
    std::set<Port> leased_;
};

}  // namespace game_factory
