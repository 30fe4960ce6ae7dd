/**
 * @file port_allocator.cpp
 * @brief PortAllocator implementation.
 */

#include "provisioning/port_allocator.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <unordered_set>

namespace game_factory {

bool is_port_bindable(Port port) {
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    bool free = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return free;
}

PortAllocator::PortAllocator(PortConfig range, LeaseSource external_leases, PortProbe probe)
    : range_(range)
    , external_leases_(std::move(external_leases))
    , probe_(std::move(probe)) {}

Result<Port> PortAllocator::allocate() {
    std::lock_guard lock(mutex_);

    std::unordered_set<Port> external;
    if (external_leases_) {
        for (Port p : external_leases_()) external.insert(p);
    }

    // uint32_t so that end == 65535 terminates
    for (uint32_t candidate = range_.base; candidate <= range_.end; ++candidate) {
        auto port = static_cast<Port>(candidate);
        if (leased_.count(port) > 0 || external.count(port) > 0) continue;
        if (probe_ && !probe_(port)) continue;

        leased_.insert(port);
        return port;
    }

    return Error{ErrorCode::NoPortAvailable,
                 "No available ports in range " + std::to_string(range_.base)
                 + "-" + std::to_string(range_.end)};
}

bool PortAllocator::release(Port port) {
    std::lock_guard lock(mutex_);
    return leased_.erase(port) > 0;
}

bool PortAllocator::is_leased(Port port) const {
    std::lock_guard lock(mutex_);
    return leased_.count(port) > 0;
}

size_t PortAllocator::leased_count() const {
    std::lock_guard lock(mutex_);
    return leased_.size();
}

size_t PortAllocator::capacity() const noexcept {
    if (range_.end < range_.base) return 0;
    return static_cast<size_t>(range_.end - range_.base) + 1;
}

}  // namespace game_factory
