/**
 * @file mock_runtime.cpp
 * @brief MockRuntime implementation.
 */

#include "runtime/mock_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>

namespace game_factory {

std::optional<Error> MockRuntime::injected(Op op, ErrorCode code) const {
    auto it = failures_.find(op);
    if (it == failures_.end()) return std::nullopt;
    return Error{code, it->second};
}

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

Result<ImageRef> MockRuntime::build_image(const BuildDescriptor& descriptor) {
    std::lock_guard lock(mutex_);
    ++calls_.build;
    if (auto err = injected(Op::Build, ErrorCode::BuildFailed)) return *err;
    if (descriptor.files.find("Dockerfile") == descriptor.files.end()) {
        return Error{ErrorCode::BuildFailed, "Build descriptor has no Dockerfile"};
    }

    last_build_ = descriptor;
    images_.insert(descriptor.image_tag);
    return ImageRef{descriptor.image_tag};
}

Result<ContainerRef> MockRuntime::run_container(const ImageRef& image,
                                                const PortBinding& binding,
                                                const RunOptions& options) {
    std::lock_guard lock(mutex_);
    ++calls_.run;
    if (auto err = injected(Op::Run, ErrorCode::LaunchFailed)) return *err;
    if (images_.count(image) == 0) {
        return Error{ErrorCode::LaunchFailed, "No such image: " + image};
    }
    for (const auto& [ref, c] : containers_) {
        if (c.state == ContainerState::Running && c.binding.host_port == binding.host_port) {
            return Error{ErrorCode::LaunchFailed,
                         "Bind for 0.0.0.0:" + std::to_string(binding.host_port)
                         + " failed: port is already allocated"};
        }
    }

    char id[17];
    std::snprintf(id, sizeof(id), "%016llx", static_cast<unsigned long long>(next_container_++));
    ContainerRef ref{id};

    FakeContainer container;
    container.image = image;
    container.binding = binding;
    container.options = options;
    container.logs.push_back("Game server listening on port "
                             + std::to_string(binding.container_port));
    containers_.emplace(ref, std::move(container));
    return ref;
}

Result<void> MockRuntime::stop(const ContainerRef& container) {
    std::lock_guard lock(mutex_);
    ++calls_.stop;
    if (auto err = injected(Op::Stop, ErrorCode::RuntimeUnavailable)) return *err;
    auto it = containers_.find(container);
    if (it == containers_.end()) {
        return Error{ErrorCode::RuntimeUnavailable, "No such container: " + container};
    }
    it->second.state = ContainerState::Exited;
    return Result<void>{};
}

Result<void> MockRuntime::remove(const ContainerRef& container) {
    std::lock_guard lock(mutex_);
    ++calls_.remove;
    if (auto err = injected(Op::Remove, ErrorCode::RuntimeUnavailable)) return *err;
    containers_.erase(container);
    return Result<void>{};
}

Result<void> MockRuntime::remove_image(const ImageRef& image) {
    std::lock_guard lock(mutex_);
    ++calls_.remove_image;
    if (auto err = injected(Op::RemoveImage, ErrorCode::RuntimeUnavailable)) return *err;
    images_.erase(image);
    return Result<void>{};
}

Result<ResourceUsage> MockRuntime::stats(const ContainerRef& container) {
    std::lock_guard lock(mutex_);
    ++calls_.stats;
    if (auto err = injected(Op::Stats, ErrorCode::RuntimeUnavailable)) return *err;
    auto it = containers_.find(container);
    if (it == containers_.end()) {
        return Error{ErrorCode::RuntimeUnavailable, "No such container: " + container};
    }
    auto usage = it->second.usage;
    usage.observed_at = std::chrono::system_clock::now();
    return usage;
}

Result<std::vector<std::string>> MockRuntime::logs(const ContainerRef& container,
                                                  uint32_t tail) {
    std::lock_guard lock(mutex_);
    ++calls_.logs;
    if (auto err = injected(Op::Logs, ErrorCode::RuntimeUnavailable)) return *err;
    auto it = containers_.find(container);
    if (it == containers_.end()) {
        return Error{ErrorCode::RuntimeUnavailable, "No such container: " + container};
    }
    const auto& all = it->second.logs;
    auto skip = all.size() > tail ? all.size() - tail : 0;
    return std::vector<std::string>(all.begin() + static_cast<std::ptrdiff_t>(skip), all.end());
}

Result<ContainerState> MockRuntime::state(const ContainerRef& container) {
    std::lock_guard lock(mutex_);
    ++calls_.state;
    if (auto err = injected(Op::State, ErrorCode::RuntimeUnavailable)) return *err;
    auto it = containers_.find(container);
    if (it == containers_.end()) return ContainerState::Missing;
    return it->second.state;
}

// ─────────────────────────────────────────────
// Test helpers
// ─────────────────────────────────────────────

void MockRuntime::fail(Op op, std::string message) {
    std::lock_guard lock(mutex_);
    failures_[op] = std::move(message);
}

void MockRuntime::succeed(Op op) {
    std::lock_guard lock(mutex_);
    failures_.erase(op);
}

void MockRuntime::set_state(const ContainerRef& container, ContainerState state) {
    std::lock_guard lock(mutex_);
    if (state == ContainerState::Missing) {
        containers_.erase(container);
        return;
    }
    auto it = containers_.find(container);
    if (it != containers_.end()) it->second.state = state;
}

void MockRuntime::set_stats(const ContainerRef& container, ResourceUsage usage) {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(container);
    if (it != containers_.end()) it->second.usage = usage;
}

void MockRuntime::append_log(const ContainerRef& container, std::string line) {
    std::lock_guard lock(mutex_);
    auto it = containers_.find(container);
    if (it != containers_.end()) it->second.logs.push_back(std::move(line));
}

MockRuntime::CallCounts MockRuntime::calls() const {
    std::lock_guard lock(mutex_);
    return calls_;
}

size_t MockRuntime::container_count() const {
    std::lock_guard lock(mutex_);
    return containers_.size();
}

size_t MockRuntime::image_count() const {
    std::lock_guard lock(mutex_);
    return images_.size();
}

bool MockRuntime::has_container(const ContainerRef& container) const {
    std::lock_guard lock(mutex_);
    return containers_.count(container) > 0;
}

bool MockRuntime::has_image(const ImageRef& image) const {
    std::lock_guard lock(mutex_);
    return images_.count(image) > 0;
}

std::vector<Port> MockRuntime::bound_ports() const {
    std::lock_guard lock(mutex_);
    std::vector<Port> ports;
    for (const auto& [ref, c] : containers_) {
        if (c.state == ContainerState::Running) ports.push_back(c.binding.host_port);
    }
    std::sort(ports.begin(), ports.end());
    return ports;
}

std::optional<BuildDescriptor> MockRuntime::last_build() const {
    std::lock_guard lock(mutex_);
    return last_build_;
}

}  // namespace game_factory
