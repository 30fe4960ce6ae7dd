/**
 * @file mock_runtime.hpp
 * @brief In-process IContainerRuntime for tests and the demo mode.
 *
 * Keeps fake images and containers in memory. Every operation can be made
 * to fail on demand, and call counters let tests assert that a code path
 * never touched the runtime.
 */

#pragma once

#include "runtime/container_runtime.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>

namespace game_factory {

class MockRuntime : public IContainerRuntime {
public:
    enum class Op : uint8_t {
        Build,
        Run,
        Stop,
        Remove,
        RemoveImage,
        Stats,
        Logs,
        State
    };

    struct CallCounts {
        uint32_t build{0};
        uint32_t run{0};
        uint32_t stop{0};
        uint32_t remove{0};
        uint32_t remove_image{0};
        uint32_t stats{0};
        uint32_t logs{0};
        uint32_t state{0};

        [[nodiscard]] uint32_t total() const noexcept {
            return build + run + stop + remove + remove_image + stats + logs + state;
        }
    };

    MockRuntime() = default;

    // IContainerRuntime
    Result<ImageRef> build_image(const BuildDescriptor& descriptor) override;
    Result<ContainerRef> run_container(const ImageRef& image,
                                       const PortBinding& binding,
                                       const RunOptions& options) override;
    Result<void> stop(const ContainerRef& container) override;
    Result<void> remove(const ContainerRef& container) override;
    Result<void> remove_image(const ImageRef& image) override;
    Result<ResourceUsage> stats(const ContainerRef& container) override;
    Result<std::vector<std::string>> logs(const ContainerRef& container,
                                          uint32_t tail) override;
    Result<ContainerState> state(const ContainerRef& container) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "mock"; }

    // Test helpers
    void fail(Op op, std::string message = "injected failure");
    void succeed(Op op);
    void set_state(const ContainerRef& container, ContainerState state);
    void set_stats(const ContainerRef& container, ResourceUsage usage);
    void append_log(const ContainerRef& container, std::string line);

    [[nodiscard]] CallCounts calls() const;
    [[nodiscard]] size_t container_count() const;
    [[nodiscard]] size_t image_count() const;
    [[nodiscard]] bool has_container(const ContainerRef& container) const;
    [[nodiscard]] bool has_image(const ImageRef& image) const;
    [[nodiscard]] std::vector<Port> bound_ports() const;
    [[nodiscard]] std::optional<BuildDescriptor> last_build() const;

private:
    struct FakeContainer {
        ImageRef image;
        PortBinding binding;
        RunOptions options;
        ContainerState state{ContainerState::Running};
        ResourceUsage usage;
        std::vector<std::string> logs;
    };

    /// Returns the injected error for @p op, if any. Caller holds mutex_.
    std::optional<Error> injected(Op op, ErrorCode code) const;

    mutable std::mutex mutex_;
    std::unordered_map<Op, std::string> failures_;
    std::set<ImageRef> images_;
    std::unordered_map<ContainerRef, FakeContainer> containers_;
    std::optional<BuildDescriptor> last_build_;
    CallCounts calls_;
    uint64_t next_container_{1};
};

}  // namespace game_factory
