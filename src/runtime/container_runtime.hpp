/**
 * @file container_runtime.hpp
 * @brief Narrow capability interface to the container runtime.
 *
 * The provisioning pipeline only ever talks to IContainerRuntime, so a test
 * double can replace the Docker backend without touching pipeline logic.
 * All calls may block; callers must not hold registry locks across them.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace game_factory {

/**
 * @brief Everything needed to build one image.
 *
 * `files` maps a path relative to the build context to its content; it
 * always contains a "Dockerfile" entry.
 */
struct BuildDescriptor {
    std::string image_tag;
    std::map<std::string, std::string> files;
    std::map<std::string, std::string> labels;
};

struct PortBinding {
    Port host_port{0};
    Port container_port{0};
};

struct RunOptions {
    std::string container_name;
    std::string network;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> labels;
};

/**
 * @brief Coarse container state as reported by the runtime.
 */
enum class ContainerState : uint8_t {
    Running,
    Exited,
    Missing,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(ContainerState state) noexcept {
    switch (state) {
        case ContainerState::Running: return "running";
        case ContainerState::Exited:  return "exited";
        case ContainerState::Missing: return "missing";
        case ContainerState::Unknown: return "unknown";
    }
    return "unknown";
}

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    virtual Result<ImageRef> build_image(const BuildDescriptor& descriptor) = 0;
    virtual Result<ContainerRef> run_container(const ImageRef& image,
                                               const PortBinding& binding,
                                               const RunOptions& options) = 0;
    virtual Result<void> stop(const ContainerRef& container) = 0;
    virtual Result<void> remove(const ContainerRef& container) = 0;
    virtual Result<void> remove_image(const ImageRef& image) = 0;
    virtual Result<ResourceUsage> stats(const ContainerRef& container) = 0;
    virtual Result<std::vector<std::string>> logs(const ContainerRef& container,
                                                  uint32_t tail) = 0;
    virtual Result<ContainerState> state(const ContainerRef& container) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace game_factory
