/**
 * @file clock.hpp
 * @brief Injectable wall clock for registries and liveness checks.
 */

#pragma once

#include "core/types.hpp"

#include <mutex>

namespace game_factory {

class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual Timestamp now() const = 0;
};

class SystemClock : public IClock {
public:
    [[nodiscard]] Timestamp now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Manually driven clock for deterministic tests and simulation.
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp start = std::chrono::system_clock::now())
        : now_(start) {}

    [[nodiscard]] Timestamp now() const override {
        std::lock_guard lock(mutex_);
        return now_;
    }

    void set(Timestamp t) {
        std::lock_guard lock(mutex_);
        now_ = t;
    }

    void advance(Duration d) {
        std::lock_guard lock(mutex_);
        now_ += d;
    }

private:
    mutable std::mutex mutex_;
    Timestamp now_;
};

}  // namespace game_factory
