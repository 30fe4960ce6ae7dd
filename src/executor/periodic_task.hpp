/**
 * @file periodic_task.hpp
 * @brief Cancellable fixed-interval background loop.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace game_factory {

/**
 * @brief Runs a callback every `interval` on its own std::jthread.
 *
 * stop() wakes the sleeping loop through the stop token and joins, so
 * shutdown never waits out a full interval. An exception escaping a tick
 * is logged and the loop carries on with the next one.
 */
class PeriodicTask {
public:
    using Tick = std::function<void()>;

    PeriodicTask(std::string name, Duration interval, Tick tick, Logger& logger);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the loop; the first tick runs after one interval. No-op if running.
    void start();

    /// Request stop and join. Safe to call more than once.
    void stop();

    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] uint64_t ticks() const noexcept { return ticks_.load(); }
    [[nodiscard]] uint64_t failures() const noexcept { return failures_.load(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void loop(std::stop_token stop);

    std::string name_;
    Duration interval_;
    Tick tick_;
    Logger& logger_;

    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::atomic<uint64_t> failures_{0};
};

}  // namespace game_factory
