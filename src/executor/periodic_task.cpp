/**
 * @file periodic_task.cpp
 * @brief PeriodicTask implementation.
 */

#include "executor/periodic_task.hpp"

#include <exception>

namespace game_factory {

PeriodicTask::PeriodicTask(std::string name, Duration interval, Tick tick, Logger& logger)
    : name_(std::move(name))
    , interval_(interval)
    , tick_(std::move(tick))
    , logger_(logger) {}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    if (running_.exchange(true)) return;
    thread_ = std::jthread([this](std::stop_token st) { loop(std::move(st)); });
    logger_.debug("Periodic task '" + name_ + "' started, interval "
                  + std::to_string(interval_.count()) + "ms");
}

void PeriodicTask::stop() {
    if (!running_.exchange(false)) return;
    thread_.request_stop();
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    logger_.debug("Periodic task '" + name_ + "' stopped");
}

void PeriodicTask::loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(mutex_);
            if (cv_.wait_for(lock, stop, interval_,
                             [&stop] { return stop.stop_requested(); })) {
                break;
            }
        }
        if (stop.stop_requested()) break;

        try {
            tick_();
        } catch (const std::exception& e) {
            failures_.fetch_add(1);
            logger_.error("Periodic task '" + name_ + "' tick failed: " + e.what());
        } catch (...) {
            failures_.fetch_add(1);
            logger_.error("Periodic task '" + name_ + "' tick failed: unknown exception");
        }
        ticks_.fetch_add(1);
    }
}

}  // namespace game_factory
