/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace game_factory {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_host_snapshot(const ResourceSnapshot& snap);
    void record_provision_success(const ServerId& id, Port port, Duration duration);
    void record_provision_failure(ErrorCode code, Duration duration);
    void record_admission_denied(std::string_view reason);
    void record_status_change(const ServerId& id, InstanceStatus from, InstanceStatus to);
    void record_liveness_eviction(const ServerId& id);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace game_factory
