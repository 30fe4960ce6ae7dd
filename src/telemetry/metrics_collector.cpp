/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace game_factory {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_host_snapshot(const ResourceSnapshot& snap) {
    std::ostringstream oss;
    oss << R"({"event":"host_snapshot")"
        << R"(,"host":")" << json_escape(snap.host_id) << "\""
        << R"(,"cpu_pct":)" << snap.cpu_usage_percent
        << R"(,"mem_pct":)" << snap.memory_usage_percent()
        << R"(,"mem_avail_mb":)" << (snap.memory_available_bytes / (1024 * 1024))
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_provision_success(const ServerId& id, Port port, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"provision_result")"
        << R"(,"server":")" << json_escape(id) << "\""
        << R"(,"outcome":"ok")"
        << R"(,"port":)" << port
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_provision_failure(ErrorCode code, Duration duration) {
    std::ostringstream oss;
    oss << R"({"event":"provision_result")"
        << R"(,"server":"-")"
        << R"(,"outcome":")" << to_string(code) << "\""
        << R"(,"duration_ms":)" << duration.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_admission_denied(std::string_view reason) {
    std::ostringstream oss;
    oss << R"({"event":"admission_denied")"
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_status_change(const ServerId& id,
                                            InstanceStatus from,
                                            InstanceStatus to) {
    std::ostringstream oss;
    oss << R"({"event":"status_change")"
        << R"(,"server":")" << json_escape(id) << "\""
        << R"(,"from":")" << to_string(from) << "\""
        << R"(,"to":")" << to_string(to) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_liveness_eviction(const ServerId& id) {
    std::ostringstream oss;
    oss << R"({"event":"liveness_eviction")"
        << R"(,"server":")" << json_escape(id) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace game_factory
