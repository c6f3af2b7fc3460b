/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace gateway_status {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_watch_event(std::string_view event_type, const ObjectKey& key) {
    std::ostringstream oss;
    oss << R"({"event":"watch_event")"
        << R"(,"type":")" << event_type << "\""
        << R"(,"key":")" << json_escape(key.str()) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_table_published(const ObjectKey& key,
                                              uint64_t version,
                                              size_t reachable_count) {
    std::ostringstream oss;
    oss << R"({"event":"table_published")"
        << R"(,"key":")" << json_escape(key.str()) << "\""
        << R"(,"version":)" << version
        << R"(,"reachable":)" << reachable_count
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_table_reset(const ObjectKey& key, uint64_t version) {
    std::ostringstream oss;
    oss << R"({"event":"table_reset")"
        << R"(,"key":")" << json_escape(key.str()) << "\""
        << R"(,"version":)" << version
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_requeue(const ObjectKey& key, uint32_t attempts) {
    std::ostringstream oss;
    oss << R"({"event":"requeue")"
        << R"(,"key":")" << json_escape(key.str()) << "\""
        << R"(,"attempts":)" << attempts
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
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

}  // namespace gateway_status
