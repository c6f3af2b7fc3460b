/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <memory>
#include <mutex>

namespace gateway_status {

/**
 * @brief Collects and logs structured controller events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_watch_event(std::string_view event_type, const ObjectKey& key);
    void record_table_published(const ObjectKey& key, uint64_t version, size_t reachable_count);
    void record_table_reset(const ObjectKey& key, uint64_t version);
    void record_requeue(const ObjectKey& key, uint32_t attempts);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace gateway_status
