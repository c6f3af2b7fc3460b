/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

namespace gateway_status {

Result<AbsentPolicy> parse_absent_policy(std::string_view text) {
    if (text == "retain") return AbsentPolicy::Retain;
    if (text == "prune")  return AbsentPolicy::Prune;
    return Error{ErrorKind::InvalidConfig,
                 "Unknown reconciler.absent_policy: " + std::string{text}};
}

std::string_view to_string(AbsentPolicy policy) noexcept {
    switch (policy) {
        case AbsentPolicy::Retain: return "retain";
        case AbsentPolicy::Prune:  return "prune";
    }
    return "unknown";
}

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorKind::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [watch]
        if (auto watch = tbl["watch"]; watch.is_table()) {
            config.watch.source = watch["source"].value_or(std::string{"directory"});
            config.watch.directory = watch["directory"].value_or(std::string{"./gateways"});
            config.watch.poll_interval_ms = static_cast<uint32_t>(
                watch["poll_interval_ms"].value_or(int64_t{1000}));
            config.watch.resync_interval_ms = static_cast<uint32_t>(
                watch["resync_interval_ms"].value_or(int64_t{30000}));
        }
        if (config.watch.source != "directory" && config.watch.source != "memory") {
            return Error{ErrorKind::InvalidConfig,
                         "Unknown watch.source: " + config.watch.source};
        }
        if (config.watch.poll_interval_ms == 0) {
            return Error{ErrorKind::InvalidConfig, "watch.poll_interval_ms must be > 0"};
        }

        // [queue]
        if (auto queue = tbl["queue"]; queue.is_table()) {
            config.queue.base_delay_ms = static_cast<uint32_t>(
                queue["base_delay_ms"].value_or(int64_t{5}));
            config.queue.max_delay_ms = static_cast<uint32_t>(
                queue["max_delay_ms"].value_or(int64_t{1000000}));
        }
        if (config.queue.base_delay_ms == 0
            || config.queue.max_delay_ms < config.queue.base_delay_ms) {
            return Error{ErrorKind::InvalidConfig,
                         "queue delays must satisfy 0 < base_delay_ms <= max_delay_ms"};
        }

        // [reconciler]
        if (auto reconciler = tbl["reconciler"]; reconciler.is_table()) {
            auto policy = parse_absent_policy(
                reconciler["absent_policy"].value_or(std::string{"retain"}));
            if (!policy) return policy.error();
            config.reconciler.absent_policy = *policy;
        }

        // [status]
        if (auto status = tbl["status"]; status.is_table()) {
            config.status.report_interval_ms = static_cast<uint32_t>(
                status["report_interval_ms"].value_or(int64_t{30000}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_enabled = telemetry["metrics_enabled"].value_or(false);
        }
        if (auto level = parse_log_level(config.telemetry.log_level); !level) {
            return level.error();
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Malformed,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace gateway_status
