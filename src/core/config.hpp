/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"

namespace gateway_status {

struct WatchConfig {
    std::string source = "directory";               ///< "directory", or "memory" (demo replay)
    std::filesystem::path directory = "./gateways";
    uint32_t poll_interval_ms = 1000;
    uint32_t resync_interval_ms = 30000;            ///< 0 disables resync

    /// Only the directory source is fed from outside the process.
    [[nodiscard]] bool has_external_feed() const noexcept { return source == "directory"; }
};

struct QueueConfig {
    uint32_t base_delay_ms = 5;
    uint32_t max_delay_ms = 1000000;
};

/**
 * @brief What happens to a clusterId the active gateway no longer lists.
 */
enum class AbsentPolicy : uint8_t {
    Retain,     ///< keep the last published value
    Prune       ///< drop it from the table
};

struct ReconcilerConfig {
    AbsentPolicy absent_policy = AbsentPolicy::Retain;
};

struct StatusConfig {
    uint32_t report_interval_ms = 30000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    bool metrics_enabled = false;
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    WatchConfig watch;
    QueueConfig queue;
    ReconcilerConfig reconciler;
    StatusConfig status;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Unknown enum values and out-of-range
 * numbers are rejected with ErrorKind::InvalidConfig.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

Result<AbsentPolicy> parse_absent_policy(std::string_view text);
[[nodiscard]] std::string_view to_string(AbsentPolicy policy) noexcept;

}  // namespace gateway_status
