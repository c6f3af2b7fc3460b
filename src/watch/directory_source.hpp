/**
 * @file directory_source.hpp
 * @brief Watch source backed by a directory of TOML gateway documents.
 * @author Dimitris Kafetzis
 *
 * Every `*.toml` file in the directory describes one gateway object:
 *
 *   [metadata]
 *   namespace = "submariner-operator"
 *   name = "gw-node-1"
 *
 *   [status]
 *   haStatus = "active"
 *
 *   [[status.connections]]
 *   status = "connected"
 *   endpoint = { cluster_id = "east" }
 *
 * A dedicated std::jthread rescans the directory at the poll interval and
 * turns file changes into Add/Update/Delete notifications. Every resync
 * interval all cached objects are redelivered as Add.
 */

#pragma once

#include "core/logger.hpp"
#include "watch/object_store.hpp"
#include "watch/watch_source.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace gateway_status {

class DirectorySource : public IWatchSource {
public:
    DirectorySource(std::filesystem::path directory,
                    uint32_t poll_interval_ms,
                    uint32_t resync_interval_ms,
                    Logger& logger);
    ~DirectorySource() override;

    // Non-copyable
    DirectorySource(const DirectorySource&) = delete;
    DirectorySource& operator=(const DirectorySource&) = delete;

    // IWatchSource
    Result<void> start(WatchHandlers handlers) override;
    void stop() override;
    Result<std::optional<GatewayObject>> get_by_key(const ObjectKey& key) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "directory"; }

    /// Rescan once and deliver the resulting notifications. Returns how many were delivered.
    size_t poll_once();

    /// Redeliver Add for every cached object.
    void resync_once();

    [[nodiscard]] const ObjectStore& store() const noexcept { return store_; }

private:
    struct FileState {
        ObjectKey key;
        std::string content;
    };

    Result<std::map<std::filesystem::path, std::string>> read_directory() const;
    void poll_loop(std::stop_token stop);
    size_t remove_file(const std::filesystem::path& path);

    std::filesystem::path directory_;
    uint32_t poll_interval_ms_;
    uint32_t resync_interval_ms_;
    Logger& logger_;

    ObjectStore store_;
    WatchHandlers handlers_;

    std::mutex scan_mutex_;
    std::unordered_map<std::string, FileState> files_;

    std::jthread poll_thread_;
};

}  // namespace gateway_status
