/**
 * @file directory_source.cpp
 * @brief DirectorySource implementation.
 * @author Dimitris Kafetzis
 */

#include "watch/directory_source.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace gateway_status {

namespace {

constexpr std::string_view kDocumentExtension = ".toml";

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return Error{ErrorKind::Transient, "cannot open " + path.string()};
    }
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction / Destruction
// ─────────────────────────────────────────────

DirectorySource::DirectorySource(std::filesystem::path directory,
                                 uint32_t poll_interval_ms,
                                 uint32_t resync_interval_ms,
                                 Logger& logger)
    : directory_(std::move(directory))
    , poll_interval_ms_(poll_interval_ms == 0 ? 1000 : poll_interval_ms)
    , resync_interval_ms_(resync_interval_ms)
    , logger_(logger) {}

DirectorySource::~DirectorySource() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> DirectorySource::start(WatchHandlers handlers) {
    if (poll_thread_.joinable()) {
        return Error{ErrorKind::Generic, "directory source already started"};
    }

    // The initial listing must succeed; later scan failures are only logged
    auto listing = read_directory();
    if (!listing) {
        return Error{ErrorKind::Unavailable,
                     "cannot list gateways in " + directory_.string() + ": "
                     + listing.error().message};
    }

    {
        std::lock_guard lock(scan_mutex_);
        handlers_ = std::move(handlers);
    }

    poll_thread_ = std::jthread([this](std::stop_token stop) {
        poll_loop(stop);
    });
    return Result<void>{};
}

void DirectorySource::stop() {
    if (poll_thread_.joinable()) {
        poll_thread_.request_stop();
        poll_thread_.join();
    }
}

Result<std::optional<GatewayObject>> DirectorySource::get_by_key(const ObjectKey& key) const {
    return store_.get(key);
}

// ─────────────────────────────────────────────
// Scanning
// ─────────────────────────────────────────────

Result<std::map<std::filesystem::path, std::string>> DirectorySource::read_directory() const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return Error{ErrorKind::Unavailable, "not a directory"};
    }

    std::map<std::filesystem::path, std::string> contents;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return Error{ErrorKind::Unavailable, ec.message()};
    }

    for (; it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        if (ec) {
            return Error{ErrorKind::Unavailable, ec.message()};
        }
        const auto& entry = *it;
        if (!entry.is_regular_file(ec)) continue;
        if (entry.path().extension().string() != kDocumentExtension) continue;

        auto text = read_file(entry.path());
        if (!text) {
            // File vanished or is unreadable between listing and reading
            logger_.warn(text.error().message);
            continue;
        }
        contents.emplace(entry.path(), std::move(*text));
    }
    return contents;
}

size_t DirectorySource::poll_once() {
    std::lock_guard lock(scan_mutex_);

    auto listing = read_directory();
    if (!listing) {
        logger_.warn("Rescan of " + directory_.string() + " failed: " + listing.error().message);
        return 0;
    }

    size_t delivered = 0;

    // Removed files
    std::vector<std::filesystem::path> gone;
    for (const auto& [path, state] : files_) {
        if (listing->count(std::filesystem::path{path}) == 0) gone.emplace_back(path);
    }
    for (const auto& path : gone) {
        delivered += remove_file(path);
    }

    // New and changed files
    for (const auto& [path, content] : *listing) {
        auto known = files_.find(path.string());
        if (known != files_.end() && known->second.content == content) continue;

        auto parsed = parse_gateway_document(content, path.stem().string());
        if (!parsed) {
            logger_.warn("Skipping gateway document " + path.string() + ": "
                         + parsed.error().message);
            // Keep the last good object; warn again only when the file changes
            if (known != files_.end()) {
                known->second.content = content;
            } else {
                files_[path.string()] = FileState{.key = {}, .content = content};
            }
            continue;
        }

        const auto key = parsed->key;
        bool claimed = false;
        for (const auto& [other_path, state] : files_) {
            if (other_path != path.string() && state.key == key) {
                claimed = true;
                break;
            }
        }
        if (claimed) {
            logger_.warn("Skipping " + path.string() + ": gateway " + key.str()
                         + " is already defined by another file");
            continue;
        }

        // Identity changed inside the same file: report the old one as deleted
        if (known != files_.end() && known->second.key != key) {
            delivered += remove_file(path);
        }

        auto previous = store_.upsert(std::move(*parsed));
        auto current = store_.get(key);
        files_[path.string()] = FileState{.key = key, .content = content};
        if (!current) continue;

        if (previous) {
            if (handlers_.on_update) handlers_.on_update(*previous, *current);
        } else {
            if (handlers_.on_add) handlers_.on_add(*current);
        }
        ++delivered;
    }

    return delivered;
}

size_t DirectorySource::remove_file(const std::filesystem::path& path) {
    auto it = files_.find(path.string());
    if (it == files_.end()) return 0;

    auto removed = store_.remove(it->second.key);
    files_.erase(it);
    if (!removed) return 0;

    if (handlers_.on_delete) handlers_.on_delete(DeleteEvent{std::move(*removed)});
    return 1;
}

void DirectorySource::resync_once() {
    std::lock_guard lock(scan_mutex_);
    if (!handlers_.on_add) return;
    for (const auto& obj : store_.list()) {
        handlers_.on_add(obj);
    }
}

// ─────────────────────────────────────────────
// Poll Thread
// ─────────────────────────────────────────────

void DirectorySource::poll_loop(std::stop_token stop) {
    auto next_resync = std::chrono::steady_clock::now()
                     + std::chrono::milliseconds(resync_interval_ms_);

    while (!stop.stop_requested()) {
        poll_once();

        if (resync_interval_ms_ > 0 && std::chrono::steady_clock::now() >= next_resync) {
            logger_.debug("Resyncing " + std::to_string(store_.size()) + " gateway objects");
            resync_once();
            next_resync = std::chrono::steady_clock::now()
                        + std::chrono::milliseconds(resync_interval_ms_);
        }

        // Sleep in small increments to respond to stop requests promptly
        auto deadline = std::chrono::steady_clock::now()
                      + std::chrono::milliseconds(poll_interval_ms_);
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }
}

}  // namespace gateway_status
