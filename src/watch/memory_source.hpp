/**
 * @file memory_source.hpp
 * @brief Programmable in-process watch source for testing and demos.
 * @author Dimitris Kafetzis
 *
 * Mutations made before start() form the initial listing. After start()
 * they are queued and delivered in order by a dedicated std::jthread, the
 * way a real watch delivers them: the cache is updated first, then the
 * handler runs.
 */

#pragma once

#include "watch/object_store.hpp"
#include "watch/watch_source.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace gateway_status {

/**
 * @brief How a removal is reported to the delete handler.
 */
enum class DeleteMode : uint8_t {
    FinalObject,        ///< the removed object itself
    Tombstone,          ///< tombstone carrying the cached object
    EmptyTombstone      ///< tombstone without any payload
};

class MemorySource : public IWatchSource {
public:
    MemorySource() = default;
    ~MemorySource() override;

    // Non-copyable
    MemorySource(const MemorySource&) = delete;
    MemorySource& operator=(const MemorySource&) = delete;

    // IWatchSource
    Result<void> start(WatchHandlers handlers) override;
    void stop() override;
    Result<std::optional<GatewayObject>> get_by_key(const ObjectKey& key) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }

    // Test helpers: drive the notification stream
    void upsert(GatewayObject obj);
    void remove(const ObjectKey& key, DeleteMode mode = DeleteMode::FinalObject);
    void resync();
    void fail_next_lookups(uint32_t count) noexcept;
    void fail_initial_list(bool fail);

    /// Wait until every queued notification has been handed to its handler.
    bool wait_idle(Millis timeout) const;

    [[nodiscard]] size_t pending_events() const;
    [[nodiscard]] uint64_t delivered_count() const noexcept { return delivered_.load(); }
    [[nodiscard]] const ObjectStore& store() const noexcept { return store_; }

private:
    struct Event {
        enum class Kind : uint8_t { Upsert, Remove, Resync };

        Kind kind{Kind::Upsert};
        GatewayObject obj;
        ObjectKey key;
        DeleteMode mode{DeleteMode::FinalObject};
    };

    void enqueue(Event event);
    void delivery_loop(std::stop_token stop);
    void deliver(const Event& event);

    ObjectStore store_;
    WatchHandlers handlers_;

    mutable std::mutex mutex_;
    std::condition_variable_any events_cv_;
    mutable std::condition_variable idle_cv_;
    std::deque<Event> events_;
    bool started_{false};
    bool stopped_{false};
    bool in_flight_{false};
    bool fail_list_{false};

    mutable std::atomic<uint32_t> lookup_failures_{0};
    std::atomic<uint64_t> delivered_{0};

    std::jthread delivery_thread_;
};

}  // namespace gateway_status
