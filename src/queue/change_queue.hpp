/**
 * @file change_queue.hpp
 * @brief Deduplicating, rate-limited work queue of object identities.
 * @author Dimitris Kafetzis
 *
 * A key is pending at most once: adding a key that is already queued is a
 * no-op. A key added while a worker is processing it is queued again once
 * the worker calls done(), so one key is never processed concurrently and
 * no notification is lost.
 *
 * Delayed keys (add_after / add_rate_limited) wait in a timer heap and move
 * into the ready queue once due; get() sleeps until the earliest is due.
 */

#pragma once

#include "core/types.hpp"
#include "queue/rate_limiter.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <queue>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gateway_status {

class ChangeQueue {
public:
    explicit ChangeQueue(Millis base_delay = Millis{5}, Millis max_delay = Millis{1000000});

    // Non-copyable
    ChangeQueue(const ChangeQueue&) = delete;
    ChangeQueue& operator=(const ChangeQueue&) = delete;

    /// Enqueue `key` unless it is already pending. Dropped after shut_down().
    void add(const ObjectKey& key);

    /// Enqueue `key` once `delay` has elapsed. The earliest pending delay wins.
    void add_after(const ObjectKey& key, Millis delay);

    /// Enqueue `key` after its backoff delay, recording one more failure.
    void add_rate_limited(const ObjectKey& key);

    /**
     * @brief Block until a key is ready or the queue is shut down.
     *
     * Returns nullopt once shut_down() has been called. Every key returned
     * must be handed back with done().
     */
    [[nodiscard]] std::optional<ObjectKey> get();

    /// Finish processing of a key obtained from get().
    void done(const ObjectKey& key);

    /// Clear the backoff history of `key`.
    void forget(const ObjectKey& key);

    [[nodiscard]] uint32_t num_requeues(const ObjectKey& key) const;

    /// Unblock every current and future get(). Idempotent.
    void shut_down();

    [[nodiscard]] bool shutting_down() const;

    /// Keys ready for get() (excludes delayed keys and keys in processing).
    [[nodiscard]] size_t size() const;

    /// Keys waiting for their delay to elapse.
    [[nodiscard]] size_t delayed_count() const;

private:
    struct Delayed {
        SteadyTime ready_at;
        ObjectKey key;

        bool operator>(const Delayed& other) const { return ready_at > other.ready_at; }
    };

    void add_locked(const ObjectKey& key);
    void promote_due_locked(SteadyTime now);

    ExponentialBackoff backoff_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;

    std::deque<ObjectKey> queue_;
    std::unordered_set<ObjectKey, ObjectKeyHash> dirty_;
    std::unordered_set<ObjectKey, ObjectKeyHash> processing_;

    std::priority_queue<Delayed, std::vector<Delayed>, std::greater<>> delayed_;
    std::unordered_map<ObjectKey, SteadyTime, ObjectKeyHash> delayed_ready_at_;

    bool shutting_down_{false};
};

}  // namespace gateway_status
