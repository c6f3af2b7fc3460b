/**
 * @file change_queue.cpp
 * @brief ChangeQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "queue/change_queue.hpp"

namespace gateway_status {

ChangeQueue::ChangeQueue(Millis base_delay, Millis max_delay)
    : backoff_(base_delay, max_delay) {}

// ─────────────────────────────────────────────
// Producers
// ─────────────────────────────────────────────

void ChangeQueue::add(const ObjectKey& key) {
    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) return;
        add_locked(key);
    }
    cv_.notify_one();
}

void ChangeQueue::add_after(const ObjectKey& key, Millis delay) {
    if (delay <= Millis{0}) {
        add(key);
        return;
    }

    {
        std::lock_guard lock(mutex_);
        if (shutting_down_) return;

        auto ready_at = std::chrono::steady_clock::now() + delay;
        auto it = delayed_ready_at_.find(key);
        if (it != delayed_ready_at_.end() && it->second <= ready_at) return;

        delayed_ready_at_[key] = ready_at;
        delayed_.push(Delayed{.ready_at = ready_at, .key = key});
    }
    // The sleeping worker may need to wake earlier than planned
    cv_.notify_one();
}

void ChangeQueue::add_rate_limited(const ObjectKey& key) {
    add_after(key, backoff_.when(key));
}

void ChangeQueue::add_locked(const ObjectKey& key) {
    if (dirty_.count(key) > 0) return;
    dirty_.insert(key);
    if (processing_.count(key) > 0) return;
    queue_.push_back(key);
}

void ChangeQueue::promote_due_locked(SteadyTime now) {
    while (!delayed_.empty() && delayed_.top().ready_at <= now) {
        auto entry = delayed_.top();
        delayed_.pop();

        // Skip heap entries superseded by an earlier add_after
        auto it = delayed_ready_at_.find(entry.key);
        if (it == delayed_ready_at_.end() || it->second != entry.ready_at) continue;
        delayed_ready_at_.erase(it);

        add_locked(entry.key);
    }
}

// ─────────────────────────────────────────────
// Consumer
// ─────────────────────────────────────────────

std::optional<ObjectKey> ChangeQueue::get() {
    std::unique_lock lock(mutex_);
    while (true) {
        if (shutting_down_) return std::nullopt;

        promote_due_locked(std::chrono::steady_clock::now());
        if (!queue_.empty()) break;

        if (delayed_.empty()) {
            cv_.wait(lock);
        } else {
            auto wake_at = delayed_.top().ready_at;
            cv_.wait_until(lock, wake_at);
        }
    }

    auto key = std::move(queue_.front());
    queue_.pop_front();
    processing_.insert(key);
    dirty_.erase(key);
    return key;
}

void ChangeQueue::done(const ObjectKey& key) {
    bool requeued = false;
    {
        std::lock_guard lock(mutex_);
        processing_.erase(key);
        if (dirty_.count(key) > 0) {
            queue_.push_back(key);
            requeued = true;
        }
    }
    if (requeued) cv_.notify_one();
}

void ChangeQueue::forget(const ObjectKey& key) {
    backoff_.forget(key);
}

uint32_t ChangeQueue::num_requeues(const ObjectKey& key) const {
    return backoff_.num_requeues(key);
}

// ─────────────────────────────────────────────
// Shutdown and Introspection
// ─────────────────────────────────────────────

void ChangeQueue::shut_down() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
    }
    cv_.notify_all();
}

bool ChangeQueue::shutting_down() const {
    std::lock_guard lock(mutex_);
    return shutting_down_;
}

size_t ChangeQueue::size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

size_t ChangeQueue::delayed_count() const {
    std::lock_guard lock(mutex_);
    return delayed_ready_at_.size();
}

}  // namespace gateway_status
