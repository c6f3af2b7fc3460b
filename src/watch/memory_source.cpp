/**
 * @file memory_source.cpp
 * @brief MemorySource implementation.
 * @author Dimitris Kafetzis
 */

#include "watch/memory_source.hpp"

namespace gateway_status {

MemorySource::~MemorySource() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> MemorySource::start(WatchHandlers handlers) {
    {
        std::lock_guard lock(mutex_);
        if (started_ || stopped_) {
            return Error{ErrorKind::Generic, "memory source already started or stopped"};
        }
        if (fail_list_) {
            return Error{ErrorKind::Unavailable, "initial listing of gateways failed"};
        }
        handlers_ = std::move(handlers);
        started_ = true;

        // Initial listing is delivered as Add notifications
        events_.push_back(Event{.kind = Event::Kind::Resync, .obj = {}, .key = {}});
    }

    delivery_thread_ = std::jthread([this](std::stop_token stop) {
        delivery_loop(stop);
    });
    return Result<void>{};
}

void MemorySource::stop() {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
        events_.clear();
    }
    if (delivery_thread_.joinable()) {
        delivery_thread_.request_stop();
        events_cv_.notify_all();
        delivery_thread_.join();
    }
    idle_cv_.notify_all();
}

// ─────────────────────────────────────────────
// Cache Lookup
// ─────────────────────────────────────────────

Result<std::optional<GatewayObject>> MemorySource::get_by_key(const ObjectKey& key) const {
    auto remaining = lookup_failures_.load();
    while (remaining > 0) {
        if (lookup_failures_.compare_exchange_weak(remaining, remaining - 1)) {
            return Error{ErrorKind::Transient, "cache lookup failed for " + key.str()};
        }
    }
    return store_.get(key);
}

// ─────────────────────────────────────────────
// Test Helpers
// ─────────────────────────────────────────────

void MemorySource::upsert(GatewayObject obj) {
    {
        std::lock_guard lock(mutex_);
        if (!started_) {
            store_.upsert(std::move(obj));
            return;
        }
    }
    auto key = obj.key;
    enqueue(Event{.kind = Event::Kind::Upsert, .obj = std::move(obj), .key = std::move(key)});
}

void MemorySource::remove(const ObjectKey& key, DeleteMode mode) {
    {
        std::lock_guard lock(mutex_);
        if (!started_) {
            store_.remove(key);
            return;
        }
    }
    enqueue(Event{.kind = Event::Kind::Remove, .obj = {}, .key = key, .mode = mode});
}

void MemorySource::resync() {
    enqueue(Event{.kind = Event::Kind::Resync, .obj = {}, .key = {}});
}

void MemorySource::fail_next_lookups(uint32_t count) noexcept {
    lookup_failures_.store(count);
}

void MemorySource::fail_initial_list(bool fail) {
    std::lock_guard lock(mutex_);
    fail_list_ = fail;
}

bool MemorySource::wait_idle(Millis timeout) const {
    std::unique_lock lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] {
        return stopped_ || (events_.empty() && !in_flight_);
    });
}

size_t MemorySource::pending_events() const {
    std::lock_guard lock(mutex_);
    return events_.size() + (in_flight_ ? 1 : 0);
}

// ─────────────────────────────────────────────
// Delivery Thread
// ─────────────────────────────────────────────

void MemorySource::enqueue(Event event) {
    {
        std::lock_guard lock(mutex_);
        if (stopped_) return;
        events_.push_back(std::move(event));
    }
    events_cv_.notify_one();
}

void MemorySource::delivery_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        Event event;
        {
            std::unique_lock lock(mutex_);
            events_cv_.wait(lock, stop, [this] { return !events_.empty(); });
            if (stop.stop_requested()) return;
            if (events_.empty()) continue;

            event = std::move(events_.front());
            events_.pop_front();
            in_flight_ = true;
        }

        deliver(event);
        delivered_.fetch_add(1);

        {
            std::lock_guard lock(mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }
}

void MemorySource::deliver(const Event& event) {
    switch (event.kind) {
        case Event::Kind::Upsert: {
            auto previous = store_.upsert(event.obj);
            auto current = store_.get(event.key);
            if (!current) return;
            if (previous) {
                if (handlers_.on_update) handlers_.on_update(*previous, *current);
            } else {
                if (handlers_.on_add) handlers_.on_add(*current);
            }
            return;
        }
        case Event::Kind::Remove: {
            auto removed = store_.remove(event.key);
            if (!handlers_.on_delete) return;
            switch (event.mode) {
                case DeleteMode::FinalObject:
                    if (removed) handlers_.on_delete(DeleteEvent{*removed});
                    return;
                case DeleteMode::Tombstone:
                    handlers_.on_delete(DeleteEvent{Tombstone{.key = event.key, .last_known = removed}});
                    return;
                case DeleteMode::EmptyTombstone:
                    handlers_.on_delete(DeleteEvent{Tombstone{.key = event.key, .last_known = std::nullopt}});
                    return;
            }
            return;
        }
        case Event::Kind::Resync: {
            if (!handlers_.on_add) return;
            for (const auto& obj : store_.list()) {
                handlers_.on_add(obj);
            }
            return;
        }
    }
}

}  // namespace gateway_status
