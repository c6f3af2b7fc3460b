/**
 * @file rate_limiter.cpp
 * @brief ExponentialBackoff implementation.
 * @author Dimitris Kafetzis
 */

#include "queue/rate_limiter.hpp"

#include <algorithm>

namespace gateway_status {

ExponentialBackoff::ExponentialBackoff(Millis base_delay, Millis max_delay)
    : base_delay_(std::max(base_delay, Millis{1}))
    , max_delay_(std::max(max_delay, base_delay_)) {}

Millis ExponentialBackoff::when(const ObjectKey& key) {
    std::lock_guard lock(mutex_);
    auto exponent = failures_[key]++;

    // Stop doubling once past the cap; also keeps the shift in range
    auto delay = base_delay_;
    for (uint32_t i = 0; i < exponent && delay < max_delay_; ++i) {
        delay *= 2;
    }
    return std::min(delay, max_delay_);
}

void ExponentialBackoff::forget(const ObjectKey& key) {
    std::lock_guard lock(mutex_);
    failures_.erase(key);
}

uint32_t ExponentialBackoff::num_requeues(const ObjectKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = failures_.find(key);
    return it == failures_.end() ? 0 : it->second;
}

}  // namespace gateway_status
