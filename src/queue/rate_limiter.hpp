/**
 * @file rate_limiter.hpp
 * @brief Per-key exponential backoff for requeued work items.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <mutex>
#include <unordered_map>

namespace gateway_status {

/**
 * @brief Delay for the n-th consecutive failure of a key is
 *        base * 2^(n-1), capped at max. forget() resets the key.
 */
class ExponentialBackoff {
public:
    ExponentialBackoff(Millis base_delay = Millis{5},
                       Millis max_delay = Millis{1000000});

    /// Record one more failure for `key` and return how long to wait.
    Millis when(const ObjectKey& key);

    void forget(const ObjectKey& key);
    [[nodiscard]] uint32_t num_requeues(const ObjectKey& key) const;

    [[nodiscard]] Millis base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] Millis max_delay() const noexcept { return max_delay_; }

private:
    Millis base_delay_;
    Millis max_delay_;

    mutable std::mutex mutex_;
    std::unordered_map<ObjectKey, uint32_t, ObjectKeyHash> failures_;
};

}  // namespace gateway_status
