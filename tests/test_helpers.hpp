/**
 * @file test_helpers.hpp
 * @brief Shared helpers for tests that observe background threads.
 */

#pragma once

#include "core/types.hpp"

#include <chrono>
#include <thread>

namespace gateway_status::testing {

/// Poll `pred` until it holds or `timeout` elapses.
template <typename Pred>
bool wait_until(Pred pred, Millis timeout = Millis{2000}) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(Millis{2});
    }
    return true;
}

}  // namespace gateway_status::testing
