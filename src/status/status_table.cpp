/**
 * @file status_table.cpp
 * @brief StatusTable implementation.
 * @author Dimitris Kafetzis
 */

#include "status/status_table.hpp"

namespace gateway_status {

StatusTable::StatusTable()
    : current_(std::make_shared<const StatusMap>()) {}

StatusSnapshot StatusTable::get() const noexcept {
    return current_.load(std::memory_order_acquire);
}

uint64_t StatusTable::store(StatusMap table) {
    current_.store(std::make_shared<const StatusMap>(std::move(table)),
                   std::memory_order_release);
    return version_.fetch_add(1, std::memory_order_acq_rel) + 1;
}

uint64_t StatusTable::reset() {
    return store(StatusMap{});
}

uint64_t StatusTable::version() const noexcept {
    return version_.load(std::memory_order_acquire);
}

}  // namespace gateway_status
