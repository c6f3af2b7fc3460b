/**
 * @file status_table.hpp
 * @brief Copy-on-write snapshot store of clusterId → reachable.
 * @author Dimitris Kafetzis
 *
 * The current snapshot is an immutable map published through
 * std::atomic<std::shared_ptr>. Readers load the pointer and keep the
 * snapshot alive for as long as they hold it; a writer builds a complete new
 * map and swaps it in. Readers never observe a map under construction.
 */

#pragma once

#include "core/types.hpp"

#include <atomic>
#include <memory>

namespace gateway_status {

using StatusSnapshot = std::shared_ptr<const StatusMap>;

class StatusTable {
public:
    StatusTable();

    // Non-copyable
    StatusTable(const StatusTable&) = delete;
    StatusTable& operator=(const StatusTable&) = delete;

    /// Current snapshot. Never blocks; never null.
    [[nodiscard]] StatusSnapshot get() const noexcept;

    /// Publish `table` as the new current snapshot. Returns the new version.
    uint64_t store(StatusMap table);

    /// Publish an empty snapshot. Returns the new version.
    uint64_t reset();

    /// Number of snapshots published since construction.
    [[nodiscard]] uint64_t version() const noexcept;

private:
    std::atomic<StatusSnapshot> current_;
    std::atomic<uint64_t> version_{0};
};

}  // namespace gateway_status
