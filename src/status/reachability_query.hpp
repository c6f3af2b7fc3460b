/**
 * @file reachability_query.hpp
 * @brief Read-only reachability lookups for service-discovery consumers.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "status/status_table.hpp"

#include <string_view>
#include <vector>

namespace gateway_status {

/**
 * @brief Non-blocking view over a StatusTable.
 *
 * Each call reads one snapshot; safe from any thread without coordination.
 * The table must outlive the query.
 */
class ReachabilityQuery {
public:
    explicit ReachabilityQuery(const StatusTable& table) : table_(table) {}

    /// True only when `cluster_id` is present and marked reachable.
    [[nodiscard]] bool is_reachable(std::string_view cluster_id) const;

    /// Reachable cluster ids, sorted.
    [[nodiscard]] std::vector<ClusterId> reachable_clusters() const;

private:
    const StatusTable& table_;
};

}  // namespace gateway_status
