/**
 * @file reachability_query.cpp
 * @brief ReachabilityQuery implementation.
 * @author Dimitris Kafetzis
 */

#include "status/reachability_query.hpp"

#include <algorithm>

namespace gateway_status {

bool ReachabilityQuery::is_reachable(std::string_view cluster_id) const {
    auto snapshot = table_.get();
    auto it = snapshot->find(ClusterId{cluster_id});
    return it != snapshot->end() && it->second;
}

std::vector<ClusterId> ReachabilityQuery::reachable_clusters() const {
    auto snapshot = table_.get();
    std::vector<ClusterId> result;
    result.reserve(snapshot->size());
    for (const auto& [id, reachable] : *snapshot) {
        if (reachable) result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

}  // namespace gateway_status
