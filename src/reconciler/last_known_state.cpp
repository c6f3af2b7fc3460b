/**
 * @file last_known_state.cpp
 * @brief LastKnownState implementation.
 * @author Dimitris Kafetzis
 */

#include "reconciler/last_known_state.hpp"

namespace gateway_status {

void LastKnownState::record(const GatewayObject& obj) {
    std::lock_guard lock(mutex_);
    objects_.insert_or_assign(obj.key, obj);
}

std::optional<GatewayObject> LastKnownState::take(const ObjectKey& key) {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    auto obj = std::move(it->second);
    objects_.erase(it);
    return obj;
}

std::optional<GatewayObject> LastKnownState::get(const ObjectKey& key) const {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

size_t LastKnownState::size() const {
    std::lock_guard lock(mutex_);
    return objects_.size();
}

}  // namespace gateway_status
