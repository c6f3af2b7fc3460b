/**
 * @file object_store.cpp
 * @brief ObjectStore implementation.
 * @author Dimitris Kafetzis
 */

#include "watch/object_store.hpp"

#include <mutex>

namespace gateway_status {

std::optional<GatewayObject> ObjectStore::upsert(GatewayObject obj) {
    std::unique_lock lock(mutex_);
    obj.revision = next_revision_++;
    auto it = objects_.find(obj.key);
    if (it == objects_.end()) {
        auto key = obj.key;
        objects_.emplace(std::move(key), std::move(obj));
        return std::nullopt;
    }
    auto previous = std::move(it->second);
    it->second = std::move(obj);
    return previous;
}

std::optional<GatewayObject> ObjectStore::remove(const ObjectKey& key) {
    std::unique_lock lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    auto removed = std::move(it->second);
    objects_.erase(it);
    return removed;
}

void ObjectStore::clear() {
    std::unique_lock lock(mutex_);
    objects_.clear();
}

std::optional<GatewayObject> ObjectStore::get(const ObjectKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

std::vector<GatewayObject> ObjectStore::list() const {
    std::shared_lock lock(mutex_);
    std::vector<GatewayObject> result;
    result.reserve(objects_.size());
    for (const auto& [key, obj] : objects_) {
        result.push_back(obj);
    }
    return result;
}

std::vector<ObjectKey> ObjectStore::keys() const {
    std::shared_lock lock(mutex_);
    std::vector<ObjectKey> result;
    result.reserve(objects_.size());
    for (const auto& [key, obj] : objects_) {
        result.push_back(key);
    }
    return result;
}

size_t ObjectStore::size() const {
    std::shared_lock lock(mutex_);
    return objects_.size();
}

bool ObjectStore::contains(const ObjectKey& key) const {
    std::shared_lock lock(mutex_);
    return objects_.count(key) > 0;
}

}  // namespace gateway_status
