/**
 * @file object_store.hpp
 * @brief Thread-safe local cache of watched gateway objects.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "watch/gateway_object.hpp"

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace gateway_status {

/**
 * @brief Latest known state of every watched object, keyed by identity.
 *
 * Written by a watch source's delivery loop, read by the reconciler worker.
 * Thread-safe via shared_mutex.
 */
class ObjectStore {
public:
    /// Insert or replace; returns the previous object, if any.
    std::optional<GatewayObject> upsert(GatewayObject obj);

    /// Remove; returns the removed object, if any.
    std::optional<GatewayObject> remove(const ObjectKey& key);

    void clear();

    [[nodiscard]] std::optional<GatewayObject> get(const ObjectKey& key) const;
    [[nodiscard]] std::vector<GatewayObject> list() const;
    [[nodiscard]] std::vector<ObjectKey> keys() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool contains(const ObjectKey& key) const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<ObjectKey, GatewayObject, ObjectKeyHash> objects_;
    uint64_t next_revision_{1};
};

}  // namespace gateway_status
