/**
 * @file last_known_state.hpp
 * @brief Most recently observed object per identity, for delete handling.
 * @author Dimitris Kafetzis
 *
 * A delete notification may arrive as a tombstone without a usable payload.
 * Recording every Add/Update here lets the delete path still recover the
 * object's last haStatus. Entries are taken (and discarded) on delete.
 */

#pragma once

#include "core/types.hpp"
#include "watch/gateway_object.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>

namespace gateway_status {

class LastKnownState {
public:
    void record(const GatewayObject& obj);

    /// Remove and return the entry for `key`.
    std::optional<GatewayObject> take(const ObjectKey& key);

    [[nodiscard]] std::optional<GatewayObject> get(const ObjectKey& key) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ObjectKey, GatewayObject, ObjectKeyHash> objects_;
};

}  // namespace gateway_status
