/**
 * @file reconciler.hpp
 * @brief Derives cluster reachability from gateway objects.
 * @author Dimitris Kafetzis
 *
 * Only the gateway reporting haStatus "active" feeds the StatusTable. For
 * every connection entry of the active gateway:
 *
 *   connected, not in table  → insert as reachable
 *   other status, in table   → remove
 *
 * The current snapshot is copied only when the first change is found, and
 * the new map is published with a single StatusTable::store(). A clusterId
 * missing from the list keeps its value under AbsentPolicy::Retain and is
 * removed under AbsentPolicy::Prune.
 *
 * When a different object than the last publisher reports active, the new
 * table is built from empty so two gateways' connections are never merged.
 *
 * Table writes from the worker (sync) and from the delete path are
 * serialized by an internal writer mutex; readers of the StatusTable never
 * touch it.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "reconciler/last_known_state.hpp"
#include "status/status_table.hpp"
#include "telemetry/metrics_collector.hpp"
#include "watch/watch_source.hpp"

#include <mutex>
#include <optional>

namespace gateway_status {

enum class ReconcileOutcome : uint8_t {
    Published,      ///< a new snapshot was stored
    Unchanged,      ///< active gateway, nothing to change
    Ignored,        ///< gateway is not the active instance
    Malformed,      ///< haStatus or connections could not be extracted
    NotFound        ///< object no longer in the cache
};

[[nodiscard]] constexpr std::string_view to_string(ReconcileOutcome outcome) noexcept {
    switch (outcome) {
        case ReconcileOutcome::Published: return "published";
        case ReconcileOutcome::Unchanged: return "unchanged";
        case ReconcileOutcome::Ignored:   return "ignored";
        case ReconcileOutcome::Malformed: return "malformed";
        case ReconcileOutcome::NotFound:  return "not_found";
    }
    return "unknown";
}

class Reconciler {
public:
    Reconciler(StatusTable& table,
               Logger& logger,
               AbsentPolicy absent_policy = AbsentPolicy::Retain,
               MetricsCollector* metrics = nullptr);

    // Non-copyable
    Reconciler(const Reconciler&) = delete;
    Reconciler& operator=(const Reconciler&) = delete;

    /**
     * @brief Look `key` up in `source` and apply the update logic.
     *
     * Returns the lookup error unchanged (normally ErrorKind::Transient) so
     * the caller can requeue with backoff.
     */
    Result<ReconcileOutcome> sync(const ObjectKey& key, const IWatchSource& source);

    /// Apply the update logic to an already-resolved object.
    ReconcileOutcome apply(const GatewayObject& obj);

    /**
     * @brief Handle a delete notification.
     *
     * Resolves the object's last known state and resets the table when it
     * was active. Returns true when the table was reset.
     */
    bool handle_delete(const DeleteEvent& event);

    /// Record an observed Add/Update for later delete handling.
    void observe(const GatewayObject& obj);

    [[nodiscard]] std::optional<ObjectKey> active_owner() const;
    [[nodiscard]] const LastKnownState& last_known() const noexcept { return last_known_; }

private:
    ReconcileOutcome apply_locked(const GatewayObject& obj);

    StatusTable& table_;
    Logger& logger_;
    AbsentPolicy absent_policy_;
    MetricsCollector* metrics_;

    mutable std::mutex write_mutex_;
    std::optional<ObjectKey> active_owner_;

    LastKnownState last_known_;
};

}  // namespace gateway_status
