/**
 * @file reconciler.cpp
 * @brief Reconciler implementation: update logic and delete path.
 * @author Dimitris Kafetzis
 */

#include "reconciler/reconciler.hpp"
#include "reconciler/gateway_parser.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace gateway_status {

namespace {

std::string format_table(const StatusMap& table) {
    std::vector<ClusterId> ids;
    ids.reserve(table.size());
    for (const auto& [id, reachable] : table) ids.push_back(id);
    std::sort(ids.begin(), ids.end());

    std::ostringstream oss;
    oss << '{';
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << ids[i] << ':' << (table.at(ids[i]) ? "true" : "false");
    }
    oss << '}';
    return oss.str();
}

}  // anonymous namespace

Reconciler::Reconciler(StatusTable& table,
                       Logger& logger,
                       AbsentPolicy absent_policy,
                       MetricsCollector* metrics)
    : table_(table)
    , logger_(logger)
    , absent_policy_(absent_policy)
    , metrics_(metrics) {}

// ─────────────────────────────────────────────
// Worker Path
// ─────────────────────────────────────────────

Result<ReconcileOutcome> Reconciler::sync(const ObjectKey& key, const IWatchSource& source) {
    // Lookup and publish under one lock so a concurrent delete cannot be
    // overwritten by data read before the object disappeared
    std::lock_guard lock(write_mutex_);

    auto lookup = source.get_by_key(key);
    if (!lookup) return lookup.error();

    if (!lookup->has_value()) {
        logger_.debug("Gateway " + key.str() + " no longer exists");
        return ReconcileOutcome::NotFound;
    }
    return apply_locked(**lookup);
}

ReconcileOutcome Reconciler::apply(const GatewayObject& obj) {
    std::lock_guard lock(write_mutex_);
    return apply_locked(obj);
}

ReconcileOutcome Reconciler::apply_locked(const GatewayObject& obj) {
    const auto& document = obj.document();

    auto ha_status = extract_ha_status(document);
    if (!ha_status) {
        logger_.warn("Gateway " + obj.key.str() + ": " + ha_status.error().message);
        return ReconcileOutcome::Malformed;
    }
    if (*ha_status != schema::kHaActive) {
        logger_.debug("Gateway " + obj.key.str() + " is " + *ha_status + ", ignoring");
        return ReconcileOutcome::Ignored;
    }

    auto status = extract_gateway_status(document, logger_);
    if (!status) {
        logger_.error("Gateway " + obj.key.str() + ": " + status.error().message);
        return ReconcileOutcome::Malformed;
    }

    const auto current = table_.get();
    const bool owner_changed = active_owner_.has_value() && *active_owner_ != obj.key;

    // Working copy is created on the first needed change only
    std::optional<StatusMap> working;
    bool changed = false;
    if (owner_changed) {
        logger_.info("Active gateway changed from " + active_owner_->str()
                     + " to " + obj.key.str());
        working.emplace();
        changed = !current->empty();
    }

    auto view = [&]() -> const StatusMap& { return working ? *working : *current; };
    auto mutable_table = [&]() -> StatusMap& {
        if (!working) working.emplace(*current);
        changed = true;
        return *working;
    };

    std::unordered_set<ClusterId> reported_connected;
    for (const auto& conn : status->connections) {
        if (conn.connected()) {
            reported_connected.insert(conn.cluster_id);
            if (!view().contains(conn.cluster_id)) {
                mutable_table()[conn.cluster_id] = true;
            }
        } else if (view().contains(conn.cluster_id)) {
            mutable_table().erase(conn.cluster_id);
        }
    }

    if (absent_policy_ == AbsentPolicy::Prune) {
        std::vector<ClusterId> stale;
        for (const auto& [id, reachable] : view()) {
            if (reported_connected.count(id) == 0) stale.push_back(id);
        }
        for (const auto& id : stale) {
            mutable_table().erase(id);
        }
    }

    active_owner_ = obj.key;

    // Edits may cancel out, e.g. a cluster listed connected and then disconnected
    if (!changed || *working == *current) return ReconcileOutcome::Unchanged;

    const auto reachable_count = working->size();
    if (logger_.enabled(LogLevel::Info)) {
        logger_.info("Updating the gateway status " + format_table(*working));
    }
    auto version = table_.store(std::move(*working));
    if (metrics_ != nullptr) {
        metrics_->record_table_published(obj.key, version, reachable_count);
    }
    return ReconcileOutcome::Published;
}

// ─────────────────────────────────────────────
// Watch Handlers
// ─────────────────────────────────────────────

void Reconciler::observe(const GatewayObject& obj) {
    last_known_.record(obj);
}

bool Reconciler::handle_delete(const DeleteEvent& event) {
    std::lock_guard lock(write_mutex_);

    const auto& key = key_of(event);
    std::optional<GatewayObject> state = last_known_.take(key);
    if (!state) {
        if (const auto* tombstone = std::get_if<Tombstone>(&event)) {
            state = tombstone->last_known;
        } else {
            state = std::get<GatewayObject>(event);
        }
    }
    if (!state) {
        logger_.error("Could not recover the last known state of deleted gateway " + key.str());
        return false;
    }

    auto ha_status = extract_ha_status(state->document());
    if (!ha_status) {
        logger_.warn("Deleted gateway " + key.str() + ": " + ha_status.error().message);
        return false;
    }
    if (*ha_status != schema::kHaActive) {
        logger_.debug("Deleted gateway " + key.str() + " was " + *ha_status + ", table unchanged");
        return false;
    }

    auto version = table_.reset();
    active_owner_.reset();
    logger_.info("Active gateway " + key.str() + " deleted, all remote clusters unreachable");
    if (metrics_ != nullptr) {
        metrics_->record_table_reset(key, version);
    }
    return true;
}

std::optional<ObjectKey> Reconciler::active_owner() const {
    std::lock_guard lock(write_mutex_);
    return active_owner_;
}

}  // namespace gateway_status
