/**
 * @file test_reconciler.cpp
 * @brief Unit tests for the reconciler update logic and deletion path.
 */

#include "reconciler/reconciler.hpp"
#include "status/reachability_query.hpp"
#include "telemetry/json_sink.hpp"
#include "watch/gateway_object.hpp"
#include "watch/memory_source.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string_view>

using namespace gateway_status;
using namespace std::string_view_literals;

namespace {

const ObjectKey kGw1{"submariner-operator", "gw-node-1"};
const ObjectKey kGw2{"submariner-operator", "gw-node-2"};

}  // namespace

class ReconcilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        log_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
        reconciler_ = std::make_unique<Reconciler>(table_, *logger_);
    }

    void use_policy(AbsentPolicy policy) {
        reconciler_ = std::make_unique<Reconciler>(table_, *logger_, policy);
    }

    bool reachable(std::string_view id) const { return query_.is_reachable(id); }

    StatusTable table_;
    ReachabilityQuery query_{table_};
    MemorySink* log_ = nullptr;
    std::unique_ptr<Logger> logger_;
    std::unique_ptr<Reconciler> reconciler_;
};

// ═══════════════════════════════════════════════
// Update Logic
// ═══════════════════════════════════════════════

TEST_F(ReconcilerTest, ActiveConnectedEntryBecomesReachable) {
    auto outcome = reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("east"));
    EXPECT_FALSE(reachable("west"));
    EXPECT_EQ(table_.version(), 1u);
    ASSERT_TRUE(reconciler_->active_owner().has_value());
    EXPECT_EQ(*reconciler_->active_owner(), kGw1);
    EXPECT_EQ(log_->count_containing("Updating the gateway status"), 1u);
}

TEST_F(ReconcilerTest, NonConnectedEntryForUnknownClusterChangesNothing) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));

    auto outcome = reconciler_->apply(
        make_gateway(kGw1, "active", {{"connected", "east"}, {"disconnected", "west"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Unchanged);
    EXPECT_TRUE(reachable("east"));
    EXPECT_FALSE(reachable("west"));
    EXPECT_EQ(table_.version(), 1u);
}

TEST_F(ReconcilerTest, NonConnectedEntryRemovesCluster) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}, {"connected", "west"}}));
    EXPECT_TRUE(reachable("west"));

    auto outcome = reconciler_->apply(
        make_gateway(kGw1, "active", {{"connected", "east"}, {"error", "west"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("east"));
    EXPECT_FALSE(reachable("west"));
    EXPECT_FALSE(table_.get()->contains("west"));
    EXPECT_EQ(table_.version(), 2u);
}

TEST_F(ReconcilerTest, RedeliveryPublishesNoNewVersion) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}, {"connecting", "west"}});
    EXPECT_EQ(reconciler_->apply(obj), ReconcileOutcome::Published);
    auto snapshot = table_.get();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(reconciler_->apply(obj), ReconcileOutcome::Unchanged);
    }
    EXPECT_EQ(table_.version(), 1u);
    EXPECT_EQ(table_.get(), snapshot);
}

TEST_F(ReconcilerTest, EditsThatCancelOutPublishNothing) {
    // east is inserted then removed within one pass
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}, {"disconnected", "east"}});

    EXPECT_EQ(reconciler_->apply(obj), ReconcileOutcome::Unchanged);
    EXPECT_EQ(reconciler_->apply(obj), ReconcileOutcome::Unchanged);
    EXPECT_EQ(table_.version(), 0u);
    EXPECT_FALSE(reachable("east"));
    EXPECT_EQ(log_->count_containing("Updating the gateway status"), 0u);
}

TEST_F(ReconcilerTest, NewActiveOwnerWithSameTablePublishesNothing) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));
    ASSERT_EQ(table_.version(), 1u);

    auto outcome = reconciler_->apply(make_gateway(kGw2, "active", {{"connected", "east"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Unchanged);
    EXPECT_EQ(table_.version(), 1u);
    EXPECT_EQ(*reconciler_->active_owner(), kGw2);
}

TEST_F(ReconcilerTest, PassiveGatewayNeverAffectsTable) {
    auto outcome = reconciler_->apply(make_gateway(kGw2, "passive", {{"connected", "north"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Ignored);
    EXPECT_FALSE(reachable("north"));
    EXPECT_EQ(table_.version(), 0u);
    EXPECT_FALSE(reconciler_->active_owner().has_value());
}

TEST_F(ReconcilerTest, MissingHaStatusIsLoggedNoOp) {
    auto doc = parse_gateway_document(R"(
        [metadata]
        name = "gw"
        [status]
        connections = []
    )");
    ASSERT_TRUE(doc.has_value());

    EXPECT_EQ(reconciler_->apply(*doc), ReconcileOutcome::Malformed);
    EXPECT_EQ(table_.version(), 0u);
    EXPECT_EQ(log_->count_containing("haStatus field not found"), 1u);
}

TEST_F(ReconcilerTest, MissingConnectionsIsLoggedNoOp) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));

    auto doc = parse_gateway_document(R"(
        [metadata]
        namespace = "submariner-operator"
        name = "gw-node-1"
        [status]
        haStatus = "active"
    )");
    ASSERT_TRUE(doc.has_value());

    EXPECT_EQ(reconciler_->apply(*doc), ReconcileOutcome::Malformed);
    EXPECT_TRUE(reachable("east"));
    EXPECT_EQ(table_.version(), 1u);
    EXPECT_EQ(log_->count_containing("connections field not found"), 1u);
}

TEST_F(ReconcilerTest, MalformedEntryIsSkippedOthersApplied) {
    auto doc = parse_gateway_document(R"(
        [metadata]
        name = "gw"
        [status]
        haStatus = "active"

        [[status.connections]]
        status = "connected"

        [[status.connections]]
        status = "connected"
        endpoint = { cluster_id = "east" }
    )");
    ASSERT_TRUE(doc.has_value());

    EXPECT_EQ(reconciler_->apply(*doc), ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("east"));
    EXPECT_EQ(table_.get()->size(), 1u);
    EXPECT_EQ(log_->count_containing("Skipping connection entry"), 1u);
}

TEST_F(ReconcilerTest, RetainPolicyKeepsAbsentCluster) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}, {"connected", "west"}}));

    auto outcome = reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Unchanged);
    EXPECT_TRUE(reachable("west"));
}

TEST_F(ReconcilerTest, PrunePolicyDropsAbsentCluster) {
    use_policy(AbsentPolicy::Prune);
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}, {"connected", "west"}}));

    auto outcome = reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("east"));
    EXPECT_FALSE(reachable("west"));

    // Empty connections list prunes everything
    outcome = reconciler_->apply(make_gateway(kGw1, "active", {}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(table_.get()->empty());
}

TEST_F(ReconcilerTest, NewActiveOwnerStartsFromEmptyTable) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}, {"connected", "west"}}));

    auto outcome = reconciler_->apply(make_gateway(kGw2, "active", {{"connected", "north"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("north"));
    EXPECT_FALSE(reachable("east"));
    EXPECT_FALSE(reachable("west"));
    EXPECT_EQ(*reconciler_->active_owner(), kGw2);
}

TEST_F(ReconcilerTest, NewActiveOwnerWithNothingConnectedClearsTable) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));

    auto outcome = reconciler_->apply(make_gateway(kGw2, "active", {{"connecting", "east"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(table_.get()->empty());
}

// ═══════════════════════════════════════════════
// Deletion Path
// ═══════════════════════════════════════════════

TEST_F(ReconcilerTest, DeletingActiveGatewayResetsTable) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler_->observe(obj);
    reconciler_->apply(obj);
    ASSERT_TRUE(reachable("east"));

    EXPECT_TRUE(reconciler_->handle_delete(DeleteEvent{obj}));
    EXPECT_FALSE(reachable("east"));
    EXPECT_TRUE(table_.get()->empty());
    EXPECT_EQ(table_.version(), 2u);
    EXPECT_FALSE(reconciler_->active_owner().has_value());
    EXPECT_EQ(reconciler_->last_known().size(), 0u);
}

TEST_F(ReconcilerTest, DeletingPassiveGatewayKeepsTable) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));
    auto passive = make_gateway(kGw2, "passive", {{"connected", "north"}});
    reconciler_->observe(passive);

    EXPECT_FALSE(reconciler_->handle_delete(DeleteEvent{passive}));
    EXPECT_TRUE(reachable("east"));
    EXPECT_EQ(table_.version(), 1u);
}

TEST_F(ReconcilerTest, EmptyTombstoneUsesLastKnownState) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler_->observe(obj);
    reconciler_->apply(obj);

    EXPECT_TRUE(reconciler_->handle_delete(DeleteEvent{Tombstone{.key = kGw1, .last_known = {}}}));
    EXPECT_FALSE(reachable("east"));
}

TEST_F(ReconcilerTest, TombstonePayloadUsedWithoutLastKnownState) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler_->apply(obj);
    ASSERT_EQ(reconciler_->last_known().size(), 0u);

    EXPECT_TRUE(reconciler_->handle_delete(DeleteEvent{Tombstone{.key = kGw1, .last_known = obj}}));
    EXPECT_TRUE(table_.get()->empty());
}

TEST_F(ReconcilerTest, UnrecoverableDeleteIsLoggedNoOp) {
    reconciler_->apply(make_gateway(kGw1, "active", {{"connected", "east"}}));

    EXPECT_FALSE(reconciler_->handle_delete(DeleteEvent{Tombstone{.key = kGw1, .last_known = {}}}));
    EXPECT_TRUE(reachable("east"));
    EXPECT_EQ(log_->count_containing("Could not recover the last known state"), 1u);
}

TEST_F(ReconcilerTest, LastKnownStateConsultedOnce) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler_->observe(obj);
    reconciler_->apply(obj);

    EXPECT_TRUE(reconciler_->handle_delete(DeleteEvent{Tombstone{.key = kGw1, .last_known = {}}}));
    EXPECT_FALSE(reconciler_->handle_delete(DeleteEvent{Tombstone{.key = kGw1, .last_known = {}}}));
    EXPECT_EQ(table_.version(), 2u);
}

TEST_F(ReconcilerTest, NextActiveAfterDeleteBuildsOnEmptyTable) {
    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler_->observe(obj);
    reconciler_->apply(obj);
    reconciler_->handle_delete(DeleteEvent{obj});

    auto outcome = reconciler_->apply(make_gateway(kGw2, "active", {{"connected", "north"}}));
    EXPECT_EQ(outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("north"));
    EXPECT_FALSE(reachable("east"));
}

// ═══════════════════════════════════════════════
// Lookup Through a Watch Source
// ═══════════════════════════════════════════════

TEST_F(ReconcilerTest, SyncLooksUpCurrentState) {
    MemorySource source;
    source.upsert(make_gateway(kGw1, "active", {{"connected", "east"}}));

    auto outcome = reconciler_->sync(kGw1, source);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, ReconcileOutcome::Published);
    EXPECT_TRUE(reachable("east"));
}

TEST_F(ReconcilerTest, SyncOfMissingObjectIsNotFound) {
    MemorySource source;
    auto outcome = reconciler_->sync(kGw1, source);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(*outcome, ReconcileOutcome::NotFound);
    EXPECT_EQ(table_.version(), 0u);
}

TEST_F(ReconcilerTest, SyncPropagatesLookupFailure) {
    MemorySource source;
    source.upsert(make_gateway(kGw1, "active", {{"connected", "east"}}));
    source.fail_next_lookups(1);

    auto failed = reconciler_->sync(kGw1, source);
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(failed.error().is(ErrorKind::Transient));
    EXPECT_FALSE(reachable("east"));

    auto retried = reconciler_->sync(kGw1, source);
    ASSERT_TRUE(retried.has_value());
    EXPECT_TRUE(reachable("east"));
}

TEST(ReconcilerMetricsTest, RecordsPublishAndReset) {
    auto metrics_sink = std::make_unique<MemorySink>();
    auto* events = metrics_sink.get();
    MetricsCollector metrics(std::move(metrics_sink));
    Logger logger(std::make_unique<NullSink>());
    StatusTable table;
    Reconciler reconciler(table, logger, AbsentPolicy::Retain, &metrics);

    auto obj = make_gateway(kGw1, "active", {{"connected", "east"}});
    reconciler.observe(obj);
    reconciler.apply(obj);
    reconciler.handle_delete(DeleteEvent{obj});

    EXPECT_EQ(events->count_containing("table_published"), 1u);
    EXPECT_EQ(events->count_containing("table_reset"), 1u);
}
