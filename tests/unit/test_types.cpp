/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace gateway_status;

TEST(ObjectKeyTest, Rendering) {
    ObjectKey namespaced{.ns = "submariner-operator", .name = "gw-1"};
    ObjectKey cluster_scoped{.ns = {}, .name = "gw-1"};
    EXPECT_EQ(namespaced.str(), "submariner-operator/gw-1");
    EXPECT_EQ(cluster_scoped.str(), "gw-1");
    EXPECT_FALSE(namespaced.empty());
    EXPECT_TRUE(ObjectKey{}.empty());
}

TEST(ObjectKeyTest, ParseRoundTrip) {
    auto key = parse_object_key("submariner-operator/gw-1");
    EXPECT_EQ(key.ns, "submariner-operator");
    EXPECT_EQ(key.name, "gw-1");

    auto bare = parse_object_key("gw-2");
    EXPECT_TRUE(bare.ns.empty());
    EXPECT_EQ(bare.name, "gw-2");
}

TEST(ObjectKeyTest, ComparisonAndHash) {
    ObjectKey a{"ns", "a"};
    ObjectKey b{"ns", "b"};
    ObjectKey a_copy{"ns", "a"};
    EXPECT_TRUE(a < b);
    EXPECT_EQ(a, a_copy);
    EXPECT_NE(a, b);

    std::unordered_set<ObjectKey, ObjectKeyHash> keys{a, b, ObjectKey{"ns", "a"}};
    EXPECT_EQ(keys.size(), 2u);
}

TEST(ConnectionTest, OnlyConnectedIsReachable) {
    EXPECT_TRUE((Connection{"connected", "east"}).connected());
    EXPECT_FALSE((Connection{"connecting", "east"}).connected());
    EXPECT_FALSE((Connection{"error", "east"}).connected());
    EXPECT_FALSE((Connection{"Connected", "east"}).connected());
}

TEST(GatewayStatusTest, ActiveCheck) {
    GatewayStatus status;
    status.ha_status = "active";
    EXPECT_TRUE(status.is_active());
    status.ha_status = "passive";
    EXPECT_FALSE(status.is_active());
}
