/**
 * @file test_gateway_parser.cpp
 * @brief Unit tests for best-effort gateway status extraction.
 */

#include "reconciler/gateway_parser.hpp"
#include "telemetry/json_sink.hpp"
#include "watch/gateway_object.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string_view>

using namespace gateway_status;
using namespace std::string_view_literals;

class GatewayParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_unique<MemorySink>();
        sink_ = sink.get();
        logger_ = std::make_unique<Logger>(std::move(sink), LogLevel::Debug);
    }

    MemorySink* sink_ = nullptr;
    std::unique_ptr<Logger> logger_;
};

TEST_F(GatewayParserTest, ExtractsWellFormedDocument) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"

        [[status.connections]]
        status = "connected"
        endpoint = { cluster_id = "east" }

        [[status.connections]]
        status = "connecting"
        endpoint = { cluster_id = "west" }
    )"sv);

    auto result = extract_gateway_status(doc, *logger_);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->is_active());
    ASSERT_EQ(result->connections.size(), 2u);
    EXPECT_EQ(result->connections[0], (Connection{"connected", "east"}));
    EXPECT_EQ(result->connections[1], (Connection{"connecting", "west"}));
    EXPECT_EQ(result->skipped_entries, 0u);
}

TEST_F(GatewayParserTest, MissingStatusIsMalformed) {
    auto doc = toml::parse(R"(
        [metadata]
        name = "gw"
    )"sv);
    auto ha = extract_ha_status(doc);
    ASSERT_FALSE(ha.has_value());
    EXPECT_TRUE(ha.error().is(ErrorKind::Malformed));
}

TEST_F(GatewayParserTest, NonStringHaStatusIsMalformed) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = 1
    )"sv);
    EXPECT_FALSE(extract_ha_status(doc).has_value());
}

TEST_F(GatewayParserTest, MissingConnectionsIsMalformed) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"
    )"sv);
    EXPECT_TRUE(extract_ha_status(doc).has_value());

    auto result = extract_gateway_status(doc, *logger_);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorKind::Malformed));
}

TEST_F(GatewayParserTest, ConnectionsOfWrongTypeIsMalformed) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"
        connections = "none"
    )"sv);
    EXPECT_FALSE(extract_gateway_status(doc, *logger_).has_value());
}

TEST_F(GatewayParserTest, MalformedEntriesAreSkipped) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"

        [[status.connections]]
        endpoint = { cluster_id = "no-status" }

        [[status.connections]]
        status = "connected"
        endpoint = { }

        [[status.connections]]
        status = "connected"

        [[status.connections]]
        status = "connected"
        endpoint = { cluster_id = "east" }
    )"sv);

    auto result = extract_gateway_status(doc, *logger_);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->connections.size(), 1u);
    EXPECT_EQ(result->connections[0].cluster_id, "east");
    EXPECT_EQ(result->skipped_entries, 3u);
    EXPECT_EQ(sink_->count_containing("Skipping connection entry"), 3u);
}

TEST_F(GatewayParserTest, NonTableEntryIsSkipped) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"
        connections = [ "east", 42 ]
    )"sv);

    auto result = extract_gateway_status(doc, *logger_);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->connections.empty());
    EXPECT_EQ(result->skipped_entries, 2u);
}

TEST_F(GatewayParserTest, AcceptsCamelCaseClusterId) {
    auto doc = toml::parse(R"(
        [status]
        haStatus = "active"

        [[status.connections]]
        status = "connected"
        endpoint = { clusterId = "east" }
    )"sv);

    auto result = extract_gateway_status(doc, *logger_);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->connections.size(), 1u);
    EXPECT_EQ(result->connections[0].cluster_id, "east");
}

TEST_F(GatewayParserTest, MakeGatewayProducesExtractableDocument) {
    auto obj = make_gateway({"ns", "gw"}, "passive", {{"connected", "east"}, {"error", "west"}});
    EXPECT_EQ(obj.key.str(), "ns/gw");

    auto result = extract_gateway_status(obj.document(), *logger_);
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->is_active());
    ASSERT_EQ(result->connections.size(), 2u);
    EXPECT_EQ(result->connections[1], (Connection{"error", "west"}));
}

TEST_F(GatewayParserTest, ParseDocumentUsesMetadataIdentity) {
    auto obj = parse_gateway_document(R"(
        [metadata]
        namespace = "submariner-operator"
        name = "gw-node-1"

        [status]
        haStatus = "active"
        connections = []
    )", "gw-node-1.toml");
    ASSERT_TRUE(obj.has_value()) << obj.error().message;
    EXPECT_EQ(obj->key.str(), "submariner-operator/gw-node-1");

    auto broken = parse_gateway_document("[status\nhaStatus = ", "broken.toml");
    ASSERT_FALSE(broken.has_value());
    EXPECT_TRUE(broken.error().is(ErrorKind::Malformed));
}
