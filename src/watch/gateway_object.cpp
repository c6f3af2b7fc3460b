/**
 * @file gateway_object.cpp
 * @brief GatewayObject construction and rendering.
 * @author Dimitris Kafetzis
 */

#include "watch/gateway_object.hpp"

#include <sstream>

namespace gateway_status {

namespace {

const toml::table& empty_document() {
    static const toml::table empty;
    return empty;
}

}  // anonymous namespace

const toml::table& GatewayObject::document() const {
    return payload ? *payload : empty_document();
}

Result<GatewayObject> gateway_from_table(toml::table document, std::string_view fallback_name) {
    ObjectKey key;
    if (auto meta = document[schema::kMetadata]; meta.is_table()) {
        key.ns = meta[schema::kNamespace].value_or(std::string{});
        key.name = meta[schema::kName].value_or(std::string{});
    }
    if (key.name.empty()) {
        key.name = std::string{fallback_name};
    }
    if (key.name.empty()) {
        return Error{ErrorKind::Malformed, "gateway document has no metadata.name"};
    }

    GatewayObject obj;
    obj.key = std::move(key);
    obj.payload = std::make_shared<const toml::table>(std::move(document));
    return obj;
}

Result<GatewayObject> parse_gateway_document(std::string_view text, std::string_view source_name) {
    try {
        auto document = toml::parse(text, source_name);
        return gateway_from_table(std::move(document), source_name);
    } catch (const toml::parse_error& err) {
        return Error{ErrorKind::Malformed,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

GatewayObject make_gateway(const ObjectKey& key,
                           std::string_view ha_status,
                           const std::vector<Connection>& connections) {
    toml::array entries;
    for (const auto& conn : connections) {
        entries.push_back(toml::table{
            {schema::kConnectionStatus, conn.status},
            {schema::kEndpoint, toml::table{{schema::kClusterId, conn.cluster_id}}},
        });
    }

    toml::table status;
    status.insert(schema::kHaStatus, std::string{ha_status});
    status.insert(schema::kConnections, std::move(entries));

    toml::table document;
    document.insert(schema::kMetadata, toml::table{
        {schema::kNamespace, key.ns},
        {schema::kName, key.name},
    });
    document.insert(schema::kStatus, std::move(status));

    GatewayObject obj;
    obj.key = key;
    obj.payload = std::make_shared<const toml::table>(std::move(document));
    return obj;
}

std::string describe(const toml::node& node) {
    std::ostringstream oss;
    node.visit([&oss](const auto& n) { oss << n; });
    return oss.str();
}

}  // namespace gateway_status
