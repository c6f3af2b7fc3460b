/**
 * @file gateway_parser.cpp
 * @brief Gateway status field extraction.
 * @author Dimitris Kafetzis
 */

#include "reconciler/gateway_parser.hpp"
#include "watch/gateway_object.hpp"

namespace gateway_status {

namespace {

const toml::table* status_table(const toml::table& document) {
    return document[schema::kStatus].as_table();
}

}  // anonymous namespace

Result<std::string> extract_ha_status(const toml::table& document) {
    const auto* status = status_table(document);
    if (status == nullptr) {
        return Error{ErrorKind::Malformed, "status field not found in " + describe(document)};
    }
    auto ha_status = (*status)[schema::kHaStatus].value<std::string>();
    if (!ha_status) {
        return Error{ErrorKind::Malformed, "haStatus field not found in " + describe(*status)};
    }
    return std::move(*ha_status);
}

Result<Connection> extract_connection(const toml::node& entry) {
    const auto* fields = entry.as_table();
    if (fields == nullptr) {
        return Error{ErrorKind::Malformed, "connection entry is not a table: " + describe(entry)};
    }

    auto status = (*fields)[schema::kConnectionStatus].value<std::string>();
    if (!status) {
        return Error{ErrorKind::Malformed, "status field not found in " + describe(entry)};
    }

    auto endpoint = (*fields)[schema::kEndpoint];
    auto cluster_id = endpoint[schema::kClusterId].value<std::string>();
    if (!cluster_id) {
        cluster_id = endpoint[schema::kClusterIdAlt].value<std::string>();
    }
    if (!cluster_id || cluster_id->empty()) {
        return Error{ErrorKind::Malformed, "clusterId field not found in " + describe(entry)};
    }

    return Connection{.status = std::move(*status), .cluster_id = std::move(*cluster_id)};
}

Result<GatewayStatus> extract_gateway_status(const toml::table& document, Logger& logger) {
    auto ha_status = extract_ha_status(document);
    if (!ha_status) return ha_status.error();

    const auto* status = status_table(document);
    const auto* entries = (*status)[schema::kConnections].as_array();
    if (entries == nullptr) {
        return Error{ErrorKind::Malformed, "connections field not found in " + describe(*status)};
    }

    GatewayStatus result;
    result.ha_status = std::move(*ha_status);
    result.connections.reserve(entries->size());

    for (const auto& entry : *entries) {
        auto conn = extract_connection(entry);
        if (!conn) {
            logger.warn("Skipping connection entry: " + conn.error().message);
            ++result.skipped_entries;
            continue;
        }
        result.connections.push_back(std::move(*conn));
    }
    return result;
}

}  // namespace gateway_status
