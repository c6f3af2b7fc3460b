/**
 * @file gateway_parser.hpp
 * @brief Typed, best-effort extraction of gateway status fields.
 * @author Dimitris Kafetzis
 *
 * Gateway documents are not schema-validated. Every field is optional and
 * checked on its own: a missing or mistyped `haStatus` or `connections`
 * fails the whole extraction, while a bad connection entry only drops that
 * entry.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

namespace gateway_status {

/// `status.haStatus`; ErrorKind::Malformed when missing or not a string.
Result<std::string> extract_ha_status(const toml::table& document);

/// One `status.connections[]` entry: `status` and `endpoint.cluster_id`.
Result<Connection> extract_connection(const toml::node& entry);

/**
 * @brief Extract haStatus and every well-formed connection entry.
 *
 * Malformed entries are logged at warn level and counted in
 * GatewayStatus::skipped_entries.
 */
Result<GatewayStatus> extract_gateway_status(const toml::table& document, Logger& logger);

}  // namespace gateway_status
