/**
 * @file gateway_object.hpp
 * @brief Watched gateway object: identity plus an untyped status document.
 * @author Dimitris Kafetzis
 *
 * The payload is kept as a toml++ table so that arbitrary, partially
 * untrusted status documents can be carried without a fixed schema. Typed
 * fields are pulled out later by the gateway parser.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <toml++/toml.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gateway_status {

/**
 * @brief One observed gateway object. Immutable once constructed; copies
 *        share the payload.
 */
struct GatewayObject {
    ObjectKey key;
    std::shared_ptr<const toml::table> payload;
    uint64_t revision{0};

    [[nodiscard]] const toml::table& document() const;
};

/**
 * @brief Build a gateway object from a parsed document.
 *
 * The identity comes from `[metadata] namespace/name`; when `metadata.name`
 * is missing, `fallback_name` is used. Fails with ErrorKind::Malformed when
 * no name can be determined.
 */
Result<GatewayObject> gateway_from_table(toml::table document,
                                         std::string_view fallback_name = {});

/**
 * @brief Parse a TOML gateway document.
 */
Result<GatewayObject> parse_gateway_document(std::string_view text,
                                             std::string_view source_name = {});

/**
 * @brief Build a well-formed gateway object from typed fields.
 */
GatewayObject make_gateway(const ObjectKey& key,
                           std::string_view ha_status,
                           const std::vector<Connection>& connections);

/**
 * @brief Render a document node for log messages.
 */
std::string describe(const toml::node& node);

}  // namespace gateway_status
