/**
 * @file types.hpp
 * @brief Fundamental types used throughout GatewayStatus.
 * @author Dimitris Kafetzis
 *
 * Defines ObjectKey, ClusterId, Connection, GatewayStatus and the string
 * constants of the gateway status schema. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gateway_status {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using ClusterId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using SteadyTime = std::chrono::steady_clock::time_point;
using Millis = std::chrono::milliseconds;

/**
 * @brief Identity of a watched object: namespace + name.
 *
 * Rendered as "namespace/name", or just "name" for cluster-scoped objects.
 */
struct ObjectKey {
    std::string ns;
    std::string name;

    [[nodiscard]] std::string str() const {
        if (ns.empty()) return name;
        return ns + "/" + name;
    }

    [[nodiscard]] bool empty() const noexcept { return name.empty(); }

    auto operator<=>(const ObjectKey&) const = default;
};

struct ObjectKeyHash {
    size_t operator()(const ObjectKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.ns);
        return h ^ (std::hash<std::string>{}(key.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/// Parse "namespace/name" or "name" into an ObjectKey.
[[nodiscard]] inline ObjectKey parse_object_key(std::string_view text) {
    auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return ObjectKey{.ns = {}, .name = std::string{text}};
    }
    return ObjectKey{.ns = std::string{text.substr(0, slash)},
                     .name = std::string{text.substr(slash + 1)}};
}

// ─────────────────────────────────────────────
// Gateway Status Schema
// ─────────────────────────────────────────────

namespace schema {

inline constexpr std::string_view kStatus = "status";
inline constexpr std::string_view kHaStatus = "haStatus";
inline constexpr std::string_view kConnections = "connections";
inline constexpr std::string_view kConnectionStatus = "status";
inline constexpr std::string_view kEndpoint = "endpoint";
inline constexpr std::string_view kClusterId = "cluster_id";
inline constexpr std::string_view kClusterIdAlt = "clusterId";
inline constexpr std::string_view kMetadata = "metadata";
inline constexpr std::string_view kNamespace = "namespace";
inline constexpr std::string_view kName = "name";

inline constexpr std::string_view kHaActive = "active";
inline constexpr std::string_view kConnected = "connected";

}  // namespace schema

/**
 * @brief One reported link from the local gateway to a remote cluster.
 */
struct Connection {
    std::string status;
    ClusterId cluster_id;

    [[nodiscard]] bool connected() const noexcept {
        return status == schema::kConnected;
    }

    bool operator==(const Connection&) const = default;
};

/**
 * @brief Typed view of the fields extracted from a gateway status payload.
 *
 * Entries that failed extraction are not present in `connections`; their
 * count is kept in `skipped_entries`.
 */
struct GatewayStatus {
    std::string ha_status;
    std::vector<Connection> connections;
    size_t skipped_entries{0};

    [[nodiscard]] bool is_active() const noexcept {
        return ha_status == schema::kHaActive;
    }
};

/// clusterId → reachable
using StatusMap = std::unordered_map<ClusterId, bool>;

}  // namespace gateway_status
