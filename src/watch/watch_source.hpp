/**
 * @file watch_source.hpp
 * @brief Abstract watch source: change notifications plus a lookup cache.
 * @author Dimitris Kafetzis
 *
 * A watch source lists the watched collection once on start, then delivers
 * Add/Update/Delete notifications from its own thread. Its local cache is
 * updated before the matching handler runs, so a handler that looks an
 * object up by key sees at least the state it was notified about.
 *
 * Delivery is at-least-once: resyncs redeliver Add for unchanged objects and
 * updates may carry identical content. Consumers must be idempotent.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "watch/gateway_object.hpp"

#include <functional>
#include <optional>
#include <variant>

namespace gateway_status {

/**
 * @brief Delete notification whose final object state was not observed.
 *
 * `last_known` holds whatever state the source had cached, if any; it may
 * be stale.
 */
struct Tombstone {
    ObjectKey key;
    std::optional<GatewayObject> last_known;
};

/// Payload of a delete notification: the final object, or a tombstone.
using DeleteEvent = std::variant<GatewayObject, Tombstone>;

[[nodiscard]] inline const ObjectKey& key_of(const DeleteEvent& event) {
    if (const auto* obj = std::get_if<GatewayObject>(&event)) return obj->key;
    return std::get<Tombstone>(event).key;
}

struct WatchHandlers {
    std::function<void(const GatewayObject&)> on_add;
    std::function<void(const GatewayObject& old_obj, const GatewayObject& new_obj)> on_update;
    std::function<void(const DeleteEvent&)> on_delete;
};

/**
 * @brief Interface of a watched gateway collection.
 */
class IWatchSource {
public:
    virtual ~IWatchSource() = default;

    /**
     * @brief List the collection and start delivering notifications.
     *
     * Returns ErrorKind::Unavailable when the initial listing fails; no
     * handler is invoked and no thread is left running in that case.
     */
    virtual Result<void> start(WatchHandlers handlers) = 0;

    /// Stop delivering notifications. Idempotent.
    virtual void stop() = 0;

    /**
     * @brief Look an object up in the local cache.
     *
     * `nullopt` means not found; an error (normally ErrorKind::Transient)
     * means the cache could not answer.
     */
    virtual Result<std::optional<GatewayObject>> get_by_key(const ObjectKey& key) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

}  // namespace gateway_status
