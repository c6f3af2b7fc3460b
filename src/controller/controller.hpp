/**
 * @file controller.hpp
 * @brief Top-level GatewayController facade tying the pipeline together.
 * @author Dimitris Kafetzis
 *
 * Wires Watch Source → Change Queue → Reconciler → Status Table and owns the
 * single worker thread:
 *   1. Add/Update notifications record the object and enqueue its key
 *   2. Delete notifications run the deletion path inline
 *   3. The worker pops keys, looks them up and reconciles them
 *
 * Lifecycle: Created → Started → Running → Stopped. A stopped controller is
 * never restarted.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "queue/change_queue.hpp"
#include "reconciler/reconciler.hpp"
#include "status/reachability_query.hpp"
#include "status/status_table.hpp"
#include "telemetry/metrics_collector.hpp"
#include "watch/watch_source.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace gateway_status {

enum class ControllerState : uint8_t {
    Created,
    Started,
    Running,
    Stopped
};

[[nodiscard]] constexpr std::string_view to_string(ControllerState state) noexcept {
    switch (state) {
        case ControllerState::Created: return "created";
        case ControllerState::Started: return "started";
        case ControllerState::Running: return "running";
        case ControllerState::Stopped: return "stopped";
    }
    return "unknown";
}

class GatewayController {
public:
    struct Options {
        QueueConfig queue;
        ReconcilerConfig reconciler;
    };

    GatewayController(IWatchSource& source,
                      StatusTable& table,
                      Logger& logger,
                      Options opts = {},
                      MetricsCollector* metrics = nullptr);
    ~GatewayController();

    // Non-copyable, non-movable
    GatewayController(const GatewayController&) = delete;
    GatewayController& operator=(const GatewayController&) = delete;

    // ── Lifecycle ────────────────────────────
    Result<void> start();
    void stop();
    [[nodiscard]] ControllerState state() const noexcept { return state_.load(); }

    // ── Query ────────────────────────────────
    [[nodiscard]] bool is_cluster_reachable(std::string_view cluster_id) const;
    [[nodiscard]] const ReachabilityQuery& query() const noexcept { return query_; }

    // ── Accessors (for testing) ─────────────
    [[nodiscard]] uint64_t processed_count() const noexcept { return processed_.load(); }
    [[nodiscard]] uint64_t requeue_count() const noexcept { return requeues_.load(); }
    [[nodiscard]] uint64_t publish_count() const noexcept { return publishes_.load(); }
    [[nodiscard]] uint64_t reset_count() const noexcept { return resets_.load(); }
    ChangeQueue& queue() noexcept { return queue_; }
    Reconciler& reconciler() noexcept { return reconciler_; }

private:
    WatchHandlers make_handlers();
    void enqueue(const GatewayObject& obj, std::string_view event_type);
    void worker_loop(std::stop_token stop);
    void process(const ObjectKey& key);

    IWatchSource& source_;
    Logger& logger_;
    MetricsCollector* metrics_;

    ChangeQueue queue_;
    Reconciler reconciler_;
    ReachabilityQuery query_;

    std::mutex lifecycle_mutex_;
    std::atomic<ControllerState> state_{ControllerState::Created};

    std::atomic<uint64_t> processed_{0};
    std::atomic<uint64_t> requeues_{0};
    std::atomic<uint64_t> publishes_{0};
    std::atomic<uint64_t> resets_{0};

    std::jthread worker_;
};

}  // namespace gateway_status
