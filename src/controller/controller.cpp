/**
 * @file controller.cpp
 * @brief GatewayController lifecycle and worker loop.
 * @author Dimitris Kafetzis
 */

#include "controller/controller.hpp"

namespace gateway_status {

GatewayController::GatewayController(IWatchSource& source,
                                     StatusTable& table,
                                     Logger& logger,
                                     Options opts,
                                     MetricsCollector* metrics)
    : source_(source)
    , logger_(logger)
    , metrics_(metrics)
    , queue_(Millis{opts.queue.base_delay_ms}, Millis{opts.queue.max_delay_ms})
    , reconciler_(table, logger, opts.reconciler.absent_policy, metrics)
    , query_(table) {
}

GatewayController::~GatewayController() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> GatewayController::start() {
    std::lock_guard lock(lifecycle_mutex_);
    if (state_.load() != ControllerState::Created) {
        return Error{"Controller cannot start from state "
                     + std::string(to_string(state_.load()))};
    }

    logger_.info("Starting gateway controller (source: " + std::string(source_.name()) + ")");
    state_.store(ControllerState::Started);

    auto started = source_.start(make_handlers());
    if (!started) {
        logger_.error("Failed to start watch source: " + started.error().message);
        queue_.shut_down();
        state_.store(ControllerState::Stopped);
        return started.error();
    }

    worker_ = std::jthread([this](std::stop_token st) { worker_loop(st); });
    state_.store(ControllerState::Running);
    logger_.info("Gateway controller running");
    return Result<void>{};
}

void GatewayController::stop() {
    std::lock_guard lock(lifecycle_mutex_);
    auto previous = state_.exchange(ControllerState::Stopped);
    if (previous == ControllerState::Stopped) return;

    if (previous == ControllerState::Created) {
        queue_.shut_down();
        return;
    }

    logger_.info("Gateway controller shutting down...");
    worker_.request_stop();
    queue_.shut_down();
    source_.stop();
    if (worker_.joinable()) worker_.join();
    logger_.info("Gateway controller stopped");
}

bool GatewayController::is_cluster_reachable(std::string_view cluster_id) const {
    return query_.is_reachable(cluster_id);
}

// ─────────────────────────────────────────────
// Watch Handlers (source delivery thread)
// ─────────────────────────────────────────────

WatchHandlers GatewayController::make_handlers() {
    WatchHandlers handlers;

    handlers.on_add = [this](const GatewayObject& obj) {
        enqueue(obj, "add");
    };

    handlers.on_update = [this](const GatewayObject& /*old_obj*/, const GatewayObject& new_obj) {
        enqueue(new_obj, "update");
    };

    handlers.on_delete = [this](const DeleteEvent& event) {
        const auto& key = key_of(event);
        logger_.debug("Gateway deleted: " + key.str());
        if (metrics_ != nullptr) metrics_->record_watch_event("delete", key);
        if (reconciler_.handle_delete(event)) {
            resets_.fetch_add(1);
        }
    };

    return handlers;
}

void GatewayController::enqueue(const GatewayObject& obj, std::string_view event_type) {
    logger_.debug("Gateway " + std::string(event_type) + ": " + obj.key.str());
    if (metrics_ != nullptr) metrics_->record_watch_event(event_type, obj.key);
    reconciler_.observe(obj);
    queue_.add(obj.key);
}

// ─────────────────────────────────────────────
// Worker
// ─────────────────────────────────────────────

void GatewayController::worker_loop(std::stop_token stop) {
    logger_.debug("Reconciler worker started");
    while (!stop.stop_requested()) {
        auto key = queue_.get();
        if (!key) break;  // queue shut down
        process(*key);
    }
    logger_.debug("Reconciler worker exiting");
}

void GatewayController::process(const ObjectKey& key) {
    auto outcome = reconciler_.sync(key, source_);
    if (!outcome) {
        auto attempts = queue_.num_requeues(key) + 1;
        logger_.error("Failed to reconcile " + key.str() + ": " + outcome.error().message
                      + " (attempt " + std::to_string(attempts) + ")");
        queue_.add_rate_limited(key);
        requeues_.fetch_add(1);
        if (metrics_ != nullptr) metrics_->record_requeue(key, attempts);
    } else {
        queue_.forget(key);
        if (*outcome == ReconcileOutcome::Published) publishes_.fetch_add(1);
    }
    processed_.fetch_add(1);
    queue_.done(key);
}

}  // namespace gateway_status
