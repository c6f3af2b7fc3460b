/**
 * @file main.cpp
 * @brief GatewayStatus daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires all modules into the watch-and-reconcile pipeline:
 *   Config → Logger → Watch Source → Change Queue → Reconciler → Status Table → Query
 */

#include "controller/controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "status/reachability_query.hpp"
#include "status/status_table.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"
#include "watch/directory_source.hpp"
#include "watch/memory_source.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace gateway_status;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║           GatewayStatus v1.0.0            ║
  ║   Multi-Cluster Gateway Reachability      ║
  ║   Watch-and-Reconcile Engine              ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string watch_dir;
    std::string log_dir;
    std::string log_level;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--watch-dir" && i + 1 < argc) {
            args.watch_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: gateway_status [OPTIONS]\n"
                      << "  --config <path>      Configuration file (default: config/default.toml)\n"
                      << "  --watch-dir <path>   Directory of gateway documents to watch\n"
                      << "  --log-dir <path>     Log output directory (empty: stdout)\n"
                      << "  --log-level <level>  debug, info, warn or error\n"
                      << "  --demo               Replay a gateway failover in memory, then exit\n"
                      << "  --help, -h           Show this help message\n";
            std::exit(0);
        }
    }
    return args;
}

std::string join(const std::vector<ClusterId>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out.empty() ? "<none>" : out;
}

/// Block until `pred` holds or `timeout` elapses.
template <typename Pred>
bool wait_for(Pred pred, Millis timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(Millis{5});
    }
    return true;
}

/// Emit a one-line summary of a finished run as a metrics event.
void record_run_summary(MetricsCollector& metrics, const GatewayController& controller,
                        const StatusTable& table) {
    metrics.record_custom("run_summary",
        R"({"processed":)" + std::to_string(controller.processed_count())
        + R"(,"publishes":)" + std::to_string(controller.publish_count())
        + R"(,"resets":)" + std::to_string(controller.reset_count())
        + R"(,"requeues":)" + std::to_string(controller.requeue_count())
        + R"(,"table_version":)" + std::to_string(table.version()) + "}");
    metrics.flush();
}

/**
 * @brief Run a single demo: replay an active/passive gateway failover
 *        through an in-memory source and print the reachable set after
 *        each step.
 */
int run_demo(const Config& config, Logger& logger, MetricsCollector& metrics) {
    logger.info("=== Demo Mode ===");

    MemorySource source;
    StatusTable table;
    GatewayController controller(source, table, logger,
                                 {.queue = config.queue, .reconciler = config.reconciler},
                                 &metrics);

    const ObjectKey gw1{"submariner-operator", "gw-node-1"};
    const ObjectKey gw2{"submariner-operator", "gw-node-2"};
    source.upsert(make_gateway(gw1, "active", {{"connected", "east"}, {"connecting", "west"}}));
    source.upsert(make_gateway(gw2, "passive", {{"connected", "north"}}));

    if (auto started = controller.start(); !started) {
        logger.error("Demo failed to start: " + started.error().message);
        return 1;
    }

    auto step = [&](std::string_view label) {
        if (!source.wait_idle(Millis{2000})) {
            logger.warn("Watch source did not drain in time");
        }
        wait_for([&] { return controller.queue().size() == 0; }, Millis{2000});
        std::this_thread::sleep_for(Millis{50});
        logger.info(std::string(label) + ": reachable = "
                    + join(controller.query().reachable_clusters())
                    + " (version " + std::to_string(table.version()) + ")");
    };

    step("Initial listing");

    source.upsert(make_gateway(gw1, "active", {{"connected", "east"}, {"connected", "west"}}));
    step("West connected");

    source.upsert(make_gateway(gw1, "active", {{"error", "east"}, {"connected", "west"}}));
    step("East lost");

    source.remove(gw1, DeleteMode::Tombstone);
    step("Active gateway deleted");

    source.upsert(make_gateway(gw2, "active", {{"connected", "north"}, {"connected", "east"}}));
    step("Passive gateway promoted");

    controller.stop();
    record_run_summary(metrics, controller, table);
    logger.info("Processed " + std::to_string(controller.processed_count()) + " keys, "
                + std::to_string(controller.publish_count()) + " publishes, "
                + std::to_string(controller.reset_count()) + " resets");
    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        if (!config_result.error().is(ErrorKind::NotFound)) {
            return 1;
        }
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.watch_dir.empty()) {
        config.watch.source = "directory";
        config.watch.directory = args.watch_dir;
    }
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << level.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "gateway_status",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink), *level, "gateway_status");
    logger.info("GatewayStatus starting...");
    logger.info("Absent policy: " + std::string(to_string(config.reconciler.absent_policy)));

    // ── Initialize Telemetry ─────────────────
    std::unique_ptr<ILogSink> metrics_sink;
    if (config.telemetry.metrics_enabled && !config.telemetry.log_dir.empty()) {
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "gateway_metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        metrics_sink = std::make_unique<NullSink>();
    }
    MetricsCollector metrics(std::move(metrics_sink));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Demo mode shortcut ───────────────────
    // A source without an external feed only drives the demo replay
    if (args.demo_mode || !config.watch.has_external_feed()) {
        if (!args.demo_mode) logger.info("Watch source 'memory' selected, running demo replay");
        return run_demo(config, logger, metrics);
    }

    // ── Initialize Pipeline ──────────────────
    DirectorySource source(config.watch.directory,
                           config.watch.poll_interval_ms,
                           config.watch.resync_interval_ms,
                           logger);
    StatusTable table;
    GatewayController controller(source, table, logger,
                                 {.queue = config.queue, .reconciler = config.reconciler},
                                 &metrics);

    logger.info("Watching " + config.watch.directory.string() + " (poll: "
                + std::to_string(config.watch.poll_interval_ms) + "ms, resync: "
                + std::to_string(config.watch.resync_interval_ms) + "ms)");

    auto started = controller.start();
    if (!started) {
        logger.error("Could not start gateway controller: " + started.error().message);
        logger.flush();
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    const auto report_interval = Millis{config.status.report_interval_ms};
    auto next_report = std::chrono::steady_clock::now() + report_interval;
    while (!g_shutdown_requested) {
        if (report_interval.count() > 0 && std::chrono::steady_clock::now() >= next_report) {
            logger.info("Status: reachable clusters [" + join(controller.query().reachable_clusters())
                        + "], table version " + std::to_string(table.version())
                        + ", " + std::to_string(controller.processed_count()) + " keys processed, "
                        + std::to_string(controller.requeue_count()) + " requeues");
            metrics.flush();
            next_report = std::chrono::steady_clock::now() + report_interval;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    controller.stop();
    record_run_summary(metrics, controller, table);

    logger.info("GatewayStatus stopped.");
    logger.flush();
    return 0;
}
