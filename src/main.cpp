#include "core/utils.hpp"
#include "config/config_loader.hpp"
#include "audit/audit_pipeline.hpp"
#include "audit/file_sink.hpp"
#include "audit/log_retention.hpp"
#include "audit/record_builder.hpp"
#include "audit/stats_reporter.hpp"
#include "audit/store_sink.hpp"
#include "server/capture_middleware.hpp"
#include "server/http_server.hpp"
#include "server/shutdown_drain.hpp"
#include "server/signal_watcher.hpp"

#ifdef ENABLE_POSTGRESQL
#include "db/postgresql/pg_record_store.hpp"
#endif

#include <chrono>
#include <cstdlib>
#include <format>
#include <memory>

using namespace reqlog;

// =========================================================================
// Record store selection
// =========================================================================

static std::shared_ptr<IRecordStore> create_record_store(const StoreConfig& config) {
    if (!config.enabled) {
        return nullptr;
    }

    #ifdef ENABLE_POSTGRESQL
    if (config.backend == "postgresql") {
        auto store = std::make_shared<PgRecordStore>(
            PgRecordStore::Config{config.connection_string, config.table});
        const auto opened = store->open();
        if (opened.is_error()) {
            // Inserts retry the connection; the file sink keeps working meanwhile
            utils::log::error(opened.error_message());
        }
        return store;
    }
    #endif

    utils::log::error(std::format("Record store backend '{}' not available in this build",
                                  config.backend));
    return nullptr;
}

int main(int argc, char* argv[]) {
    const auto process_start = std::chrono::steady_clock::now();

    // Must precede every std::thread so all threads inherit the mask
    SignalWatcher::block_signals();

    try {
        utils::log::info("reqlog starting...");

        std::string config_file = "config/reqlog.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/5] Loading configuration from {}", config_file));
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return EXIT_FAILURE;
        }
        const AppConfig& cfg = config_result.config;
        if (const auto level = utils::log::parse_level(cfg.logging.level)) {
            utils::log::set_level(*level);
        }
        const auto& audit = cfg.audit;

        // =====================================================================
        // [2/5] Sinks
        // =====================================================================
        utils::log::info(std::format("[2/5] Sinks: file={}, store={}",
            audit.logs_dir, audit.store.enabled ? audit.store.backend : "disabled"));
        auto file_sink = std::make_shared<FileSink>(FileSink::Config{audit.logs_dir});
        auto store_sink = std::make_shared<StoreSink>(
            audit.store.enabled, create_record_store(audit.store));

        // =====================================================================
        // [3/5] Pipeline
        // =====================================================================
        utils::log::info("[3/5] Audit pipeline initializing...");
        AuditPipeline pipeline(
            AuditPipeline::Config{audit.queue_capacity, audit.batch_size, audit.flush_interval},
            file_sink, store_sink);
        pipeline.start();

        StatsReporter stats(pipeline, file_sink, store_sink, process_start);

        // =====================================================================
        // [4/5] Retention
        // =====================================================================
        const auto& r = audit.retention;
        LogRetention retention(file_sink, store_sink, LogRetention::Policy{
            .daily_days = r.daily_days,
            .archive_days = r.archive_days,
            .compress_archives = r.compress_archives,
            .normal_days = r.normal_days,
            .error_days = r.error_days,
            .critical_days = r.critical_days,
            .interval = std::chrono::hours(r.interval_hours),
        });
        if (r.scheduled) {
            retention.start_schedule();
        }
        utils::log::info(std::format("[4/5] Retention: on-demand default {} days, schedule {}",
            audit.retention_days, r.scheduled ? "on" : "off"));

        // =====================================================================
        // [5/5] HTTP server
        // =====================================================================
        RecordBuilder builder(RecordBuilder::Config{
            cfg.server.trusted_proxies, audit.max_raw_body_bytes});
        CaptureMiddleware capture(pipeline, std::move(builder));
        HttpServer server(cfg.server, capture, stats, retention, audit.retention_days);

        SignalWatcher signals([&server](int) { server.stop(); });
        signals.start();

        utils::log::info("[5/5] HTTP server starting...");
        server.start();  // blocks until a signal stops it

        // Producers are gone; exhaust the queue before exiting
        retention.stop_schedule();
        ShutdownDrain drain(pipeline, ShutdownDrain::Config{audit.drain_interval});
        (void)drain.drain();

        signals.stop();
        utils::log::info("reqlog stopped");

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal: {}", e.what()));
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
