#include "audit/stats_reporter.hpp"
#include "core/utils.hpp"

#include <format>

namespace reqlog {

// ============================================================================
// PipelineStats
// ============================================================================

std::string PipelineStats::total_size_mb() const {
    return std::format("{:.2f}", static_cast<double>(file.total_size) / 1024.0 / 1024.0);
}

nlohmann::json PipelineStats::to_json() const {
    nlohmann::json j;
    j["queue"] = {
        {"queue_size", queue.queue_size},
        {"max_queue_size", queue.max_queue_size},
        {"is_processing", queue.is_processing},
        {"batch_size", queue.batch_size},
    };

    if (file.error) {
        j["file"] = {{"error", *file.error}};
    } else {
        j["file"] = {
            {"files_count", file.files_count},
            {"total_size", file.total_size},
            {"total_size_mb", total_size_mb()},
        };
    }

    j["database"] = database;
    j["uptime"] = uptime_seconds;
    j["pipeline"] = {
        {"total_enqueued", pipeline.total_enqueued},
        {"total_persisted", pipeline.total_persisted},
        {"total_lost", pipeline.total_lost},
        {"overflow_dropped", pipeline.overflow_dropped},
        {"batches", pipeline.batches},
    };
    return j;
}

// ============================================================================
// StatsReporter
// ============================================================================

StatsReporter::StatsReporter(const AuditPipeline& pipeline,
                             std::shared_ptr<const FileSink> file_sink,
                             std::shared_ptr<const StoreSink> store_sink,
                             std::chrono::steady_clock::time_point started_at)
    : pipeline_(pipeline),
      file_sink_(std::move(file_sink)),
      store_sink_(std::move(store_sink)),
      started_at_(started_at) {}

PipelineStats::Files StatsReporter::file_stats() const {
    PipelineStats::Files files;
    try {
        for (const auto& path : file_sink_->list_log_files()) {
            files.total_size += std::filesystem::file_size(path);
            ++files.files_count;
        }
    } catch (const std::filesystem::filesystem_error& e) {
        files = PipelineStats::Files{};
        files.error = e.what();
    }
    return files;
}

std::optional<PipelineStats> StatsReporter::get_stats() const noexcept {
    try {
        PipelineStats stats;
        stats.queue.queue_size = pipeline_.queue_size();
        stats.queue.max_queue_size = pipeline_.config().queue_capacity;
        stats.queue.is_processing = pipeline_.is_processing();
        stats.queue.batch_size = pipeline_.config().batch_size;

        stats.file = file_stats();

        if (store_sink_ && store_sink_->is_enabled()) {
            const auto count = store_sink_->count();
            if (count.is_error()) {
                utils::log::error(std::format("Failed to get stats: {}", count.error_message()));
                return std::nullopt;
            }
            stats.database = count.value();
        }

        stats.uptime_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - started_at_).count();
        stats.pipeline = pipeline_.get_stats();
        return stats;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to get stats: {}", e.what()));
        return std::nullopt;
    }
}

} // namespace reqlog
