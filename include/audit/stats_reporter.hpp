#pragma once

#include "audit/audit_pipeline.hpp"
#include "audit/file_sink.hpp"
#include "audit/store_sink.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace reqlog {

/**
 * @brief Point-in-time snapshot of the logging pipeline
 */
struct PipelineStats {
    struct Queue {
        size_t queue_size = 0;
        size_t max_queue_size = 0;
        bool is_processing = false;
        size_t batch_size = 0;
    } queue;

    struct Files {
        size_t files_count = 0;
        uint64_t total_size = 0;             // bytes
        std::optional<std::string> error;    // set when the directory is unreadable
    } file;

    uint64_t database = 0;                   // record store count, 0 when disabled
    double uptime_seconds = 0.0;             // since StatsReporter's started_at
    AuditPipeline::Stats pipeline{};

    /// Megabytes with two decimals, e.g. "1.25"
    [[nodiscard]] std::string total_size_mb() const;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Read-only view over the pipeline, the logs directory and the store
 *
 * Uptime is measured from `started_at`. It defaults to the moment the
 * reporter is constructed; main passes the process start time instead.
 */
class StatsReporter {
public:
    StatsReporter(const AuditPipeline& pipeline,
                  std::shared_ptr<const FileSink> file_sink,
                  std::shared_ptr<const StoreSink> store_sink,
                  std::chrono::steady_clock::time_point started_at = std::chrono::steady_clock::now());

    /// Never throws; nullopt if the snapshot could not be assembled
    [[nodiscard]] std::optional<PipelineStats> get_stats() const noexcept;

private:
    [[nodiscard]] PipelineStats::Files file_stats() const;

    const AuditPipeline& pipeline_;
    std::shared_ptr<const FileSink> file_sink_;
    std::shared_ptr<const StoreSink> store_sink_;
    std::chrono::steady_clock::time_point started_at_;
};

} // namespace reqlog
