#pragma once

#include "audit/file_sink.hpp"
#include "audit/store_sink.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace reqlog {

/**
 * @brief Result of one tiered retention run
 */
struct RetentionSummary {
    struct Files {
        size_t archived = 0;
        size_t deleted = 0;
        std::optional<std::string> error;
    } files;

    struct Store {
        uint64_t deleted = 0;
        std::optional<std::string> error;
    } store;

    std::chrono::system_clock::time_point executed_at;

    [[nodiscard]] nlohmann::json to_json() const;
};

/**
 * @brief Age-based cleanup of daily log files and store records
 *
 * cleanup(days) is the on-demand operator action: delete every log file
 * last modified strictly before now - days, and the store records older
 * than the same cutoff.
 *
 * apply_policy() is the tiered variant: files past daily_days are moved
 * to <logs>/archives (gzip-compressed when configured) while younger
 * than archive_days, deleted after that; store records are deleted by
 * status class, each class with its own age threshold.
 */
class LogRetention {
public:
    struct Policy {
        int daily_days = 7;
        int archive_days = 30;
        bool compress_archives = false;
        int normal_days = 7;       // status < 400
        int error_days = 30;       // 400..499
        int critical_days = 90;    // >= 500
        std::chrono::hours interval{24};
    };

    static constexpr const char* kArchiveDir = "archives";

    /// Day thresholds above this are treated as this value
    static constexpr int kMaxRetentionDays = 36500;

    LogRetention(std::shared_ptr<FileSink> file_sink,
                 std::shared_ptr<StoreSink> store_sink,
                 Policy policy);
    ~LogRetention();

    LogRetention(const LogRetention&) = delete;
    LogRetention& operator=(const LogRetention&) = delete;

    /**
     * @brief Delete files and store records older than `older_than_days`
     *
     * Thresholds above kMaxRetentionDays are clamped to it.
     * @return Number of deleted files (store deletions are logged only)
     */
    size_t cleanup(int older_than_days);

    RetentionSummary apply_policy();

    /// Run apply_policy() every policy.interval on a background thread
    void start_schedule();
    void stop_schedule();

    [[nodiscard]] const Policy& policy() const { return policy_; }

    /// Gzip `source` into `source.gz` and remove `source`
    static bool compress_file(const std::filesystem::path& source);

private:
    RetentionSummary::Files apply_file_policy();
    RetentionSummary::Store apply_store_policy();

    void schedule_thread_func();

    std::shared_ptr<FileSink> file_sink_;
    std::shared_ptr<StoreSink> store_sink_;
    Policy policy_;

    // Serializes cleanup() and apply_policy()
    std::mutex run_mutex_;

    std::thread schedule_thread_;
    std::mutex schedule_mutex_;
    std::condition_variable schedule_cv_;
    bool schedule_running_ = false;
};

} // namespace reqlog
