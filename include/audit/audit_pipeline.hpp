#pragma once

#include "audit/audit_sink.hpp"
#include "audit/bounded_queue.hpp"
#include "audit/log_entry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace reqlog {

/**
 * @brief Outcome of one flush_batch() call
 */
struct BatchResult {
    bool ran = false;            ///< false if another batch was in progress
    size_t dequeued = 0;
    size_t file_written = 0;
    size_t store_written = 0;
    size_t lost = 0;             ///< Entries both sinks failed to persist
};

/**
 * @brief Bounded ingestion queue plus timer-driven batch flushing
 *
 * Producers (HTTP worker threads) call enqueue(), which never blocks on
 * persistence. A scheduler thread wakes every flush_interval and calls
 * flush_batch(), which takes up to batch_size entries from the head and
 * writes them to the file and store sinks.
 *
 *   [worker] --enqueue()--> [BoundedQueue] --flush_batch()--+--> file lane  (FIFO)
 *   [worker] --enqueue()-->                                 +--> store lane (FIFO)
 *
 * Single-flight: at most one batch runs at a time across the timer,
 * drain and operator calls; a call that finds a batch in progress
 * returns immediately with ran == false. Entries that neither sink
 * accepted are logged and dropped.
 */
class AuditPipeline {
public:
    struct Config {
        size_t queue_capacity = 1000;
        size_t batch_size = 10;
        std::chrono::milliseconds flush_interval{5000};
    };

    AuditPipeline(const Config& config,
                  std::shared_ptr<ILogSink> file_sink,
                  std::shared_ptr<ILogSink> store_sink);
    ~AuditPipeline();

    // Non-copyable, non-movable (owns the scheduler thread)
    AuditPipeline(const AuditPipeline&) = delete;
    AuditPipeline& operator=(const AuditPipeline&) = delete;
    AuditPipeline(AuditPipeline&&) = delete;
    AuditPipeline& operator=(AuditPipeline&&) = delete;

    /// Start the scheduler thread (idempotent)
    void start();

    /// Stop future ticks and join the scheduler; an in-flight batch completes
    void stop();

    [[nodiscard]] bool is_running() const {
        return running_.load(std::memory_order_acquire);
    }

    /// Queue an entry (non-blocking; evicts the oldest entry when full)
    void enqueue(LogEntry entry);
    void enqueue(LogEntryPtr entry);

    /// Run one batch now, unless one is already in progress
    BatchResult flush_batch();

    [[nodiscard]] size_t queue_size() const { return queue_.size(); }
    [[nodiscard]] bool is_processing() const {
        return processing_.load(std::memory_order_acquire);
    }
    [[nodiscard]] const Config& config() const { return config_; }

    struct Stats {
        uint64_t total_enqueued;     ///< Entries accepted by enqueue()
        uint64_t total_persisted;    ///< Entries written by at least one sink
        uint64_t total_lost;         ///< Entries rejected by both sinks
        uint64_t overflow_dropped;   ///< Entries evicted by a full queue
        uint64_t batches;            ///< Completed non-empty batches
        uint64_t file_failures;
        uint64_t store_failures;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void scheduler_thread_func();

    /// Writes every entry to one sink in order; returns per-entry success
    static std::vector<bool> write_lane(ILogSink* sink, const std::vector<LogEntryPtr>& batch);

    Config config_;
    std::shared_ptr<ILogSink> file_sink_;
    std::shared_ptr<ILogSink> store_sink_;

    BoundedQueue<LogEntryPtr> queue_;

    // -- Scheduler thread --
    std::thread scheduler_thread_;
    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // -- Single-flight guard --
    std::atomic<bool> processing_{false};

    // -- Stats --
    std::atomic<uint64_t> total_enqueued_{0};
    std::atomic<uint64_t> total_persisted_{0};
    std::atomic<uint64_t> total_lost_{0};
    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> file_failures_{0};
    std::atomic<uint64_t> store_failures_{0};
};

} // namespace reqlog
