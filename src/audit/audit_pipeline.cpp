#include "audit/audit_pipeline.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>
#include <system_error>

namespace reqlog {

namespace {

/// Clears the single-flight flag when a batch leaves scope
class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ProcessingGuard() { flag_.store(false, std::memory_order_release); }

    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // anonymous namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

AuditPipeline::AuditPipeline(const Config& config,
                             std::shared_ptr<ILogSink> file_sink,
                             std::shared_ptr<ILogSink> store_sink)
    : config_(config),
      file_sink_(std::move(file_sink)),
      store_sink_(std::move(store_sink)),
      queue_(config.queue_capacity) {}

AuditPipeline::~AuditPipeline() {
    stop();
}

void AuditPipeline::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load(std::memory_order_acquire)) {
        return;
    }
    running_.store(true, std::memory_order_release);
    scheduler_thread_ = std::thread(&AuditPipeline::scheduler_thread_func, this);
    utils::log::info(std::format("Audit pipeline started: capacity={} batch={} interval={}ms",
                                 config_.queue_capacity, config_.batch_size,
                                 config_.flush_interval.count()));
}

void AuditPipeline::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }
    }
    wake_cv_.notify_all();

    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    utils::log::info(std::format("Audit pipeline timer stopped ({} entries queued)",
                                 queue_.size()));
}

// ============================================================================
// Producer Interface
// ============================================================================

void AuditPipeline::enqueue(LogEntry entry) {
    enqueue(std::make_shared<const LogEntry>(std::move(entry)));
}

void AuditPipeline::enqueue(LogEntryPtr entry) {
    if (!entry) {
        return;
    }
    (void)queue_.enqueue(std::move(entry));
    total_enqueued_.fetch_add(1, std::memory_order_relaxed);
}

// ============================================================================
// Batch Flush
// ============================================================================

std::vector<bool> AuditPipeline::write_lane(ILogSink* sink,
                                            const std::vector<LogEntryPtr>& batch) {
    std::vector<bool> written(batch.size(), false);
    if (!sink) {
        return written;
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        try {
            written[i] = sink->write(*batch[i]);
        } catch (const std::exception& e) {
            utils::log::error(std::format("{}: write of entry {} threw: {}",
                                          sink->name(), batch[i]->id, e.what()));
        }
    }
    return written;
}

BatchResult AuditPipeline::flush_batch() {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return BatchResult{};
    }
    ProcessingGuard guard(processing_);

    BatchResult result;
    result.ran = true;

    const std::vector<LogEntryPtr> batch = queue_.dequeue_batch(config_.batch_size);
    result.dequeued = batch.size();
    if (batch.empty()) {
        return result;
    }

    // File lane on its own thread, store lane on this one; both keep FIFO order
    std::vector<bool> file_ok;
    std::vector<bool> store_ok;
    try {
        auto file_future = std::async(std::launch::async,
            [this, &batch] { return write_lane(file_sink_.get(), batch); });
        store_ok = write_lane(store_sink_.get(), batch);
        file_ok = file_future.get();
    } catch (const std::system_error& e) {
        utils::log::warn(std::format("Audit pipeline: concurrent write unavailable ({}), "
                                     "writing sinks sequentially", e.what()));
        if (store_ok.empty()) {
            store_ok = write_lane(store_sink_.get(), batch);
        }
        file_ok = write_lane(file_sink_.get(), batch);
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        if (file_ok[i]) {
            ++result.file_written;
        } else {
            file_failures_.fetch_add(1, std::memory_order_relaxed);
        }
        if (store_ok[i]) {
            ++result.store_written;
        } else {
            store_failures_.fetch_add(1, std::memory_order_relaxed);
        }

        if (!file_ok[i] && !store_ok[i]) {
            ++result.lost;
            utils::log::error(std::format("Log entry {} lost: file and store writes both failed",
                                          batch[i]->id));
        }
    }

    total_persisted_.fetch_add(result.dequeued - result.lost, std::memory_order_relaxed);
    total_lost_.fetch_add(result.lost, std::memory_order_relaxed);
    batches_.fetch_add(1, std::memory_order_relaxed);
    return result;
}

AuditPipeline::Stats AuditPipeline::get_stats() const {
    return Stats{
        .total_enqueued = total_enqueued_.load(std::memory_order_relaxed),
        .total_persisted = total_persisted_.load(std::memory_order_relaxed),
        .total_lost = total_lost_.load(std::memory_order_relaxed),
        .overflow_dropped = queue_.overflow_count(),
        .batches = batches_.load(std::memory_order_relaxed),
        .file_failures = file_failures_.load(std::memory_order_relaxed),
        .store_failures = store_failures_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Scheduler Thread
// ============================================================================

void AuditPipeline::scheduler_thread_func() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, config_.flush_interval, [this] {
                return !running_.load(std::memory_order_acquire);
            });
        }

        if (!running_.load(std::memory_order_acquire)) {
            return;
        }

        try {
            const auto result = flush_batch();
            if (result.ran && result.dequeued > 0) {
                utils::log::debug(std::format(
                    "Audit batch: {} dequeued, {} to file, {} to store, {} lost",
                    result.dequeued, result.file_written, result.store_written, result.lost));
            }
        } catch (const std::exception& e) {
            utils::log::error(std::format("Audit pipeline: batch failed: {}", e.what()));
        }
    }
}

} // namespace reqlog
