#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>

namespace reqlog {

class AuditPipeline;

/**
 * @brief Exhausts the audit queue before the process exits
 *
 * drain() stops the pipeline timer, then repeatedly runs the same
 * flush_batch() the timer uses, sleeping drain_interval between
 * iterations, until the queue is empty. Producers must already be
 * stopped (HTTP server closed) for the loop to terminate.
 */
class ShutdownDrain {
public:
    struct Config {
        std::chrono::milliseconds drain_interval{100};
    };

    explicit ShutdownDrain(AuditPipeline& pipeline);
    ShutdownDrain(AuditPipeline& pipeline, const Config& config);

    /// Mark shutdown as started (idempotent)
    void initiate_shutdown();

    /**
     * @brief Flush until the queue is empty
     * @return Number of entries dequeued while draining
     */
    size_t drain();

    [[nodiscard]] bool is_shutting_down() const {
        return shutting_down_.load(std::memory_order_acquire);
    }

private:
    AuditPipeline& pipeline_;
    Config config_;
    std::atomic<bool> shutting_down_{false};
};

} // namespace reqlog
