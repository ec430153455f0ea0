#include "server/shutdown_drain.hpp"
#include "audit/audit_pipeline.hpp"
#include "core/utils.hpp"

#include <format>
#include <thread>

namespace reqlog {

ShutdownDrain::ShutdownDrain(AuditPipeline& pipeline)
    : pipeline_(pipeline) {}

ShutdownDrain::ShutdownDrain(AuditPipeline& pipeline, const Config& config)
    : pipeline_(pipeline), config_(config) {}

void ShutdownDrain::initiate_shutdown() {
    shutting_down_.store(true, std::memory_order_release);
}

size_t ShutdownDrain::drain() {
    initiate_shutdown();
    pipeline_.stop();

    const size_t pending = pipeline_.queue_size();
    utils::log::info(std::format("Draining {} queued log entries before exit", pending));

    size_t drained = 0;
    size_t lost = 0;
    while (pipeline_.queue_size() > 0) {
        // ran == false means another caller holds the batch; retry after the sleep
        const auto result = pipeline_.flush_batch();
        drained += result.dequeued;
        lost += result.lost;

        if (pipeline_.queue_size() > 0) {
            std::this_thread::sleep_for(config_.drain_interval);
        }
    }

    if (lost > 0) {
        utils::log::warn(std::format("Drain finished: {} entries flushed, {} lost", drained, lost));
    } else {
        utils::log::info(std::format("Drain finished: {} entries flushed", drained));
    }
    return drained;
}

} // namespace reqlog
