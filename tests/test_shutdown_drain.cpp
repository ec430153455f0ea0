#include <catch2/catch_test_macros.hpp>
#include "server/shutdown_drain.hpp"
#include "audit/audit_pipeline.hpp"
#include "core/utils.hpp"
#include "mocks/mock_sink.hpp"

#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace reqlog;
using reqlog::testing::MockSink;

namespace {

LogEntry make_entry(int n) {
    LogEntry entry;
    entry.id = std::to_string(n);
    entry.timestamp = utils::now();
    return entry;
}

AuditPipeline::Config drain_config() {
    AuditPipeline::Config cfg;
    cfg.queue_capacity = 100;
    cfg.batch_size = 4;
    cfg.flush_interval = std::chrono::hours(1);
    return cfg;
}

ShutdownDrain::Config fast_drain() {
    ShutdownDrain::Config cfg;
    cfg.drain_interval = std::chrono::milliseconds(5);
    return cfg;
}

} // anonymous namespace

TEST_CASE("Shutdown Drain: initial state", "[shutdown]") {
    AuditPipeline pipeline(drain_config(), std::make_shared<MockSink>(), nullptr);
    ShutdownDrain drain(pipeline);
    CHECK_FALSE(drain.is_shutting_down());

    drain.initiate_shutdown();
    CHECK(drain.is_shutting_down());
}

TEST_CASE("Shutdown Drain: flushes every queued entry", "[shutdown]") {
    auto file = std::make_shared<MockSink>();
    auto store = std::make_shared<MockSink>();
    AuditPipeline pipeline(drain_config(), file, store);
    pipeline.start();

    for (int i = 0; i < 10; ++i) {
        pipeline.enqueue(make_entry(i));
    }

    ShutdownDrain drain(pipeline, fast_drain());
    CHECK(drain.drain() == 10);

    CHECK(drain.is_shutting_down());
    CHECK_FALSE(pipeline.is_running());
    CHECK(pipeline.queue_size() == 0);
    CHECK(file->write_count() == 10);
    CHECK(store->write_count() == 10);
}

TEST_CASE("Shutdown Drain: empty queue returns immediately", "[shutdown]") {
    AuditPipeline pipeline(drain_config(), std::make_shared<MockSink>(), nullptr);
    ShutdownDrain drain(pipeline, fast_drain());
    CHECK(drain.drain() == 0);
}

TEST_CASE("Shutdown Drain: failing sinks still empty the queue", "[shutdown]") {
    AuditPipeline pipeline(drain_config(), std::make_shared<MockSink>(false),
                           std::make_shared<MockSink>(false));
    for (int i = 0; i < 6; ++i) {
        pipeline.enqueue(make_entry(i));
    }

    ShutdownDrain drain(pipeline, fast_drain());
    CHECK(drain.drain() == 6);
    CHECK(pipeline.queue_size() == 0);
    CHECK(pipeline.get_stats().total_lost == 6);
}

TEST_CASE("Shutdown Drain: waits out an in-progress batch", "[shutdown]") {
    auto file = std::make_shared<MockSink>();
    AuditPipeline pipeline(drain_config(), file, nullptr);
    for (int i = 0; i < 6; ++i) {
        pipeline.enqueue(make_entry(i));
    }

    file->close_gate();
    auto busy = std::async(std::launch::async, [&pipeline] { return pipeline.flush_batch(); });
    REQUIRE(file->wait_for_blocked_writer(std::chrono::milliseconds(2000)));

    auto drained = std::async(std::launch::async, [&pipeline] {
        ShutdownDrain drain(pipeline, fast_drain());
        return drain.drain();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    file->open_gate();

    CHECK(busy.get().dequeued == 4);
    CHECK(drained.get() == 2);
    CHECK(pipeline.queue_size() == 0);
    CHECK(file->write_count() == 6);
}
