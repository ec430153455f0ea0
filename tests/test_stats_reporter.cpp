#include <catch2/catch_test_macros.hpp>
#include "audit/stats_reporter.hpp"
#include "core/utils.hpp"
#include "mocks/mock_record_store.hpp"
#include "mocks/mock_sink.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

using namespace reqlog;
using reqlog::testing::MockRecordStore;
using reqlog::testing::MockSink;

namespace {

AuditPipeline::Config pipeline_config() {
    AuditPipeline::Config cfg;
    cfg.queue_capacity = 50;
    cfg.batch_size = 5;
    return cfg;
}

} // anonymous namespace

TEST_CASE("Stats Reporter: snapshot of queue, files and store", "[stats]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_stats";
    std::filesystem::remove_all(dir);

    auto file_sink = std::make_shared<FileSink>(FileSink::Config{dir.string()});
    auto store = std::make_shared<MockRecordStore>();
    auto store_sink = std::make_shared<StoreSink>(true, store);
    AuditPipeline pipeline(pipeline_config(), std::make_shared<MockSink>(),
                           std::make_shared<MockSink>());

    std::ofstream(dir / "2024-01-01.log") << std::string(1024, 'a');
    std::ofstream(dir / "2024-01-02.log") << std::string(2048, 'b');
    std::ofstream(dir / "ignored.txt") << "zzz";
    (void)store->insert({{"id", "a"}, {"status_code", 200}});
    (void)store->insert({{"id", "b"}, {"status_code", 500}});

    for (int i = 0; i < 3; ++i) {
        LogEntry entry;
        entry.id = std::to_string(i);
        pipeline.enqueue(std::move(entry));
    }

    StatsReporter reporter(pipeline, file_sink, store_sink,
                           std::chrono::steady_clock::now() - std::chrono::seconds(5));
    const auto stats = reporter.get_stats();
    REQUIRE(stats.has_value());

    CHECK(stats->queue.queue_size == 3);
    CHECK(stats->queue.max_queue_size == 50);
    CHECK(stats->queue.batch_size == 5);
    CHECK_FALSE(stats->queue.is_processing);
    CHECK(stats->file.files_count == 2);
    CHECK(stats->file.total_size == 3072);
    CHECK(stats->database == 2);
    CHECK(stats->uptime_seconds >= 5.0);
    CHECK(stats->pipeline.total_enqueued == 3);

    const auto j = stats->to_json();
    CHECK(j["queue"]["queue_size"] == 3);
    CHECK(j["file"]["files_count"] == 2);
    CHECK(j["file"]["total_size_mb"] == "0.00");
    CHECK(j["database"] == 2);
    CHECK(j["uptime"].is_number());
    CHECK(j.contains("pipeline"));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Stats Reporter: uptime counts from the given start time", "[stats]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_stats_uptime";
    std::filesystem::remove_all(dir);

    auto file_sink = std::make_shared<FileSink>(FileSink::Config{dir.string()});
    auto store_sink = std::make_shared<StoreSink>(false, std::make_shared<MockRecordStore>());
    AuditPipeline pipeline(pipeline_config(), std::make_shared<MockSink>(),
                           std::make_shared<MockSink>());

    StatsReporter fresh(pipeline, file_sink, store_sink);
    const auto fresh_stats = fresh.get_stats();
    REQUIRE(fresh_stats.has_value());
    CHECK(fresh_stats->uptime_seconds < 60.0);

    StatsReporter long_running(pipeline, file_sink, store_sink,
                               std::chrono::steady_clock::now() - std::chrono::hours(2));
    const auto long_stats = long_running.get_stats();
    REQUIRE(long_stats.has_value());
    CHECK(long_stats->uptime_seconds >= 7200.0);
    CHECK(long_stats->uptime_seconds < 7260.0);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Stats Reporter: disabled store reports zero records", "[stats]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_stats_disabled";
    std::filesystem::remove_all(dir);

    auto file_sink = std::make_shared<FileSink>(FileSink::Config{dir.string()});
    auto store_sink = std::make_shared<StoreSink>(false, std::make_shared<MockRecordStore>(false));
    AuditPipeline pipeline(pipeline_config(), std::make_shared<MockSink>(), nullptr);

    StatsReporter reporter(pipeline, file_sink, store_sink);
    const auto stats = reporter.get_stats();
    REQUIRE(stats.has_value());
    CHECK(stats->database == 0);
    CHECK(stats->file.files_count == 0);

    std::filesystem::remove_all(dir);
}

TEST_CASE("Stats Reporter: store count failure yields no stats", "[stats]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_stats_store_down";
    std::filesystem::remove_all(dir);

    auto file_sink = std::make_shared<FileSink>(FileSink::Config{dir.string()});
    auto store_sink = std::make_shared<StoreSink>(true, std::make_shared<MockRecordStore>(false));
    AuditPipeline pipeline(pipeline_config(), std::make_shared<MockSink>(), store_sink);

    StatsReporter reporter(pipeline, file_sink, store_sink);
    CHECK_FALSE(reporter.get_stats().has_value());

    std::filesystem::remove_all(dir);
}

TEST_CASE("Stats Reporter: unreadable log directory reported as file error", "[stats]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_stats_vanished";
    std::filesystem::remove_all(dir);

    auto file_sink = std::make_shared<FileSink>(FileSink::Config{dir.string()});
    std::filesystem::remove_all(dir);

    AuditPipeline pipeline(pipeline_config(), file_sink, nullptr);
    StatsReporter reporter(pipeline, file_sink, nullptr);

    const auto stats = reporter.get_stats();
    REQUIRE(stats.has_value());
    REQUIRE(stats->file.error.has_value());
    CHECK(stats->to_json()["file"].contains("error"));
}

TEST_CASE("Stats Reporter: megabyte rendering", "[stats]") {
    PipelineStats stats;
    stats.file.total_size = 3 * 1024 * 1024 + 512 * 1024;
    CHECK(stats.total_size_mb() == "3.50");
}
