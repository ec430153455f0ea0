#include <catch2/catch_test_macros.hpp>
#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace reqlog;

namespace {

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line)) {
        lines.push_back(line);
    }
    return lines;
}

LogEntry make_entry(std::string id, std::chrono::system_clock::time_point ts = utils::now()) {
    LogEntry entry;
    entry.id = std::move(id);
    entry.timestamp = ts;
    entry.method = "GET";
    entry.url = "/items";
    entry.status_code = 200;
    return entry;
}

} // anonymous namespace

TEST_CASE("File Sink: creates directory and names files by UTC date", "[sink][file]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_file_sink_dir/nested";
    std::filesystem::remove_all("/tmp/reqlog_test_file_sink_dir");

    FileSink sink(FileSink::Config{dir.string()});
    CHECK(sink.is_ready());
    CHECK(std::filesystem::is_directory(dir));
    CHECK(sink.name() == "file:" + dir.string());

    const auto entry = make_entry("aaaaaaaaaaaaaaaa");
    CHECK(sink.file_for(entry) == dir / (utils::format_date(entry.timestamp) + ".log"));

    std::filesystem::remove_all("/tmp/reqlog_test_file_sink_dir");
}

TEST_CASE("File Sink: appends one JSON line per entry", "[sink][file]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_file_sink_append";
    std::filesystem::remove_all(dir);

    FileSink sink(FileSink::Config{dir.string()});
    REQUIRE(sink.write(make_entry("0000000000000001")));
    REQUIRE(sink.write(make_entry("0000000000000002")));
    sink.release();

    const auto lines = read_lines(sink.file_for(make_entry("x")));
    REQUIRE(lines.size() == 2);
    CHECK(nlohmann::json::parse(lines[0])["id"] == "0000000000000001");
    CHECK(nlohmann::json::parse(lines[1])["id"] == "0000000000000002");

    std::filesystem::remove_all(dir);
}

TEST_CASE("File Sink: entries of different days go to different files", "[sink][file]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_file_sink_days";
    std::filesystem::remove_all(dir);

    FileSink sink(FileSink::Config{dir.string()});
    const auto today = utils::now();
    const auto earlier = today - utils::days(3);

    REQUIRE(sink.write(make_entry("1111111111111111", earlier)));
    REQUIRE(sink.write(make_entry("2222222222222222", today)));
    REQUIRE(sink.write(make_entry("3333333333333333", earlier)));
    sink.release();

    const auto files = sink.list_log_files();
    REQUIRE(files.size() == 2);
    CHECK(read_lines(dir / (utils::format_date(earlier) + ".log")).size() == 2);
    CHECK(read_lines(dir / (utils::format_date(today) + ".log")).size() == 1);

    std::filesystem::remove_all(dir);
}

TEST_CASE("File Sink: list ignores non-log files", "[sink][file]") {
    const std::filesystem::path dir = "/tmp/reqlog_test_file_sink_list";
    std::filesystem::remove_all(dir);

    FileSink sink(FileSink::Config{dir.string()});
    std::ofstream(dir / "2024-01-02.log") << "{}\n";
    std::ofstream(dir / "2024-01-01.log") << "{}\n";
    std::ofstream(dir / "notes.txt") << "x\n";
    std::filesystem::create_directories(dir / "archives");

    const auto files = sink.list_log_files();
    REQUIRE(files.size() == 2);
    CHECK(files[0].filename() == "2024-01-01.log");
    CHECK(files[1].filename() == "2024-01-02.log");

    std::filesystem::remove_all(dir);
}

TEST_CASE("File Sink: unwritable directory reports failure", "[sink][file]") {
    const std::filesystem::path blocker = "/tmp/reqlog_test_file_sink_blocker";
    std::filesystem::remove_all(blocker);
    std::ofstream(blocker) << "regular file";

    // A directory cannot be created beneath a regular file
    FileSink sink(FileSink::Config{(blocker / "logs").string()});
    CHECK_FALSE(sink.is_ready());
    CHECK_FALSE(sink.write(make_entry("ffffffffffffffff")));

    std::filesystem::remove_all(blocker);
}
