#pragma once

#include "audit/audit_sink.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <vector>

namespace reqlog {

/**
 * @brief Append-only daily file sink
 *
 * Each entry is appended as one newline-terminated JSON line to
 * `<directory>/YYYY-MM-DD.log`, the date taken from the entry's UTC
 * timestamp. The directory is created once at construction; failure is
 * logged and every later write fails individually.
 */
class FileSink : public ILogSink {
public:
    struct Config {
        std::string directory = ".logs";
    };

    static constexpr const char* kExtension = ".log";

    explicit FileSink(const Config& config);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool write(const LogEntry& entry) override;
    [[nodiscard]] std::string name() const override;

    /// All `*.log` files directly inside the directory (throws on I/O failure)
    [[nodiscard]] std::vector<std::filesystem::path> list_log_files() const;

    [[nodiscard]] const std::filesystem::path& directory() const { return directory_; }

    /// Destination file for an entry: directory / "YYYY-MM-DD.log"
    [[nodiscard]] std::filesystem::path file_for(const LogEntry& entry) const;

    /// Whether the directory was available at construction
    [[nodiscard]] bool is_ready() const { return ready_; }

    /// Close the cached stream so the next write reopens its file
    void release();

private:
    bool ensure_directory();

    std::filesystem::path directory_;
    bool ready_ = false;

    std::mutex write_mutex_;
    std::ofstream stream_;
    std::filesystem::path open_path_;
};

} // namespace reqlog
