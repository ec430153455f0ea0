#include "audit/file_sink.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <system_error>

namespace reqlog {

FileSink::FileSink(const Config& config)
    : directory_(config.directory) {
    ready_ = ensure_directory();
}

FileSink::~FileSink() {
    release();
}

bool FileSink::ensure_directory() {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        utils::log::error(std::format("File sink: cannot create logs directory '{}': {}",
                                      directory_.string(), ec.message()));
        return false;
    }
    return true;
}

std::filesystem::path FileSink::file_for(const LogEntry& entry) const {
    return directory_ / (utils::format_date(entry.timestamp) + kExtension);
}

bool FileSink::write(const LogEntry& entry) {
    try {
        const auto path = file_for(entry);
        std::string line = serialize(entry);
        line += '\n';

        std::lock_guard<std::mutex> lock(write_mutex_);

        // Day rollover or first write: switch the cached stream
        if (!stream_.is_open() || open_path_ != path) {
            if (stream_.is_open()) {
                stream_.close();
            }
            stream_.clear();
            stream_.open(path, std::ios::app | std::ios::binary);
            if (!stream_.is_open()) {
                utils::log::error(std::format("File sink: cannot open '{}' for entry {}",
                                              path.string(), entry.id));
                open_path_.clear();
                return false;
            }
            open_path_ = path;
        }

        stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
        stream_.flush();
        if (!stream_.good()) {
            utils::log::error(std::format("File sink: write to '{}' failed for entry {}",
                                          path.string(), entry.id));
            stream_.close();
            open_path_.clear();
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        utils::log::error(std::format("File sink: entry {} not written: {}", entry.id, e.what()));
        return false;
    }
}

void FileSink::release() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
    open_path_.clear();
}

std::string FileSink::name() const {
    return "file:" + directory_.string();
}

std::vector<std::filesystem::path> FileSink::list_log_files() const {
    std::vector<std::filesystem::path> files;
    for (const auto& dirent : std::filesystem::directory_iterator(directory_)) {
        if (dirent.is_regular_file() && dirent.path().extension() == kExtension) {
            files.push_back(dirent.path());
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace reqlog
