#include "audit/log_retention.hpp"
#include "core/utils.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <system_error>

namespace reqlog {

namespace {

using FileClock = std::filesystem::file_time_type::clock;

constexpr size_t kChunkSize = 64 * 1024;

// Clamped so that now - age stays representable on both clocks
std::chrono::hours retention_age(int days) {
    return utils::days(std::clamp(days, 0, LogRetention::kMaxRetentionDays));
}

std::filesystem::file_time_type file_cutoff(int days) {
    return FileClock::now() - retention_age(days);
}

} // anonymous namespace

nlohmann::json RetentionSummary::to_json() const {
    nlohmann::json j;
    j["files"] = {{"archived", files.archived}, {"deleted", files.deleted}};
    if (files.error) j["files"]["error"] = *files.error;
    j["database"] = {{"deleted", store.deleted}};
    if (store.error) j["database"]["error"] = *store.error;
    j["executed_at"] = utils::format_timestamp(executed_at);
    return j;
}

LogRetention::LogRetention(std::shared_ptr<FileSink> file_sink,
                           std::shared_ptr<StoreSink> store_sink,
                           Policy policy)
    : file_sink_(std::move(file_sink)),
      store_sink_(std::move(store_sink)),
      policy_(policy) {}

LogRetention::~LogRetention() {
    stop_schedule();
}

// ============================================================================
// On-demand cleanup
// ============================================================================

size_t LogRetention::cleanup(int older_than_days) {
    if (older_than_days < 1) {
        utils::log::warn(std::format("Log cleanup: ignoring invalid threshold of {} days",
                                     older_than_days));
        return 0;
    }

    std::lock_guard<std::mutex> lock(run_mutex_);
    const auto cutoff = file_cutoff(older_than_days);
    size_t deleted = 0;

    try {
        for (const auto& path : file_sink_->list_log_files()) {
            std::error_code ec;
            const auto mtime = std::filesystem::last_write_time(path, ec);
            if (ec || mtime >= cutoff) {
                continue;
            }
            if (std::filesystem::remove(path, ec)) {
                ++deleted;
            } else if (ec) {
                utils::log::error(std::format("Log cleanup: cannot delete '{}': {}",
                                              path.string(), ec.message()));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        utils::log::error(std::format("Log cleanup: cannot list '{}': {}",
                                      file_sink_->directory().string(), e.what()));
    }

    if (store_sink_ && store_sink_->is_enabled()) {
        const auto result = store_sink_->delete_many(
            RecordFilter::before(utils::now() - retention_age(older_than_days)));
        if (result.is_ok()) {
            utils::log::info(std::format("Log cleanup: {} store records deleted", result.value()));
        } else {
            utils::log::error(std::format("Log cleanup: store deletion failed: {}",
                                          result.error_message()));
        }
    }

    utils::log::info(std::format("Log cleanup: {} files older than {} days deleted",
                                 deleted, older_than_days));
    return deleted;
}

// ============================================================================
// Tiered policy
// ============================================================================

RetentionSummary LogRetention::apply_policy() {
    std::lock_guard<std::mutex> lock(run_mutex_);
    utils::log::info("Retention policy: starting");

    RetentionSummary summary;
    summary.files = apply_file_policy();
    summary.store = apply_store_policy();
    summary.executed_at = utils::now();

    utils::log::info(std::format("Retention policy: {} files archived, {} deleted, "
                                 "{} store records deleted",
                                 summary.files.archived, summary.files.deleted,
                                 summary.store.deleted));
    return summary;
}

RetentionSummary::Files LogRetention::apply_file_policy() {
    RetentionSummary::Files result;
    const auto archive_dir = file_sink_->directory() / kArchiveDir;
    const auto daily_cutoff = file_cutoff(policy_.daily_days);
    const auto archive_cutoff = file_cutoff(policy_.archive_days);

    try {
        std::filesystem::create_directories(archive_dir);

        for (const auto& path : file_sink_->list_log_files()) {
            const auto mtime = std::filesystem::last_write_time(path);
            if (mtime >= daily_cutoff) {
                continue;
            }

            std::error_code ec;
            if (mtime >= archive_cutoff) {
                const auto target = archive_dir / path.filename();
                std::filesystem::rename(path, target, ec);
                if (ec) {
                    utils::log::error(std::format("Retention policy: cannot archive '{}': {}",
                                                  path.string(), ec.message()));
                    continue;
                }
                if (policy_.compress_archives) {
                    (void)compress_file(target);
                }
                ++result.archived;
            } else if (std::filesystem::remove(path, ec)) {
                ++result.deleted;
            } else if (ec) {
                utils::log::error(std::format("Retention policy: cannot delete '{}': {}",
                                              path.string(), ec.message()));
            }
        }
    } catch (const std::filesystem::filesystem_error& e) {
        utils::log::error(std::format("Retention policy: file pass failed: {}", e.what()));
        result.error = e.what();
    }
    return result;
}

RetentionSummary::Store LogRetention::apply_store_policy() {
    RetentionSummary::Store result;
    if (!store_sink_ || !store_sink_->is_enabled()) {
        return result;
    }

    struct Tier {
        const char* label;
        int days;
        std::optional<int> min_status;
        std::optional<int> max_status;
    };
    const std::array<Tier, 3> tiers = {{
        {"normal", policy_.normal_days, std::nullopt, 399},
        {"error", policy_.error_days, 400, 499},
        {"critical", policy_.critical_days, 500, std::nullopt},
    }};

    const auto now = utils::now();
    for (const auto& tier : tiers) {
        RecordFilter filter = RecordFilter::before(now - retention_age(tier.days));
        filter.min_status = tier.min_status;
        filter.max_status = tier.max_status;

        const auto deleted = store_sink_->delete_many(filter);
        if (deleted.is_ok()) {
            result.deleted += deleted.value();
        } else {
            utils::log::error(std::format("Retention policy: {} records not deleted: {}",
                                          tier.label, deleted.error_message()));
            result.error = deleted.error_message();
        }
    }
    return result;
}

// ============================================================================
// Compression
// ============================================================================

bool LogRetention::compress_file(const std::filesystem::path& source) {
    auto target = source;
    target += ".gz";

    std::ifstream in(source, std::ios::binary);
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!in.is_open() || !out.is_open()) {
        utils::log::error(std::format("Archive compression: cannot open '{}'", source.string()));
        return false;
    }

    z_stream zs{};
    // windowBits=15+16 for gzip format
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                     15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        utils::log::error("Archive compression: deflateInit2 failed");
        return false;
    }

    std::string in_buf(kChunkSize, '\0');
    std::string out_buf(kChunkSize, '\0');
    int ret = Z_OK;
    bool ok = true;

    do {
        in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        const auto got = in.gcount();
        zs.next_in = reinterpret_cast<Bytef*>(in_buf.data());
        zs.avail_in = static_cast<uInt>(got);
        const int flush = in.eof() ? Z_FINISH : Z_NO_FLUSH;

        do {
            zs.next_out = reinterpret_cast<Bytef*>(out_buf.data());
            zs.avail_out = static_cast<uInt>(out_buf.size());
            ret = deflate(&zs, flush);
            if (ret == Z_STREAM_ERROR) {
                ok = false;
                break;
            }
            out.write(out_buf.data(),
                      static_cast<std::streamsize>(out_buf.size() - zs.avail_out));
        } while (zs.avail_out == 0);
    } while (ok && ret != Z_STREAM_END && !in.bad());

    deflateEnd(&zs);
    out.close();

    if (!ok || ret != Z_STREAM_END || !out) {
        utils::log::error(std::format("Archive compression failed for '{}'", source.string()));
        std::error_code ec;
        std::filesystem::remove(target, ec);
        return false;
    }

    in.close();
    std::error_code ec;
    std::filesystem::remove(source, ec);
    utils::log::info(std::format("Archive compressed: {}", target.filename().string()));
    return true;
}

// ============================================================================
// Schedule
// ============================================================================

void LogRetention::start_schedule() {
    std::lock_guard<std::mutex> lock(schedule_mutex_);
    if (schedule_running_) {
        return;
    }
    schedule_running_ = true;
    schedule_thread_ = std::thread(&LogRetention::schedule_thread_func, this);
    utils::log::info(std::format("Retention policy scheduled every {}h",
                                 policy_.interval.count()));
}

void LogRetention::stop_schedule() {
    {
        std::lock_guard<std::mutex> lock(schedule_mutex_);
        if (!schedule_running_) {
            return;
        }
        schedule_running_ = false;
    }
    schedule_cv_.notify_all();
    if (schedule_thread_.joinable()) {
        schedule_thread_.join();
    }
}

void LogRetention::schedule_thread_func() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(schedule_mutex_);
            schedule_cv_.wait_for(lock, policy_.interval, [this] { return !schedule_running_; });
            if (!schedule_running_) {
                return;
            }
        }

        try {
            (void)apply_policy();
        } catch (const std::exception& e) {
            utils::log::error(std::format("Retention policy run failed: {}", e.what()));
        }
    }
}

} // namespace reqlog
