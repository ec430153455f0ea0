#pragma once

#include "audit/record_store.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace reqlog::testing {

/**
 * @brief In-memory record store honoring RecordFilter
 *
 * Records are matched on their "timestamp" (ISO-8601 string, compared
 * lexicographically) and "status_code" fields.
 */
class MockRecordStore : public IRecordStore {
public:
    explicit MockRecordStore(bool should_succeed = true)
        : should_succeed_(should_succeed) {}

    [[nodiscard]] bool insert(const nlohmann::json& record) override {
        insert_count_.fetch_add(1, std::memory_order_relaxed);
        if (!should_succeed_.load(std::memory_order_relaxed)) {
            return false;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
        return true;
    }

    [[nodiscard]] Result<uint64_t> count(const RecordFilter& filter) override {
        if (!should_succeed_.load(std::memory_order_relaxed)) {
            return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, "Mock store down");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t n = 0;
        for (const auto& r : records_) {
            if (matches(r, filter)) ++n;
        }
        return Result<uint64_t>::ok(n);
    }

    [[nodiscard]] Result<uint64_t> delete_many(const RecordFilter& filter) override {
        if (!should_succeed_.load(std::memory_order_relaxed)) {
            return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, "Mock store down");
        }
        std::lock_guard<std::mutex> lock(mutex_);
        const auto before = records_.size();
        std::erase_if(records_, [&filter](const nlohmann::json& r) { return matches(r, filter); });
        return Result<uint64_t>::ok(before - records_.size());
    }

    [[nodiscard]] std::string name() const override { return "mock"; }

    void add_raw(nlohmann::json record) {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(std::move(record));
    }

    [[nodiscard]] std::vector<nlohmann::json> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    void set_should_succeed(bool v) { should_succeed_.store(v, std::memory_order_relaxed); }

    [[nodiscard]] uint64_t insert_count() const {
        return insert_count_.load(std::memory_order_relaxed);
    }

private:
    static bool matches(const nlohmann::json& r, const RecordFilter& filter) {
        if (filter.older_than &&
            !(r.value("timestamp", std::string{}) < utils::format_timestamp(*filter.older_than))) {
            return false;
        }
        const int status = r.value("status_code", 0);
        if (filter.min_status && status < *filter.min_status) return false;
        if (filter.max_status && status > *filter.max_status) return false;
        return true;
    }

    std::atomic<bool> should_succeed_;
    std::atomic<uint64_t> insert_count_{0};
    mutable std::mutex mutex_;
    std::vector<nlohmann::json> records_;
};

} // namespace reqlog::testing
