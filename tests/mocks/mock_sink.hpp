#pragma once

#include "audit/audit_sink.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace reqlog::testing {

/**
 * @brief Recording sink with switchable failure and an optional gate
 *
 * When the gate is closed, write() blocks until open_gate() is called;
 * used to hold a batch "in progress".
 */
class MockSink : public ILogSink {
public:
    explicit MockSink(bool should_succeed = true, std::string label = "mock")
        : should_succeed_(should_succeed), label_(std::move(label)) {}

    [[nodiscard]] bool write(const LogEntry& entry) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++waiting_;
            waiting_cv_.notify_all();
            gate_cv_.wait(lock, [this] { return gate_open_; });
            --waiting_;
            entries_.push_back(entry);
        }
        write_count_.fetch_add(1, std::memory_order_relaxed);
        return should_succeed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::string name() const override { return "mock:" + label_; }

    void set_should_succeed(bool v) { should_succeed_.store(v, std::memory_order_relaxed); }

    void close_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    /// Wait until some write() is parked at the closed gate
    bool wait_for_blocked_writer(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return waiting_cv_.wait_for(lock, timeout, [this] { return waiting_ > 0; });
    }

    [[nodiscard]] std::vector<std::string> ids() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& e : entries_) out.push_back(e.id);
        return out;
    }

    [[nodiscard]] std::vector<LogEntry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    [[nodiscard]] uint64_t write_count() const {
        return write_count_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> should_succeed_;
    std::string label_;
    std::atomic<uint64_t> write_count_{0};

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    std::condition_variable waiting_cv_;
    bool gate_open_ = true;
    int waiting_ = 0;
    std::vector<LogEntry> entries_;
};

} // namespace reqlog::testing
