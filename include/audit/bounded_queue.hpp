#pragma once

#include "core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <format>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace reqlog {

/**
 * @brief Bounded multi-producer FIFO with drop-oldest overflow
 *
 * Design:
 * - Fixed capacity chosen at construction
 * - Producers: enqueue() under a short mutex, no I/O, never blocks on
 *   a consumer
 * - Consumer: dequeue_batch() removes up to N items from the head in
 *   one critical section
 * - Overflow: evict the head (oldest) item, count it and log a warning
 *
 * @tparam T  Element type (cheap to move; the pipeline stores shared_ptr)
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;
    BoundedQueue(BoundedQueue&&) = delete;
    BoundedQueue& operator=(BoundedQueue&&) = delete;

    /**
     * @brief Append an item at the tail (producer, thread-safe)
     * @return true if the oldest item was evicted to make room
     */
    bool enqueue(T item) {
        bool evicted = false;
        size_t depth = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (items_.size() >= capacity_) {
                items_.pop_front();
                evicted = true;
            }
            items_.push_back(std::move(item));
            depth = items_.size();
        }

        if (evicted) {
            const uint64_t total = overflow_count_.fetch_add(1, std::memory_order_relaxed) + 1;
            utils::log::warn(std::format(
                "Log queue full ({}/{}): evicted oldest entry, {} evicted so far",
                depth, capacity_, total));
        }
        return evicted;
    }

    /**
     * @brief Remove up to max_count items from the head, in insertion order
     */
    [[nodiscard]] std::vector<T> dequeue_batch(size_t max_count) {
        std::vector<T> batch;
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t n = std::min(max_count, items_.size());
        batch.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            batch.push_back(std::move(items_.front()));
            items_.pop_front();
        }
        return batch;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const {
        return size() == 0;
    }

    [[nodiscard]] size_t capacity() const { return capacity_; }

    /// Number of items evicted by overflow since construction
    [[nodiscard]] uint64_t overflow_count() const {
        return overflow_count_.load(std::memory_order_relaxed);
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
    std::atomic<uint64_t> overflow_count_{0};
};

} // namespace reqlog
