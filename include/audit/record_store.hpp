#pragma once

#include "core/error.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace reqlog {

/**
 * @brief Selection criteria for count/delete against the record store
 *
 * Empty filter matches every record. Bounds are inclusive.
 */
struct RecordFilter {
    std::optional<std::chrono::system_clock::time_point> older_than;  // timestamp < cutoff
    std::optional<int> min_status;
    std::optional<int> max_status;

    [[nodiscard]] static RecordFilter before(std::chrono::system_clock::time_point cutoff) {
        RecordFilter f;
        f.older_than = cutoff;
        return f;
    }
};

/**
 * @brief Structured record store used by the store sink
 *
 * The pipeline needs only insert-one, count and delete-by-filter.
 * Implementations must be safe to call from several threads.
 */
class IRecordStore {
public:
    virtual ~IRecordStore() = default;

    /// Insert one serialized entry. Returns true on success.
    [[nodiscard]] virtual bool insert(const nlohmann::json& record) = 0;

    [[nodiscard]] virtual Result<uint64_t> count(const RecordFilter& filter) = 0;

    /// Returns the number of deleted records
    [[nodiscard]] virtual Result<uint64_t> delete_many(const RecordFilter& filter) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace reqlog
