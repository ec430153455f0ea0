#pragma once

#include "audit/log_entry.hpp"

#include <string>

namespace reqlog {

/**
 * @brief Abstract interface for log entry persistence targets
 *
 * Called from the pipeline's batch lanes. Each sink is driven by exactly
 * one lane per batch, but a sink may be shared with operator calls
 * (cleanup, stats), so implementations guard their own state.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Persist one entry. Returns true on success; never throws.
    [[nodiscard]] virtual bool write(const LogEntry& entry) = 0;

    /// Human-readable sink name for logging (e.g. "file:.logs")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace reqlog
