#pragma once

#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace reqlog {

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntryError {
    int code = 0;
    std::string message;
};

/**
 * @brief One audit record of a single request/response cycle
 *
 * Built once at response completion, then shared read-only
 * (LogEntryPtr) by the queue and both sinks.
 */
struct LogEntry {
    std::string id;                                 // 16 hex chars
    std::chrono::system_clock::time_point timestamp;

    // Request context
    std::string ip = kUnknown;
    std::string user_agent = kUnknown;
    std::optional<std::string> user;
    std::string method;
    std::string hostname;
    std::string url;
    std::optional<std::string> route;

    // Outcome
    int status_code = 0;
    ActionKind action = ActionKind::UNKNOWN;
    std::string entity = kUnknown;
    std::optional<int64_t> execution_time_ms;
    uint64_t request_size = 0;
    uint64_t response_size = 0;

    // Sanitized payloads: details = {params, query, headers, body}
    nlohmann::json details = {
        {"params", nlohmann::json::object()},
        {"query", nlohmann::json::object()},
        {"headers", nlohmann::json::object()},
        {"body", nlohmann::json::object()},
    };
    nlohmann::json response_body = nlohmann::json::object();

    std::optional<LogEntryError> error;
    std::optional<std::string> session_id;
    std::string correlation_id;
};

using LogEntryPtr = std::shared_ptr<const LogEntry>;

/// Structured form written to both sinks
[[nodiscard]] nlohmann::json to_json(const LogEntry& entry);

/// Compact single-line JSON (no trailing newline)
[[nodiscard]] std::string serialize(const LogEntry& entry);

} // namespace reqlog
