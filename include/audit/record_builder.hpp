#pragma once

#include "audit/log_entry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqlog {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Framework-neutral view of an inbound request
 *
 * Filled by the capture middleware from the HTTP framework's request
 * object. Every field is optional in practice: missing data degrades to
 * defaults in the built entry.
 */
struct RequestMeta {
    std::string id;                                               // Empty = generate
    std::optional<std::chrono::steady_clock::time_point> start_time;
    std::string method;
    std::string host;                                             // Host header (may carry a port)
    std::string url;                                              // Path + query string
    std::string path;
    std::optional<std::string> route;                             // Matched route template
    std::string remote_addr;
    HeaderList headers;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json query = nlohmann::json::object();
    std::string body;
    std::optional<std::string> user;
    std::optional<std::string> session_id;
};

struct ResponseMeta {
    int status_code = 200;
    std::string status_message;
    HeaderList headers;
    std::optional<nlohmann::json> body;                           // Captured payload
};

/**
 * @brief Assembles a LogEntry from request/response metadata
 *
 * Classifies the path (action, entity), redacts params/query/headers/body
 * and the captured response independently, and fills error only for
 * status >= 400. build() never throws: a field whose extraction fails
 * falls back to its default and a warning is logged.
 */
class RecordBuilder {
public:
    struct Config {
        std::vector<std::string> trusted_proxies;   // Peers allowed to set X-Forwarded-For
        size_t max_raw_body_bytes = 16384;          // Non-JSON bodies are truncated to this
    };

    static constexpr std::string_view kUnknownError = "Unknown error";
    static constexpr std::string_view kCorrelationHeader = "x-correlation-id";

    RecordBuilder();
    explicit RecordBuilder(Config config);

    [[nodiscard]] LogEntry build(const RequestMeta& request, const ResponseMeta& response) const;

    /// Case-insensitive header lookup, first match wins
    [[nodiscard]] static std::optional<std::string> find_header(
        const HeaderList& headers, std::string_view name);

    /// Lowercased header names; repeated headers are joined with ", "
    [[nodiscard]] static nlohmann::json headers_to_json(const HeaderList& headers);

    /// JSON bodies parsed, anything else wrapped as {"raw": ...}, empty -> {}
    [[nodiscard]] nlohmann::json parse_body(std::string_view body,
                                            std::string_view content_type) const;

    [[nodiscard]] static std::string strip_port(std::string_view host);

private:
    [[nodiscard]] std::string resolve_client_ip(const RequestMeta& request) const;

    Config config_;
};

} // namespace reqlog
