#include "audit/record_builder.hpp"
#include "audit/redactor.hpp"
#include "classifier/route_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <exception>
#include <format>

namespace reqlog {

namespace {

/**
 * @brief Evaluate one field, falling back to `fallback` if it throws
 */
template <typename T, typename Fn>
T guarded(std::string_view field, T fallback, Fn&& fn) {
    try {
        return fn();
    } catch (const std::exception& e) {
        utils::log::warn(std::format("Log record field '{}' degraded to default: {}",
                                     field, e.what()));
        return fallback;
    }
}

uint64_t parse_size_header(const HeaderList& headers) {
    const auto value = RecordBuilder::find_header(headers, "content-length");
    if (!value) return 0;
    return utils::parse_int<uint64_t>(utils::trim(*value), 0);
}

} // anonymous namespace

RecordBuilder::RecordBuilder() = default;

RecordBuilder::RecordBuilder(Config config)
    : config_(std::move(config)) {}

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::string> RecordBuilder::find_header(
    const HeaderList& headers, std::string_view name) {
    const auto it = std::find_if(headers.begin(), headers.end(),
        [name](const auto& h) { return utils::iequals(h.first, name); });
    if (it == headers.end()) return std::nullopt;
    return it->second;
}

nlohmann::json RecordBuilder::headers_to_json(const HeaderList& headers) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : headers) {
        const std::string key = utils::to_lower(name);
        if (out.contains(key) && out[key].is_string()) {
            out[key] = out[key].get<std::string>() + ", " + value;
        } else {
            out[key] = value;
        }
    }
    return out;
}

nlohmann::json RecordBuilder::parse_body(std::string_view body,
                                         std::string_view content_type) const {
    if (body.empty()) {
        return nlohmann::json::object();
    }

    if (utils::to_lower(content_type).find("json") != std::string::npos) {
        auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    if (body.size() > config_.max_raw_body_bytes) {
        return {{"raw", std::string(body.substr(0, config_.max_raw_body_bytes))},
                {"truncated", true}};
    }
    return {{"raw", std::string(body)}};
}

std::string RecordBuilder::strip_port(std::string_view host) {
    if (host.starts_with('[')) {
        const auto close = host.find(']');
        return std::string(close == std::string_view::npos ? host : host.substr(0, close + 1));
    }
    return std::string(host.substr(0, host.find(':')));
}

std::string RecordBuilder::resolve_client_ip(const RequestMeta& request) const {
    const bool trusted = std::find(config_.trusted_proxies.begin(),
                                   config_.trusted_proxies.end(),
                                   request.remote_addr) != config_.trusted_proxies.end();
    if (trusted) {
        if (const auto forwarded = find_header(request.headers, "x-forwarded-for")) {
            const std::string first_hop = utils::trim(forwarded->substr(0, forwarded->find(',')));
            if (!first_hop.empty()) {
                return first_hop;
            }
        }
    }
    return request.remote_addr.empty() ? std::string(kUnknown) : request.remote_addr;
}

// ============================================================================
// build()
// ============================================================================

LogEntry RecordBuilder::build(const RequestMeta& request, const ResponseMeta& response) const {
    LogEntry entry;
    entry.timestamp = utils::now();
    entry.status_code = response.status_code;
    entry.id = request.id.empty() ? utils::generate_hex_id() : request.id;
    entry.correlation_id = entry.id;

    if (response.status_code >= 400) {
        entry.error = LogEntryError{
            response.status_code,
            response.status_message.empty() ? std::string(kUnknownError)
                                            : response.status_message};
    }

    try {
        if (request.start_time) {
            entry.execution_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - *request.start_time).count();
        }

        entry.ip = guarded("ip", std::string(kUnknown),
            [&] { return resolve_client_ip(request); });
        entry.user_agent = find_header(request.headers, "user-agent").value_or(kUnknown);
        entry.user = request.user;
        entry.method = utils::to_upper(request.method);
        entry.hostname = guarded("hostname", std::string{},
            [&] { return strip_port(request.host); });
        entry.url = request.url.empty() ? request.path : request.url;
        entry.route = request.route;

        entry.action = guarded("action", ActionKind::UNKNOWN,
            [&] { return RouteClassifier::classify_action(request.path); });
        entry.entity = RouteClassifier::classify_entity(entry.url);

        entry.request_size = guarded("request_size", uint64_t{0},
            [&] { return parse_size_header(request.headers); });
        entry.response_size = guarded("response_size", uint64_t{0},
            [&] { return parse_size_header(response.headers); });

        const auto empty = nlohmann::json::object();
        entry.details["params"] = guarded("params", empty,
            [&] { return Redactor::redact(request.params); });
        entry.details["query"] = guarded("query", empty,
            [&] { return Redactor::redact(request.query); });
        entry.details["headers"] = guarded("headers", empty,
            [&] { return Redactor::redact(headers_to_json(request.headers)); });
        entry.details["body"] = guarded("body", empty, [&] {
            const auto content_type = find_header(request.headers, "content-type").value_or("");
            return Redactor::redact(parse_body(request.body, content_type));
        });

        if (response.body && !response.body->is_null()) {
            entry.response_body = guarded("response_body", empty,
                [&] { return Redactor::redact(*response.body); });
        }

        entry.session_id = request.session_id;
        entry.correlation_id = find_header(request.headers, kCorrelationHeader).value_or(entry.id);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Log record construction incomplete for {}: {}",
                                      entry.id, e.what()));
    }

    return entry;
}

} // namespace reqlog
