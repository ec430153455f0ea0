#include "server/capture_middleware.hpp"
#include "server/http_constants.hpp"
#include "audit/audit_pipeline.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; silence its deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <format>

namespace reqlog {

namespace {

constexpr std::string_view kIpv6MappedPrefix = "::ffff:";

std::string strip_ipv6_mapped(const std::string& addr) {
    if (addr.starts_with(kIpv6MappedPrefix)) {
        return addr.substr(kIpv6MappedPrefix.size());
    }
    return addr;
}

HeaderList to_header_list(const httplib::Headers& headers) {
    HeaderList out;
    out.reserve(headers.size());
    for (const auto& [name, value] : headers) {
        out.emplace_back(name, value);
    }
    return out;
}

/// Query parameters; a repeated key becomes an array of its values
nlohmann::json query_to_json(const httplib::Params& params) {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [name, value] : params) {
        if (!out.contains(name)) {
            out[name] = value;
        } else if (out[name].is_array()) {
            out[name].push_back(value);
        } else {
            out[name] = nlohmann::json::array({out[name], value});
        }
    }
    return out;
}

} // anonymous namespace

CaptureMiddleware::CaptureMiddleware(AuditPipeline& pipeline, RecordBuilder builder)
    : pipeline_(pipeline), builder_(std::move(builder)) {}

// ============================================================================
// Installation
// ============================================================================

void CaptureMiddleware::install(httplib::Server& svr) {
    svr.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        begin(req, res);
        return httplib::Server::HandlerResponse::Unhandled;
    });
    svr.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        complete(req, res);
    });
}

CaptureMiddleware::Handler CaptureMiddleware::route(std::string pattern, Handler handler) {
    return [this, pattern = std::move(pattern), handler = std::move(handler)](
               const httplib::Request& req, httplib::Response& res) {
        if (const auto capture = find(req)) {
            capture->set_route(pattern);
        }
        handler(req, res);
    };
}

// ============================================================================
// In-flight registry
// ============================================================================

std::shared_ptr<RequestCapture> CaptureMiddleware::find(const httplib::Request& req) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(&req);
    return it == in_flight_.end() ? nullptr : it->second;
}

std::shared_ptr<RequestCapture> CaptureMiddleware::take(const httplib::Request& req) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = in_flight_.find(&req);
    if (it == in_flight_.end()) {
        return nullptr;
    }
    auto capture = std::move(it->second);
    in_flight_.erase(it);
    return capture;
}

size_t CaptureMiddleware::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

std::optional<std::string> CaptureMiddleware::request_id(const httplib::Request& req) const {
    if (const auto capture = find(req)) {
        return capture->id();
    }
    return std::nullopt;
}

// ============================================================================
// Hooks
// ============================================================================

void CaptureMiddleware::begin(const httplib::Request& req, httplib::Response& res) {
    try {
        auto capture = std::make_shared<RequestCapture>();
        res.set_header(kRequestIdHeader, capture->id());

        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_[&req] = std::move(capture);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Capture: request start not recorded: {}", e.what()));
    }
}

void CaptureMiddleware::complete(const httplib::Request& req, const httplib::Response& res) {
    try {
        const auto capture = take(req);
        const LogEntry entry = builder_.build(to_request_meta(req, capture),
                                              to_response_meta(res, capture));
        pipeline_.enqueue(entry);
    } catch (const std::exception& e) {
        utils::log::error(std::format("Capture: {} {} not logged: {}",
                                      req.method, req.path, e.what()));
    }
}

// ============================================================================
// Response emission
// ============================================================================

void CaptureMiddleware::send(const httplib::Request& req, httplib::Response& res,
                             std::string body, const std::string& content_type) {
    if (const auto capture = find(req)) {
        (void)capture->capture_raw(body);
    }
    res.set_content(std::move(body), content_type);
}

void CaptureMiddleware::json(const httplib::Request& req, httplib::Response& res,
                             const nlohmann::json& payload) {
    if (const auto capture = find(req)) {
        (void)capture->capture_json(payload);
    }
    res.set_content(payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    http::kJsonContentType);
}

// ============================================================================
// Metadata extraction
// ============================================================================

RequestMeta CaptureMiddleware::to_request_meta(
    const httplib::Request& req, const std::shared_ptr<RequestCapture>& capture) const {
    RequestMeta meta;
    if (capture) {
        meta.id = capture->id();
        meta.start_time = capture->start_time();
        meta.route = capture->route();
    }

    meta.method = req.method;
    meta.host = req.get_header_value("Host");
    meta.url = req.target.empty() ? req.path : req.target;
    meta.path = req.path;
    meta.remote_addr = strip_ipv6_mapped(req.remote_addr);
    meta.headers = to_header_list(req.headers);
    meta.query = query_to_json(req.params);
    for (const auto& [name, value] : req.path_params) {
        meta.params[name] = value;
    }
    meta.body = req.body;

    if (identity_resolver_) {
        const Identity identity = identity_resolver_(req);
        meta.user = identity.user;
        meta.session_id = identity.session_id;
    }
    return meta;
}

ResponseMeta CaptureMiddleware::to_response_meta(
    const httplib::Response& res, const std::shared_ptr<RequestCapture>& capture) {
    ResponseMeta meta;
    meta.status_code = res.status;
    meta.status_message = res.reason.empty() ? httplib::status_message(res.status) : res.reason;
    meta.headers = to_header_list(res.headers);

    if (!res.has_header("Content-Length")) {
        meta.headers.emplace_back("Content-Length", std::to_string(res.body.size()));
    }

    if (capture && capture->has_capture()) {
        meta.body = capture->captured();
    } else if (!res.body.empty()) {
        meta.body = RequestCapture::structure_raw(res.body);
    }
    return meta;
}

} // namespace reqlog
