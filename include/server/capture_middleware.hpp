#pragma once

#include "audit/record_builder.hpp"
#include "server/request_capture.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace reqlog {

class AuditPipeline;

/**
 * @brief Request/response capture for cpp-httplib servers
 *
 * install() registers two server hooks:
 * - pre-routing: assigns the entry id and start time, echoes the id as
 *   X-Request-Id
 * - logger (runs after the response was written): builds the LogEntry
 *   and hands it to the pipeline with a non-blocking enqueue
 *
 * Handlers emit responses through send() or json() so the outgoing
 * payload is captured once; a body written directly to the Response is
 * captured at completion instead. Nothing here can fail the request.
 */
class CaptureMiddleware {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    struct Identity {
        std::optional<std::string> user;
        std::optional<std::string> session_id;
    };
    using IdentityResolver = std::function<Identity(const httplib::Request&)>;

    static constexpr const char* kRequestIdHeader = "X-Request-Id";

    CaptureMiddleware(AuditPipeline& pipeline, RecordBuilder builder);

    /// Register the pre-routing and logger hooks on `svr`
    void install(httplib::Server& svr);

    /// Wrap a route handler so the entry records the route template
    [[nodiscard]] Handler route(std::string pattern, Handler handler);

    void set_identity_resolver(IdentityResolver resolver) {
        identity_resolver_ = std::move(resolver);
    }

    // ── Response emission ───────────────────────────────────────────────
    void send(const httplib::Request& req, httplib::Response& res,
              std::string body, const std::string& content_type);
    void json(const httplib::Request& req, httplib::Response& res,
              const nlohmann::json& payload);

    /// Entry id assigned to an in-flight request
    [[nodiscard]] std::optional<std::string> request_id(const httplib::Request& req) const;

    // ── Hooks (installed by install(); callable directly) ───────────────
    void begin(const httplib::Request& req, httplib::Response& res);
    void complete(const httplib::Request& req, const httplib::Response& res);

    [[nodiscard]] size_t in_flight() const;

private:
    std::shared_ptr<RequestCapture> find(const httplib::Request& req) const;
    std::shared_ptr<RequestCapture> take(const httplib::Request& req);

    RequestMeta to_request_meta(const httplib::Request& req,
                                const std::shared_ptr<RequestCapture>& capture) const;
    static ResponseMeta to_response_meta(const httplib::Response& res,
                                         const std::shared_ptr<RequestCapture>& capture);

    AuditPipeline& pipeline_;
    RecordBuilder builder_;
    IdentityResolver identity_resolver_;

    // httplib keeps the Request alive from pre-routing until the logger runs
    mutable std::mutex mutex_;
    std::unordered_map<const httplib::Request*, std::shared_ptr<RequestCapture>> in_flight_;
};

} // namespace reqlog
