#include "server/http_server.hpp"
#include "server/http_constants.hpp"
#include "server/capture_middleware.hpp"
#include "audit/log_retention.hpp"
#include "audit/stats_reporter.hpp"
#include "core/utils.hpp"

// cpp-httplib is header-only; silence its deprecation warnings
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <openssl/crypto.h>

#include <format>
#include <stdexcept>
#include <string_view>

namespace reqlog {

namespace {

/// Constant-time comparison for secrets (prevents timing side-channel attacks).
bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= b[i];
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

nlohmann::json error_body(std::string_view message) {
    return {{"success", false}, {"error", message}};
}

} // anonymous namespace

// ============================================================================
// Constructor
// ============================================================================

HttpServer::HttpServer(ServerConfig config,
                       CaptureMiddleware& capture,
                       const StatsReporter& stats,
                       LogRetention& retention,
                       int default_cleanup_days)
    : config_(std::move(config)),
      capture_(capture),
      stats_(stats),
      retention_(retention),
      default_cleanup_days_(default_cleanup_days) {}

HttpServer::~HttpServer() = default;

// ============================================================================
// start(): create server, register routes, listen
// ============================================================================

void HttpServer::start() {
    std::unique_ptr<httplib::Server> svr_ptr;
    const auto& tls = config_.tls;
    if (tls.enabled && !tls.cert_file.empty() && !tls.key_file.empty()) {
        const char* ca_cert_path = (tls.require_client_cert && !tls.ca_file.empty())
            ? tls.ca_file.c_str() : nullptr;
        auto ssl_svr = std::make_unique<httplib::SSLServer>(
            tls.cert_file.c_str(), tls.key_file.c_str(), ca_cert_path);
        if (!ssl_svr->is_valid()) {
            throw std::runtime_error(std::format("Invalid TLS configuration (cert={}, key={})",
                                                 tls.cert_file, tls.key_file));
        }
        utils::log::info(std::format("TLS enabled: cert={}, key={}, mTLS={}",
            tls.cert_file, tls.key_file, tls.require_client_cert ? "required" : "off"));
        svr_ptr = std::move(ssl_svr);
    } else {
        svr_ptr = std::make_unique<httplib::Server>();
    }
    auto& svr = *svr_ptr;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    capture_.install(svr);
    register_core_routes(svr);
    register_admin_routes(svr);

    {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (stop_requested_) {
            return;
        }
        server_ = std::move(svr_ptr);
    }

    utils::log::info(std::format("Listening on {}:{} ({}, {} threads)",
        config_.host, config_.port, tls.enabled ? "HTTPS" : "HTTP", pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        std::lock_guard<std::mutex> lock(server_mutex_);
        if (!stop_requested_) {
            throw std::runtime_error(std::format("Failed to listen on {}:{}",
                                                 config_.host, config_.port));
        }
    }
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(server_mutex_);
    stop_requested_ = true;
    if (server_) {
        server_->stop();
    }
    utils::log::info("HTTP server stopped");
}

// ============================================================================
// Route registration groups
// ============================================================================

void HttpServer::register_core_routes(httplib::Server& svr) {
    svr.Get(http::kHealthRoute, capture_.route(http::kHealthRoute,
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        }));
}

void HttpServer::register_admin_routes(httplib::Server& svr) {
    svr.Get(http::kStatsRoute, capture_.route(http::kStatsRoute,
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_stats(req, res);
        }));
    svr.Post(http::kCleanupRoute, capture_.route(http::kCleanupRoute,
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_cleanup(req, res);
        }));
    svr.Post(http::kRetentionRoute, capture_.route(http::kRetentionRoute,
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_retention(req, res);
        }));
}

bool HttpServer::require_admin(const httplib::Request& req, httplib::Response& res) {
    if (config_.admin_token.empty()) return true;
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()),
                              config_.admin_token)) {
        res.status = httplib::StatusCode::Unauthorized_401;
        capture_.json(req, res, error_body("Unauthorized"));
        return false;
    }
    return true;
}

// ============================================================================
// Handlers
// ============================================================================

void HttpServer::handle_health(const httplib::Request& req, httplib::Response& res) {
    capture_.json(req, res, {{"status", "healthy"}, {"service", "reqlog"}});
}

void HttpServer::handle_stats(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const auto stats = stats_.get_stats();
    if (!stats) {
        res.status = httplib::StatusCode::InternalServerError_500;
        capture_.json(req, res, error_body("Failed to get stats"));
        return;
    }
    capture_.json(req, res, {{"success", true}, {"data", stats->to_json()}});
}

void HttpServer::handle_cleanup(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    int days = default_cleanup_days_;
    if (!req.body.empty()) {
        const auto body = nlohmann::json::parse(req.body, nullptr, /*allow_exceptions=*/false);
        if (body.is_discarded() || !body.is_object()) {
            res.status = httplib::StatusCode::BadRequest_400;
            capture_.json(req, res, error_body("Request body must be a JSON object"));
            return;
        }
        if (body.contains("days")) {
            const auto& d = body["days"];
            if (!d.is_number_integer() || d.get<int64_t>() < 1 ||
                d.get<int64_t>() > LogRetention::kMaxRetentionDays) {
                res.status = httplib::StatusCode::BadRequest_400;
                capture_.json(req, res, error_body(std::format(
                    "days must be an integer between 1 and {}", LogRetention::kMaxRetentionDays)));
                return;
            }
            days = static_cast<int>(d.get<int64_t>());
        }
    }

    const size_t deleted = retention_.cleanup(days);
    capture_.json(req, res, {
        {"success", true},
        {"data", {{"deleted_files", deleted}, {"days", days}}},
    });
}

void HttpServer::handle_retention(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(req, res)) return;

    const auto summary = retention_.apply_policy();
    capture_.json(req, res, {{"success", true}, {"data", summary.to_json()}});
}

} // namespace reqlog
