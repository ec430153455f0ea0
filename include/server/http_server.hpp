#pragma once

#include "config/config_types.hpp"

#include <memory>
#include <mutex>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace reqlog {

class CaptureMiddleware;
class StatsReporter;
class LogRetention;

/**
 * @brief HTTP host for the logging pipeline
 *
 * Every request passes through the capture middleware. Routes:
 * - GET  /health               liveness probe
 * - GET  /admin/logs/stats     pipeline snapshot
 * - POST /admin/logs/cleanup   {"days": N}, N >= 1 (default: retention_days)
 * - POST /admin/logs/retention tiered retention run
 *
 * Admin routes require `Authorization: Bearer <admin_token>` when a
 * token is configured.
 */
class HttpServer {
public:
    HttpServer(ServerConfig config,
               CaptureMiddleware& capture,
               const StatsReporter& stats,
               LogRetention& retention,
               int default_cleanup_days);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve; blocks until stop(). Throws if the socket cannot be bound.
    void start();

    /// Stop accepting connections; in-flight requests complete first
    void stop();

private:
    // ── Route registration (called from start()) ────────────────────────
    void register_core_routes(httplib::Server& svr);
    void register_admin_routes(httplib::Server& svr);

    // ── Handler methods (one per endpoint) ──────────────────────────────
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_stats(const httplib::Request& req, httplib::Response& res);
    void handle_cleanup(const httplib::Request& req, httplib::Response& res);
    void handle_retention(const httplib::Request& req, httplib::Response& res);

    /// Writes 401 and returns false unless the bearer token matches
    bool require_admin(const httplib::Request& req, httplib::Response& res);

    // ── Members ─────────────────────────────────────────────────────────
    const ServerConfig config_;
    CaptureMiddleware& capture_;
    const StatsReporter& stats_;
    LogRetention& retention_;
    const int default_cleanup_days_;

    std::mutex server_mutex_;
    std::unique_ptr<httplib::Server> server_;
    bool stop_requested_ = false;
};

} // namespace reqlog
