#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace reqlog {

// ============================================================================
// Configuration Types
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;            // Server certificate (PEM)
    std::string key_file;             // Server private key (PEM)
    std::string ca_file;              // CA cert for client verification (mTLS)
    bool require_client_cert = false; // mTLS mode
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    size_t thread_pool_size = 4;
    std::string admin_token;                   // Bearer token for /admin (empty = no auth)
    std::vector<std::string> trusted_proxies;  // Peers whose X-Forwarded-For is honored
    TlsConfig tls;
};

struct LoggingConfig {
    std::string level = "info";
};

struct StoreConfig {
    bool enabled = false;
    std::string backend = "postgresql";
    std::string connection_string;
    std::string table = "request_logs";
};

struct RetentionConfig {
    bool scheduled = false;
    int interval_hours = 24;
    int daily_days = 7;
    int archive_days = 30;
    bool compress_archives = false;
    int normal_days = 7;
    int error_days = 30;
    int critical_days = 90;
};

struct AuditConfig {
    size_t queue_capacity = 1000;
    size_t batch_size = 10;
    std::chrono::milliseconds flush_interval{5000};
    std::string logs_dir = ".logs";
    int retention_days = 30;                       // Default for on-demand cleanup
    std::chrono::milliseconds drain_interval{100};
    size_t max_raw_body_bytes = 16384;
    StoreConfig store;
    RetentionConfig retention;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
    AuditConfig audit;
};

} // namespace reqlog
