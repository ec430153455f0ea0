#include "config/config_loader.hpp"
#include "audit/log_retention.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace reqlog {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            if (const char* env_val = std::getenv(var_name.c_str())) {
                result += env_val;
            }
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_node(val);
    }
}

void expand_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        *s = expand_env_vars(s->get());
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two tables. Overlay wins for scalars and arrays.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_tbl = base[key].as_table();
        if (base_tbl && val.is_table()) {
            merge_tables(*base_tbl, *val.as_table());
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Replace `include = ...` with the referenced files, main file on top
 */
void resolve_includes(toml::table& root, const std::filesystem::path& base_dir,
                      std::unordered_set<std::string>& visited, int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }

    std::vector<std::string> paths;
    if (const auto* single = root["include"].as_string()) {
        paths.emplace_back(single->get());
    } else if (const auto* many = root["include"].as_array()) {
        for (const auto& item : *many) {
            if (const auto* s = item.as_string()) {
                paths.emplace_back(s->get());
            }
        }
    }
    if (paths.empty()) return;
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const fs::path abs_path = fs::canonical(base_dir / rel_path);

        if (!visited.insert(abs_path.string()).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path.string()));
        }

        toml::table included = toml::parse_file(abs_path.string());
        resolve_includes(included, abs_path.parent_path(), visited, depth + 1);

        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    toml::table result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    namespace fs = std::filesystem;
    toml::table result = toml::parse_file(file_path);

    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, fs::path(file_path).parent_path(), visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or("0.0.0.0"s);
    // Out-of-range values are clamped to 0 and rejected by validation
    const int64_t port = s["port"].value_or(int64_t{8080});
    cfg.port = utils::in_range<1, 65535>(port) ? static_cast<uint16_t>(port) : 0;
    cfg.thread_pool_size = static_cast<size_t>(s["threads"].value_or(4));
    cfg.admin_token = s["admin_token"].value_or(""s);
    cfg.trusted_proxies = toml_string_array(s, "trusted_proxies");

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.enabled = (*tls)["enabled"].value_or(false);
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
        cfg.tls.ca_file = (*tls)["ca_file"].value_or(""s);
        cfg.tls.require_client_cert = (*tls)["require_client_cert"].value_or(false);
    }
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    if (const auto* logging = root["logging"].as_table()) {
        cfg.level = (*logging)["level"].value_or("info"s);
    }
    return cfg;
}

StoreConfig extract_store(const toml::table& audit) {
    StoreConfig cfg;
    const auto* store = audit["store"].as_table();
    if (!store) return cfg;
    const auto& st = *store;

    cfg.enabled = st["enabled"].value_or(false);
    cfg.backend = st["backend"].value_or("postgresql"s);
    cfg.connection_string = st["connection_string"].value_or(""s);
    cfg.table = st["table"].value_or("request_logs"s);
    return cfg;
}

RetentionConfig extract_retention(const toml::table& audit) {
    RetentionConfig cfg;
    const auto* retention = audit["retention"].as_table();
    if (!retention) return cfg;
    const auto& r = *retention;

    cfg.scheduled = r["scheduled"].value_or(false);
    cfg.interval_hours = r["interval_hours"].value_or(24);
    cfg.daily_days = r["daily_days"].value_or(7);
    cfg.archive_days = r["archive_days"].value_or(30);
    cfg.compress_archives = r["compress_archives"].value_or(false);
    cfg.normal_days = r["normal_days"].value_or(7);
    cfg.error_days = r["error_days"].value_or(30);
    cfg.critical_days = r["critical_days"].value_or(90);
    return cfg;
}

/// Negative sizes read as 0 so validation reports them
size_t size_or_zero(int64_t value) {
    return value < 0 ? 0 : static_cast<size_t>(value);
}

AuditConfig extract_audit(const toml::table& root) {
    AuditConfig cfg;
    const auto* audit = root["audit"].as_table();
    if (!audit) return cfg;
    const auto& a = *audit;

    cfg.queue_capacity = size_or_zero(a["queue_capacity"].value_or(int64_t{1000}));
    cfg.batch_size = size_or_zero(a["batch_size"].value_or(int64_t{10}));
    cfg.flush_interval = std::chrono::milliseconds(
        size_or_zero(a["flush_interval_ms"].value_or(int64_t{5000})));
    cfg.logs_dir = a["logs_dir"].value_or(".logs"s);
    cfg.retention_days = a["retention_days"].value_or(30);
    cfg.drain_interval = std::chrono::milliseconds(
        size_or_zero(a["drain_interval_ms"].value_or(int64_t{100})));
    cfg.max_raw_body_bytes = size_or_zero(a["max_raw_body_bytes"].value_or(int64_t{16384}));

    cfg.store = extract_store(a);
    cfg.retention = extract_retention(a);
    return cfg;
}

AppConfig extract_all_sections(const toml::table& root) {
    AppConfig config;
    config.server = extract_server(root);
    config.logging = extract_logging(root);
    config.audit = extract_audit(root);
    return config;
}

// The store table name is spliced into SQL text, so only plain identifiers pass
bool is_sql_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    });
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(AppConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const AppConfig& config) {
    std::vector<std::string> errors;

    if (!utils::in_range<1, 65535>(config.server.port)) {
        errors.push_back(std::format("server.port must be 1-65535, got {}", config.server.port));
    }
    if (config.server.thread_pool_size == 0) {
        errors.push_back("server.threads must be > 0");
    }

    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
        if (config.server.tls.require_client_cert && config.server.tls.ca_file.empty()) {
            errors.push_back("server.tls.ca_file required when require_client_cert is true");
        }
    }

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
                                     config.logging.level));
    }

    const auto& audit = config.audit;
    if (audit.queue_capacity == 0) {
        errors.push_back("audit.queue_capacity must be > 0");
    }
    if (audit.batch_size == 0) {
        errors.push_back("audit.batch_size must be > 0");
    } else if (audit.queue_capacity > 0 && audit.batch_size > audit.queue_capacity) {
        errors.push_back(std::format("audit.batch_size ({}) > audit.queue_capacity ({})",
                                     audit.batch_size, audit.queue_capacity));
    }
    if (audit.flush_interval.count() == 0) {
        errors.push_back("audit.flush_interval_ms must be > 0");
    }
    if (audit.drain_interval.count() == 0) {
        errors.push_back("audit.drain_interval_ms must be > 0");
    }
    if (audit.logs_dir.empty()) {
        errors.push_back("audit.logs_dir must not be empty");
    }
    if (!utils::in_range<1, LogRetention::kMaxRetentionDays>(audit.retention_days)) {
        errors.push_back(std::format("audit.retention_days must be 1-{}, got {}",
                                     LogRetention::kMaxRetentionDays, audit.retention_days));
    }

    if (audit.store.enabled) {
        if (audit.store.connection_string.empty()) {
            errors.push_back("audit.store.connection_string required when the store is enabled");
        }
        if (audit.store.backend != "postgresql") {
            errors.push_back(std::format("audit.store.backend '{}' is not supported",
                                         audit.store.backend));
        }
        if (!is_sql_identifier(audit.store.table)) {
            errors.push_back(std::format("audit.store.table '{}' must match [A-Za-z_][A-Za-z0-9_]*",
                                         audit.store.table));
        }
    }

    const auto& r = audit.retention;
    const std::pair<const char*, int> day_fields[] = {
        {"daily_days", r.daily_days},   {"archive_days", r.archive_days},
        {"normal_days", r.normal_days}, {"error_days", r.error_days},
        {"critical_days", r.critical_days},
    };
    for (const auto& [name, days] : day_fields) {
        if (!utils::in_range<1, LogRetention::kMaxRetentionDays>(days)) {
            errors.push_back(std::format("audit.retention.{} must be 1-{}, got {}",
                                         name, LogRetention::kMaxRetentionDays, days));
        }
    }
    if (r.archive_days < r.daily_days) {
        errors.push_back(std::format("audit.retention.archive_days ({}) < daily_days ({})",
                                     r.archive_days, r.daily_days));
    }
    if (r.scheduled && r.interval_hours < 1) {
        errors.push_back("audit.retention.interval_hours must be >= 1 when scheduled");
    }

    return errors;
}

} // namespace reqlog
