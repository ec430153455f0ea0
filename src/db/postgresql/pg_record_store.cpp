#include "db/postgresql/pg_record_store.hpp"
#include "core/utils.hpp"

#include <cstring>
#include <format>

namespace reqlog {

PgRecordStore::PgRecordStore(Config config)
    : config_(std::move(config)) {}

PgRecordStore::~PgRecordStore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// Connection
// ============================================================================

bool PgRecordStore::ensure_connected() {
    if (conn_ && PQstatus(conn_) == CONNECTION_OK) {
        return true;
    }

    if (conn_) {
        PQreset(conn_);
        if (PQstatus(conn_) == CONNECTION_OK) {
            utils::log::info("Record store: PostgreSQL connection re-established");
            return true;
        }
        PQfinish(conn_);
        conn_ = nullptr;
    }

    conn_ = PQconnectdb(config_.connection_string.c_str());
    if (PQstatus(conn_) != CONNECTION_OK) {
        utils::log::error(std::format("Record store: PostgreSQL connection failed: {}",
                                      PQerrorMessage(conn_)));
        PQfinish(conn_);
        conn_ = nullptr;
        return false;
    }
    return true;
}

Result<bool> PgRecordStore::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected()) {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
                                   "Cannot connect to PostgreSQL record store");
    }

    const std::string ddl = std::format(
        "CREATE TABLE IF NOT EXISTS {0} ("
        "id TEXT PRIMARY KEY, "
        "created_at TIMESTAMPTZ NOT NULL, "
        "status_code INTEGER NOT NULL, "
        "record JSONB NOT NULL); "
        "CREATE INDEX IF NOT EXISTS {0}_created_at_idx ON {0} (created_at)",
        config_.table);

    PGresult* res = PQexec(conn_, ddl.c_str());
    const bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
    std::string error = ok ? "" : PQerrorMessage(conn_);
    PQclear(res);

    if (!ok) {
        return Result<bool>::error(ErrorCategory::STORE_ERROR,
                                   std::format("Record store schema setup failed: {}", error));
    }
    utils::log::info(std::format("Record store: using PostgreSQL table '{}'", config_.table));
    return Result<bool>::ok(true);
}

PGresult* PgRecordStore::exec_params(const std::string& sql,
                                     const std::vector<std::string>& params) {
    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }
    return PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()),
                        nullptr, values.data(), nullptr, nullptr, 0);
}

// ============================================================================
// Filters
// ============================================================================

PgRecordStore::WhereClause PgRecordStore::build_where(const RecordFilter& filter) {
    WhereClause where;
    auto add = [&where](std::string_view condition, std::string value) {
        where.sql += where.params.empty() ? " WHERE " : " AND ";
        where.params.push_back(std::move(value));
        where.sql += std::format("{} ${}", condition, where.params.size());
    };

    if (filter.older_than) {
        add("created_at <", utils::format_timestamp(*filter.older_than));
    }
    if (filter.min_status) {
        add("status_code >=", std::to_string(*filter.min_status));
    }
    if (filter.max_status) {
        add("status_code <=", std::to_string(*filter.max_status));
    }
    return where;
}

// ============================================================================
// IRecordStore
// ============================================================================

bool PgRecordStore::insert(const nlohmann::json& record) {
    const std::string sql = std::format(
        "INSERT INTO {} (id, created_at, status_code, record) "
        "VALUES ($1, $2::timestamptz, $3::integer, $4::jsonb)",
        config_.table);

    const std::vector<std::string> params = {
        record.value("id", std::string{}),
        record.value("timestamp", std::string{}),
        std::to_string(record.value("status_code", 0)),
        record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
    };

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected()) {
        return false;
    }

    PGresult* res = exec_params(sql, params);
    const bool ok = res && PQresultStatus(res) == PGRES_COMMAND_OK;
    if (!ok) {
        utils::log::error(std::format("Record store: insert failed: {}", PQerrorMessage(conn_)));
    }
    PQclear(res);
    return ok;
}

Result<uint64_t> PgRecordStore::count(const RecordFilter& filter) {
    const auto where = build_where(filter);
    const std::string sql = std::format("SELECT COUNT(*) FROM {}{}", config_.table, where.sql);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected()) {
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, "Record store unavailable");
    }

    PGresult* res = exec_params(sql, where.params);
    if (!res || PQresultStatus(res) != PGRES_TUPLES_OK || PQntuples(res) != 1) {
        std::string error = PQerrorMessage(conn_);
        PQclear(res);
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR,
                                       std::format("Record store count failed: {}", error));
    }

    const uint64_t n = utils::parse_int<uint64_t>(PQgetvalue(res, 0, 0), 0);
    PQclear(res);
    return Result<uint64_t>::ok(n);
}

Result<uint64_t> PgRecordStore::delete_many(const RecordFilter& filter) {
    const auto where = build_where(filter);
    const std::string sql = std::format("DELETE FROM {}{}", config_.table, where.sql);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ensure_connected()) {
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, "Record store unavailable");
    }

    PGresult* res = exec_params(sql, where.params);
    if (!res || PQresultStatus(res) != PGRES_COMMAND_OK) {
        std::string error = PQerrorMessage(conn_);
        PQclear(res);
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR,
                                       std::format("Record store delete failed: {}", error));
    }

    const char* affected = PQcmdTuples(res);
    const uint64_t n = (affected && std::strlen(affected) > 0)
        ? utils::parse_int<uint64_t>(affected, 0) : 0;
    PQclear(res);
    return Result<uint64_t>::ok(n);
}

std::string PgRecordStore::name() const {
    return "postgresql:" + config_.table;
}

} // namespace reqlog
