#pragma once

#include "audit/record_store.hpp"

#include <libpq-fe.h>

#include <mutex>
#include <string>
#include <vector>

namespace reqlog {

/**
 * @brief PostgreSQL record store (libpq)
 *
 * Entries are kept in a single table as JSONB, with the columns used by
 * filters (created_at, status_code) extracted on insert:
 *
 *   CREATE TABLE IF NOT EXISTS <table> (
 *       id          TEXT PRIMARY KEY,
 *       created_at  TIMESTAMPTZ NOT NULL,
 *       status_code INTEGER NOT NULL,
 *       record      JSONB NOT NULL)
 *
 * One PGconn guarded by a mutex; a broken connection is reset on the
 * next call.
 */
class PgRecordStore : public IRecordStore {
public:
    struct Config {
        std::string connection_string;
        std::string table = "request_logs";
    };

    explicit PgRecordStore(Config config);
    ~PgRecordStore() override;

    PgRecordStore(const PgRecordStore&) = delete;
    PgRecordStore& operator=(const PgRecordStore&) = delete;

    /// Connect and create the table if missing
    [[nodiscard]] Result<bool> open();

    [[nodiscard]] bool insert(const nlohmann::json& record) override;
    [[nodiscard]] Result<uint64_t> count(const RecordFilter& filter) override;
    [[nodiscard]] Result<uint64_t> delete_many(const RecordFilter& filter) override;
    [[nodiscard]] std::string name() const override;

private:
    struct WhereClause {
        std::string sql;
        std::vector<std::string> params;
    };

    static WhereClause build_where(const RecordFilter& filter);

    /// Caller holds mutex_
    bool ensure_connected();

    /// Caller holds mutex_; PQclear is the caller's job
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);

    Config config_;
    std::mutex mutex_;
    PGconn* conn_ = nullptr;
};

} // namespace reqlog
