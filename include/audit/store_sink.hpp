#pragma once

#include "audit/audit_sink.hpp"
#include "audit/record_store.hpp"

#include <memory>

namespace reqlog {

/**
 * @brief Sink inserting one record per entry into an IRecordStore
 *
 * Disabled by configuration or when no store is attached: write() returns
 * false without touching anything, count() reports 0 and delete_many()
 * deletes nothing.
 */
class StoreSink : public ILogSink {
public:
    StoreSink(bool enabled, std::shared_ptr<IRecordStore> store);

    [[nodiscard]] bool write(const LogEntry& entry) override;
    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool is_enabled() const { return enabled_; }

    [[nodiscard]] Result<uint64_t> count(const RecordFilter& filter = {}) const;
    [[nodiscard]] Result<uint64_t> delete_many(const RecordFilter& filter) const;

private:
    const bool enabled_;
    std::shared_ptr<IRecordStore> store_;
};

} // namespace reqlog
