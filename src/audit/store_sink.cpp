#include "audit/store_sink.hpp"
#include "core/utils.hpp"

#include <format>

namespace reqlog {

StoreSink::StoreSink(bool enabled, std::shared_ptr<IRecordStore> store)
    : enabled_(enabled && store != nullptr),
      store_(std::move(store)) {
    if (enabled && !store_) {
        utils::log::warn("Store sink: enabled without a record store, persistence disabled");
    }
}

bool StoreSink::write(const LogEntry& entry) {
    if (!enabled_) {
        return false;
    }

    try {
        if (!store_->insert(to_json(entry))) {
            utils::log::error(std::format("Store sink: insert rejected for entry {} ({})",
                                          entry.id, store_->name()));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        utils::log::error(std::format("Store sink: insert failed for entry {}: {}",
                                      entry.id, e.what()));
        return false;
    }
}

std::string StoreSink::name() const {
    return enabled_ ? "store:" + store_->name() : "store:disabled";
}

Result<uint64_t> StoreSink::count(const RecordFilter& filter) const {
    if (!enabled_) {
        return Result<uint64_t>::ok(0);
    }
    try {
        return store_->count(filter);
    } catch (const std::exception& e) {
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

Result<uint64_t> StoreSink::delete_many(const RecordFilter& filter) const {
    if (!enabled_) {
        return Result<uint64_t>::error(ErrorCategory::STORE_DISABLED,
                                       "Record store persistence is disabled");
    }
    try {
        return store_->delete_many(filter);
    } catch (const std::exception& e) {
        return Result<uint64_t>::error(ErrorCategory::STORE_ERROR, e.what());
    }
}

} // namespace reqlog
