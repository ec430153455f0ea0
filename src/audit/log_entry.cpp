#include "audit/log_entry.hpp"
#include "core/utils.hpp"

namespace reqlog {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

} // anonymous namespace

nlohmann::json to_json(const LogEntry& entry) {
    nlohmann::json j;
    j["id"] = entry.id;
    j["timestamp"] = utils::format_timestamp(entry.timestamp);
    j["ip"] = entry.ip;
    j["user_agent"] = entry.user_agent;
    j["user"] = optional_to_json(entry.user);
    j["method"] = entry.method;
    j["hostname"] = entry.hostname;
    j["url"] = entry.url;
    j["route"] = optional_to_json(entry.route);
    j["status_code"] = entry.status_code;
    j["action"] = action_to_string(entry.action);
    j["entity"] = entry.entity;
    j["execution_time"] = optional_to_json(entry.execution_time_ms);
    j["request_size"] = entry.request_size;
    j["response_size"] = entry.response_size;
    j["details"] = entry.details;
    j["response_body"] = entry.response_body;
    if (entry.error) {
        j["error"] = {{"code", entry.error->code}, {"message", entry.error->message}};
    } else {
        j["error"] = nullptr;
    }
    j["session_id"] = optional_to_json(entry.session_id);
    j["correlation_id"] = entry.correlation_id;
    return j;
}

std::string serialize(const LogEntry& entry) {
    // Captured bodies may contain invalid UTF-8
    return to_json(entry).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace reqlog
