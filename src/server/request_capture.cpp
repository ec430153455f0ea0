#include "server/request_capture.hpp"
#include "core/utils.hpp"

namespace reqlog {

RequestCapture::RequestCapture()
    : RequestCapture(utils::generate_hex_id(), std::chrono::steady_clock::now()) {}

RequestCapture::RequestCapture(std::string id, std::chrono::steady_clock::time_point start_time)
    : id_(std::move(id)), start_time_(start_time) {}

nlohmann::json RequestCapture::structure_raw(std::string_view body) {
    if (body.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded()) {
        return parsed;
    }
    return {{"raw", std::string(body)}};
}

bool RequestCapture::capture_raw(std::string_view body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (captured_) {
        return false;
    }
    captured_ = structure_raw(body);
    return true;
}

bool RequestCapture::capture_json(const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (captured_) {
        return false;
    }
    captured_ = payload;
    return true;
}

bool RequestCapture::has_capture() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captured_.has_value();
}

std::optional<nlohmann::json> RequestCapture::captured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captured_;
}

void RequestCapture::set_route(std::string route) {
    std::lock_guard<std::mutex> lock(mutex_);
    route_ = std::move(route);
}

std::optional<std::string> RequestCapture::route() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return route_;
}

} // namespace reqlog
