#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace reqlog {

/**
 * @brief Per-request capture state shared by the middleware hooks
 *
 * Created when the request starts (id + start time). The first response
 * emission through capture_raw() or capture_json() is retained; later
 * emissions leave the stored payload unchanged.
 */
class RequestCapture {
public:
    RequestCapture();
    RequestCapture(std::string id, std::chrono::steady_clock::time_point start_time);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] std::chrono::steady_clock::time_point start_time() const { return start_time_; }

    /// Raw body: stored structured if it parses as JSON, else as {"raw": body}
    bool capture_raw(std::string_view body);
    bool capture_json(const nlohmann::json& payload);

    [[nodiscard]] bool has_capture() const;
    [[nodiscard]] std::optional<nlohmann::json> captured() const;

    void set_route(std::string route);
    [[nodiscard]] std::optional<std::string> route() const;

    /// Structured form of a raw body (JSON if parseable, {"raw": ...} otherwise)
    [[nodiscard]] static nlohmann::json structure_raw(std::string_view body);

private:
    const std::string id_;
    const std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::optional<nlohmann::json> captured_;
    std::optional<std::string> route_;
};

} // namespace reqlog
