#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <string_view>

namespace reqlog {

/**
 * @brief Scrubs sensitive fields from structured request/response data
 *
 * A key is sensitive when its lowercased form contains any of:
 * password, token, secret, key, authorization, cookie, set-cookie.
 * The value under a sensitive key is replaced with "***HIDDEN***"
 * whatever its type. Other object values are recursed into, arrays are
 * walked element by element, scalars are left untouched.
 *
 * Input must be acyclic (nlohmann::json values always are).
 */
class Redactor {
public:
    static constexpr std::string_view kHiddenMarker = "***HIDDEN***";

    static constexpr std::array<std::string_view, 7> kSensitiveFields = {
        "password", "token", "secret", "key", "authorization", "cookie", "set-cookie"
    };

    /// Deep copy of `value` with every sensitive key redacted
    [[nodiscard]] static nlohmann::json redact(const nlohmann::json& value);

    [[nodiscard]] static bool is_sensitive_key(std::string_view key);

private:
    static void redact_in_place(nlohmann::json& value);
};

} // namespace reqlog
