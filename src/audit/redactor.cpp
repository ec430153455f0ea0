#include "audit/redactor.hpp"
#include "core/utils.hpp"

#include <algorithm>

namespace reqlog {

bool Redactor::is_sensitive_key(std::string_view key) {
    const std::string lower = utils::to_lower(key);
    return std::any_of(kSensitiveFields.begin(), kSensitiveFields.end(),
        [&lower](std::string_view field) {
            return lower.find(field) != std::string::npos;
        });
}

nlohmann::json Redactor::redact(const nlohmann::json& value) {
    if (!value.is_object() && !value.is_array()) {
        return value;
    }
    nlohmann::json copy = value;
    redact_in_place(copy);
    return copy;
}

void Redactor::redact_in_place(nlohmann::json& value) {
    if (value.is_object()) {
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (is_sensitive_key(it.key())) {
                it.value() = std::string(kHiddenMarker);
            } else if (it.value().is_structured()) {
                redact_in_place(it.value());
            }
        }
    } else if (value.is_array()) {
        for (auto& element : value) {
            if (element.is_structured()) {
                redact_in_place(element);
            }
        }
    }
}

} // namespace reqlog
