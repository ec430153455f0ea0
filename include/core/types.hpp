#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace reqlog {

// ============================================================================
// Action Categories
// ============================================================================

/**
 * @brief Coarse action category derived from a request path
 *
 * Declaration order is the classification order: the first group whose
 * keywords match wins.
 */
enum class ActionKind {
    CREATE,
    READ,
    UPDATE,
    DELETE,
    AUTH,
    SUBSCRIBE,
    UNSUBSCRIBE,
    UNKNOWN
};

inline const char* action_to_string(ActionKind action) {
    switch (action) {
        case ActionKind::CREATE: return "create";
        case ActionKind::READ: return "read";
        case ActionKind::UPDATE: return "update";
        case ActionKind::DELETE: return "delete";
        case ActionKind::AUTH: return "auth";
        case ActionKind::SUBSCRIBE: return "subscribe";
        case ActionKind::UNSUBSCRIBE: return "unsubscribe";
        default: return "unknown";
    }
}

inline std::optional<ActionKind> parse_action(std::string_view name) {
    if (name == "create") return ActionKind::CREATE;
    if (name == "read") return ActionKind::READ;
    if (name == "update") return ActionKind::UPDATE;
    if (name == "delete") return ActionKind::DELETE;
    if (name == "auth") return ActionKind::AUTH;
    if (name == "subscribe") return ActionKind::SUBSCRIBE;
    if (name == "unsubscribe") return ActionKind::UNSUBSCRIBE;
    if (name == "unknown") return ActionKind::UNKNOWN;
    return std::nullopt;
}

// Sentinel for best-effort request fields that could not be extracted
inline constexpr const char* kUnknown = "unknown";

} // namespace reqlog
