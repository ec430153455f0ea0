#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reqlog {

/**
 * @brief Maps request paths to an action category and an entity name
 *
 * Action: the lowercased path is tested against keyword groups in
 * declaration order (create, read, update, delete, auth, subscribe,
 * unsubscribe). A group matches when the path contains or starts with
 * one of its keywords. First match wins, no match yields UNKNOWN.
 *
 * Entity: first path segment that is not a version/prefix token
 * (api, v1, v2, v3), with the query string stripped.
 */
class RouteClassifier {
public:
    using KeywordGroup = std::pair<ActionKind, std::vector<std::string_view>>;

    [[nodiscard]] static ActionKind classify_action(std::string_view path_segment);

    /// "unknown" when no meaningful segment remains, "error" if parsing fails
    [[nodiscard]] static std::string classify_entity(std::string_view url) noexcept;

    [[nodiscard]] static const std::vector<KeywordGroup>& keyword_groups();

private:
    static bool is_prefix_token(std::string_view segment);
};

} // namespace reqlog
