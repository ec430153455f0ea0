#include "classifier/route_classifier.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <exception>

namespace reqlog {

namespace {

constexpr std::array<std::string_view, 4> kPrefixTokens = {"api", "v1", "v2", "v3"};

} // anonymous namespace

const std::vector<RouteClassifier::KeywordGroup>& RouteClassifier::keyword_groups() {
    static const std::vector<KeywordGroup> groups = {
        {ActionKind::CREATE,      {"add", "create", "upload", "post", "register", "signup", "insert"}},
        {ActionKind::READ,        {"get", "fetch", "find", "search", "list", "show", "view"}},
        {ActionKind::UPDATE,      {"update", "modify", "edit", "patch", "put", "change"}},
        {ActionKind::DELETE,      {"delete", "del", "remove", "destroy", "clear"}},
        {ActionKind::AUTH,        {"login", "logout", "signin", "signout", "authenticate"}},
        {ActionKind::SUBSCRIBE,   {"subscribe", "follow", "join"}},
        {ActionKind::UNSUBSCRIBE, {"unsubscribe", "unfollow", "leave"}},
    };
    return groups;
}

ActionKind RouteClassifier::classify_action(std::string_view path_segment) {
    const std::string normalized = utils::to_lower(path_segment);

    for (const auto& [action, keywords] : keyword_groups()) {
        const bool found = std::any_of(keywords.begin(), keywords.end(),
            [&normalized](std::string_view keyword) {
                return normalized.find(keyword) != std::string::npos ||
                       normalized.starts_with(keyword);
            });
        if (found) {
            return action;
        }
    }
    return ActionKind::UNKNOWN;
}

bool RouteClassifier::is_prefix_token(std::string_view segment) {
    return std::any_of(kPrefixTokens.begin(), kPrefixTokens.end(),
        [segment](std::string_view token) { return utils::iequals(segment, token); });
}

std::string RouteClassifier::classify_entity(std::string_view url) noexcept {
    try {
        const std::string_view path = url.substr(0, url.find('?'));

        size_t pos = 0;
        while (pos <= path.size()) {
            const size_t next = std::min(path.find('/', pos), path.size());
            const std::string_view segment = path.substr(pos, next - pos);
            if (!segment.empty() && !is_prefix_token(segment)) {
                return std::string(segment);
            }
            pos = next + 1;
        }
        return kUnknown;
    } catch (const std::exception&) {
        return "error";
    }
}

} // namespace reqlog
