#pragma once

#include <string>
#include <string_view>

namespace reqlog::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline constexpr const char* kJsonContentType = "application/json";

// Admin and probe routes
inline constexpr const char* kHealthRoute = "/health";
inline constexpr const char* kStatsRoute = "/admin/logs/stats";
inline constexpr const char* kCleanupRoute = "/admin/logs/cleanup";
inline constexpr const char* kRetentionRoute = "/admin/logs/retention";

} // namespace reqlog::http
