#pragma once

#include <string>
#include <string_view>

namespace urlrelay::http {

// std::string because cpp-httplib APIs require const std::string&
inline const std::string kTokenHeader = "X-Auth-Token";
inline const std::string kLegacyTokenHeader = "X-OpenInSafari-Token";
inline constexpr const char* kJsonContentType = "application/json; charset=utf-8";

inline constexpr const char* kCorsAllowMethods = "GET, POST, OPTIONS";
inline constexpr const char* kCorsAllowHeaders = "Content-Type, X-Auth-Token, X-OpenInSafari-Token";

inline constexpr std::string_view kPingPath = "/ping";
inline constexpr std::string_view kOpenPath = "/open";

} // namespace urlrelay::http
