#pragma once

#include <string>
#include <string_view>

namespace gatekeeper::http {

inline constexpr std::string_view kBearerPrefix = "Bearer ";
// std::string because cpp-httplib APIs require const std::string&
inline const std::string kAuthorizationHeader = "Authorization";
inline const std::string kRetryAfterHeader = "Retry-After";
inline const std::string kForwardedForHeader = "X-Forwarded-For";
inline const std::string kRequestIdHeader = "X-Request-Id";
inline constexpr const char* kJsonContentType = "application/json";
inline constexpr const char* kPrometheusContentType = "text/plain; version=0.0.4; charset=utf-8";

inline constexpr std::string_view kRpcPathPrefix = "/rpc/";

} // namespace gatekeeper::http
