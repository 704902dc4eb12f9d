#include "server/rate_limit_response.hpp"
#include "server/http_constants.hpp"

#include <httplib.h>

#include <format>
#include <stdexcept>

namespace gatekeeper {

std::string rate_limit_message(uint32_t retry_after_seconds) {
    return std::format(
        "You're doing that a bit too fast. Please wait {}s and try again.",
        retry_after_seconds);
}

RateLimitBody build_rate_limit_body(uint32_t retry_after_seconds) {
    RateLimitBody body;
    body.message = rate_limit_message(retry_after_seconds);
    body.retry_after_seconds = retry_after_seconds;
    return body;
}

std::string rate_limit_json(uint32_t retry_after_seconds) {
    const auto body = build_rate_limit_body(retry_after_seconds);
    auto json = glz::write_json(body);
    if (!json) {
        throw std::runtime_error("Failed to serialize rate limit body");
    }
    return std::move(*json);
}

void write_rate_limited(httplib::Response& res, uint32_t retry_after_seconds) {
    res.status = httplib::StatusCode::TooManyRequests_429;
    res.set_header(http::kRetryAfterHeader, std::format("{}", retry_after_seconds));
    res.set_content(rate_limit_json(retry_after_seconds), http::kJsonContentType);
}

} // namespace gatekeeper
