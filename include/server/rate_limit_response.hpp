#pragma once

#include <glaze/glaze.hpp>

#include <cstdint>
#include <string>

namespace httplib { struct Response; }

namespace gatekeeper {

/// Error code carried by every throttling response
inline constexpr const char* kRateLimitedCode = "RATE_LIMITED";

/**
 * @brief Standard throttling payload
 *
 * Serialized as exactly three keys:
 *   {"error":"RATE_LIMITED","message":"...Ns...","retryAfterSeconds":N}
 */
struct RateLimitBody {
    std::string error = kRateLimitedCode;
    std::string message;
    uint32_t retry_after_seconds = 0;
};

/**
 * @brief Human-readable throttling message embedding "<N>s"
 */
[[nodiscard]] std::string rate_limit_message(uint32_t retry_after_seconds);

[[nodiscard]] RateLimitBody build_rate_limit_body(uint32_t retry_after_seconds);

/**
 * @brief JSON text of the throttling payload
 * @throws std::runtime_error if serialization fails
 */
[[nodiscard]] std::string rate_limit_json(uint32_t retry_after_seconds);

/**
 * @brief Write a 429 with Retry-After and the JSON payload
 */
void write_rate_limited(httplib::Response& res, uint32_t retry_after_seconds);

} // namespace gatekeeper

template <>
struct glz::meta<gatekeeper::RateLimitBody> {
    using T = gatekeeper::RateLimitBody;
    static constexpr auto value = glz::object(
        "error", &T::error,
        "message", &T::message,
        "retryAfterSeconds", &T::retry_after_seconds);
};
