#pragma once

#include "core/types.hpp"

#include <glaze/glaze.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace gatekeeper {

inline constexpr const char* kRateLimitedEventType = "rate_limited";

/**
 * @brief Operational event recorded when a request is throttled
 *
 * Carries no PII: the caller's user id and IP appear only as short
 * SHA-256 hashes. Unset hashes are omitted from the JSON line.
 */
struct RateLimitEvent {
    std::string request_id;
    std::string endpoint_group;
    std::string event_type = kRateLimitedEventType;
    int status_code = 429;
    uint32_t retry_after_seconds = 0;
    std::optional<std::string> user_id_hash;
    std::optional<std::string> ip_hash;
    std::string timestamp;
};

/**
 * @brief Build a rate_limited event, hashing the raw identifiers
 *
 * An empty ip is recorded without an ip_hash.
 */
[[nodiscard]] RateLimitEvent make_rate_limit_event(
    EndpointGroup group,
    uint32_t retry_after_seconds,
    const std::optional<std::string>& user_id,
    const std::string& ip);

/**
 * @brief Single-line JSON for a sink
 * @throws std::runtime_error if serialization fails
 */
[[nodiscard]] std::string to_json(const RateLimitEvent& event);

} // namespace gatekeeper

template <>
struct glz::meta<gatekeeper::RateLimitEvent> {
    using T = gatekeeper::RateLimitEvent;
    static constexpr auto value = glz::object(
        "requestId", &T::request_id,
        "endpointGroup", &T::endpoint_group,
        "eventType", &T::event_type,
        "statusCode", &T::status_code,
        "retryAfterSeconds", &T::retry_after_seconds,
        "userIdHash", &T::user_id_hash,
        "ipHash", &T::ip_hash,
        "timestamp", &T::timestamp);
};
