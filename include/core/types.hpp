#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gatekeeper {

/// Milliseconds since the Unix epoch
using TimestampMs = int64_t;

// ============================================================================
// Rate Limit Types
// ============================================================================

/**
 * @brief Requests-per-window limit for one protected resource class
 *
 * Immutable once registered. LimitRegistry rejects limit == 0 and
 * window_ms <= 0 at construction.
 */
struct RateLimitConfig {
    uint32_t limit = 1;
    int64_t window_ms = 1;

    [[nodiscard]] bool is_valid() const { return limit >= 1 && window_ms >= 1; }

    /// ceil(window_ms / 1000): the largest retry hint this config can produce
    [[nodiscard]] uint32_t max_retry_after_seconds() const {
        return static_cast<uint32_t>((window_ms + 999) / 1000);
    }

    bool operator==(const RateLimitConfig&) const = default;
};

/**
 * @brief Admission verdict for a single check
 *
 * retry_after_seconds is 0 when allowed, >= 1 when denied.
 */
struct RateLimitResult {
    bool allowed;
    uint32_t retry_after_seconds;

    RateLimitResult() : allowed(false), retry_after_seconds(0) {}

    RateLimitResult(bool a, uint32_t ra)
        : allowed(a), retry_after_seconds(ra) {}

    [[nodiscard]] static RateLimitResult allow() { return {true, 0}; }
    [[nodiscard]] static RateLimitResult deny(uint32_t retry_after) { return {false, retry_after}; }
};

// ============================================================================
// Endpoint Groups
// ============================================================================

enum class EndpointGroup {
    EVIDENCE,
    OUTREACH,
    KIT,
    JD_EXTRACT,
    URL_FETCH,
    AUTH,
    WAITLIST
};

[[nodiscard]] inline const char* endpoint_group_to_string(EndpointGroup group) {
    switch (group) {
        case EndpointGroup::EVIDENCE:   return "evidence";
        case EndpointGroup::OUTREACH:   return "outreach";
        case EndpointGroup::KIT:        return "kit";
        case EndpointGroup::JD_EXTRACT: return "jd_extract";
        case EndpointGroup::URL_FETCH:  return "url_fetch";
        case EndpointGroup::AUTH:       return "auth";
        case EndpointGroup::WAITLIST:   return "waitlist";
        default:                        return "unknown";
    }
}

[[nodiscard]] inline std::optional<EndpointGroup> parse_endpoint_group(std::string_view name) {
    static const std::unordered_map<std::string_view, EndpointGroup> lookup = {
        {"evidence",   EndpointGroup::EVIDENCE},
        {"outreach",   EndpointGroup::OUTREACH},
        {"kit",        EndpointGroup::KIT},
        {"jd_extract", EndpointGroup::JD_EXTRACT},
        {"url_fetch",  EndpointGroup::URL_FETCH},
        {"auth",       EndpointGroup::AUTH},
        {"waitlist",   EndpointGroup::WAITLIST},
    };
    if (const auto it = lookup.find(name); it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

// ============================================================================
// Caller Identity (supplied by the authentication collaborator)
// ============================================================================

enum class Role {
    USER,
    ADMIN
};

struct CallerIdentity {
    std::optional<std::string> user_id;     // nullopt = unauthenticated
    Role role = Role::USER;

    [[nodiscard]] bool is_authenticated() const { return user_id.has_value(); }
    [[nodiscard]] bool is_admin() const { return role == Role::ADMIN; }

    [[nodiscard]] static CallerIdentity anonymous() { return {}; }
    [[nodiscard]] static CallerIdentity user(std::string id, Role r = Role::USER) {
        return CallerIdentity{std::move(id), r};
    }
};

} // namespace gatekeeper
