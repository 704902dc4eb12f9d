#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace gatekeeper {

/**
 * @brief Standard limit names and values for the protected resource classes
 */
namespace limits {

inline constexpr int64_t kTenMinutesMs = 10 * 60 * 1000;
inline constexpr int64_t kOneHourMs = 60 * 60 * 1000;

inline constexpr const char* kEvidenceUser  = "evidence_user";
inline constexpr const char* kOutreachUser  = "outreach_user";
inline constexpr const char* kKitUser       = "kit_user";
inline constexpr const char* kJdExtractUser = "jd_extract_user";
inline constexpr const char* kUrlFetchUser  = "url_fetch_user";
inline constexpr const char* kUrlFetchIp    = "url_fetch_ip";
inline constexpr const char* kAuthIp        = "auth_ip";

/// LLM-backed generation: 10 per user per 10 minutes
inline constexpr RateLimitConfig kLlmUserLimit{10, kTenMinutesMs};
/// Outbound URL fetches: 10 per user per hour
inline constexpr RateLimitConfig kUrlFetchUserLimit{10, kOneHourMs};
/// Outbound URL fetches: 20 per IP per hour
inline constexpr RateLimitConfig kUrlFetchIpLimit{20, kOneHourMs};
/// Login/signup attempts: 20 per IP per 10 minutes
inline constexpr RateLimitConfig kAuthIpLimit{20, kTenMinutesMs};

/// Retry hint for a denied concurrency slot
inline constexpr uint32_t kConcurrencyRetryAfterSeconds = 30;

} // namespace limits

/**
 * @brief Named limit entry as it appears in config
 *
 * Signed fields so that negative values from config reach validation
 * instead of wrapping.
 */
struct LimitEntry {
    std::string name;
    int64_t limit = 0;
    int64_t window_ms = 0;
};

/**
 * @brief Read-only table of named RateLimitConfig values
 *
 * Built once at startup from the standard table plus overrides. Every
 * entry is validated at construction; a bad entry throws ConfigError so a
 * misconfigured process never starts serving.
 */
class LimitRegistry {
public:
    /**
     * @brief Registry holding the standard table only
     */
    LimitRegistry();

    /**
     * @brief Standard table with overrides applied
     *
     * An override with a standard name replaces that entry; any other
     * name adds a new one. Duplicate names within overrides are rejected.
     * @throws ConfigError on limit <= 0, window_ms <= 0, empty or duplicate name
     */
    explicit LimitRegistry(const std::vector<LimitEntry>& overrides);

    [[nodiscard]] Result<RateLimitConfig> lookup(const std::string& name) const;

    /**
     * @brief Like lookup() but throws ConfigError for an unknown name
     */
    [[nodiscard]] const RateLimitConfig& get(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const { return limits_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

    [[nodiscard]] static std::vector<LimitEntry> standard_entries();

private:
    void add(const LimitEntry& entry, bool allow_replace);

    std::unordered_map<std::string, RateLimitConfig> limits_;
};

} // namespace gatekeeper
