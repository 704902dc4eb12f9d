#pragma once

#include "server/irate_limiter.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace gatekeeper::testing {

/**
 * @brief Scripted limiter: records every key it is asked about and
 * denies the keys it was told to deny
 */
class MockRateLimiter : public IRateLimiter {
public:
    [[nodiscard]] RateLimitResult check(
        const std::string& key, const RateLimitConfig& /*config*/, TimestampMs /*now_ms*/) override {
        checked_keys.push_back(key);
        if (const auto it = deny_keys.find(key); it != deny_keys.end()) {
            return RateLimitResult::deny(it->second);
        }
        return RateLimitResult::allow();
    }

    [[nodiscard]] RateLimitResult check(
        const std::string& key, const RateLimitConfig& config) override {
        return check(key, config, 0);
    }

    void reset_all() override { checked_keys.clear(); }

    std::vector<std::string> checked_keys;
    std::unordered_map<std::string, uint32_t> deny_keys;   // key -> retry_after
};

} // namespace gatekeeper::testing
