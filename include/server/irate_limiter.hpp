#pragma once

#include "core/types.hpp"
#include <string>

namespace gatekeeper {

/**
 * @brief Abstract rate limiter interface
 *
 * The admission gate depends only on this seam, so tests can inject
 * scripted limiters and the in-process sliding window can be swapped
 * for another backend.
 */
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;

    /**
     * @brief Prune, check and (on allow) record one request for key
     * @param now_ms Caller-supplied clock, trusted literally
     */
    [[nodiscard]] virtual RateLimitResult check(
        const std::string& key, const RateLimitConfig& config, TimestampMs now_ms) = 0;

    /// Same as above, reading the limiter's own clock
    [[nodiscard]] virtual RateLimitResult check(
        const std::string& key, const RateLimitConfig& config) = 0;

    virtual void reset_all() = 0;
};

} // namespace gatekeeper
