#pragma once

#include "core/types.hpp"
#include "server/concurrency_gate.hpp"
#include "server/irate_limiter.hpp"
#include "server/limit_registry.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gatekeeper {

class EventEmitter;

/**
 * @brief Admission rules for one endpoint group
 *
 * Keys are built from prefix: "<prefix>:ip:<ip>", "<prefix>:user:<id>",
 * "<prefix>:concurrency:<id>". Distinct prefixes never share a bucket.
 */
struct AdmissionPolicy {
    EndpointGroup group = EndpointGroup::EVIDENCE;
    std::string prefix;
    std::optional<RateLimitConfig> user_limit;   // authenticated callers only
    std::optional<RateLimitConfig> ip_limit;
    uint32_t max_concurrent = 0;                 // 0 = no concurrency gate
};

enum class DenyReason {
    NONE,
    IP_RATE,
    USER_RATE,
    CONCURRENCY
};

[[nodiscard]] inline const char* deny_reason_to_string(DenyReason reason) {
    switch (reason) {
        case DenyReason::NONE:        return "none";
        case DenyReason::IP_RATE:     return "ip_rate";
        case DenyReason::USER_RATE:   return "user_rate";
        case DenyReason::CONCURRENCY: return "concurrency";
        default:                      return "unknown";
    }
}

/**
 * @brief Outcome of AdmissionGate::admit
 *
 * On allow, `slot` holds the concurrency slot (if the policy has one);
 * keep the decision alive until the downstream call finishes.
 */
struct AdmissionDecision {
    bool allowed = false;
    uint32_t retry_after_seconds = 0;
    DenyReason reason = DenyReason::NONE;
    ConcurrencySlot slot;
};

/**
 * @brief Composition shared by the HTTP and RPC adapters
 *
 * Decision order:
 * 1. admin caller             -> allow
 * 2. bypass switch on         -> allow
 * 3. ip_limit                 -> check "<prefix>:ip:<ip>"
 * 4. user_limit + signed in   -> check "<prefix>:user:<id>"
 * 5. max_concurrent + signed in -> acquire "<prefix>:concurrency:<id>"
 *
 * Rate denials emit a RateLimitEvent (fire-and-forget). A full
 * concurrency gate denies with a fixed 30s retry hint.
 */
class AdmissionGate {
public:
    struct Options {
        bool bypass = false;
    };

    AdmissionGate(std::shared_ptr<IRateLimiter> limiter,
                  std::shared_ptr<ConcurrencyGate> concurrency,
                  std::shared_ptr<EventEmitter> events,
                  const Options& options);

    AdmissionGate(std::shared_ptr<IRateLimiter> limiter,
                  std::shared_ptr<ConcurrencyGate> concurrency);

    [[nodiscard]] AdmissionDecision admit(const AdmissionPolicy& policy,
                                          const CallerIdentity& caller,
                                          const std::string& ip);

    void set_bypass(bool enabled);
    [[nodiscard]] bool bypass_enabled() const;

    struct Stats {
        uint64_t admitted;
        uint64_t bypassed;
        uint64_t ip_denials;
        uint64_t user_denials;
        uint64_t concurrency_denials;
    };
    [[nodiscard]] Stats get_stats() const;

    [[nodiscard]] const std::shared_ptr<IRateLimiter>& limiter() const { return limiter_; }
    [[nodiscard]] const std::shared_ptr<ConcurrencyGate>& concurrency() const { return concurrency_; }

    [[nodiscard]] static std::string ip_key(const std::string& prefix, const std::string& ip);
    [[nodiscard]] static std::string user_key(const std::string& prefix, const std::string& user_id);
    [[nodiscard]] static std::string concurrency_key(const std::string& prefix, const std::string& user_id);

private:
    AdmissionDecision deny(const AdmissionPolicy& policy, const CallerIdentity& caller,
                           const std::string& ip, DenyReason reason, uint32_t retry_after);
    void emit_event(const AdmissionPolicy& policy, const CallerIdentity& caller,
                    const std::string& ip, uint32_t retry_after);

    std::shared_ptr<IRateLimiter> limiter_;
    std::shared_ptr<ConcurrencyGate> concurrency_;
    std::shared_ptr<EventEmitter> events_;
    std::atomic<bool> bypass_;

    std::atomic<uint64_t> admitted_{0};
    std::atomic<uint64_t> bypassed_{0};
    std::atomic<uint64_t> ip_denials_{0};
    std::atomic<uint64_t> user_denials_{0};
    std::atomic<uint64_t> concurrency_denials_{0};
};

// ============================================================================
// Standard Policies
// ============================================================================

namespace policies {

/**
 * @brief Build the policy for a group from the registry's standard entries
 *
 * evidence / outreach / kit / jd_extract: per-user limit + 1 in flight
 * url_fetch: per-user + per-IP, no concurrency gate (prefix "urlfetch")
 * auth:      per-IP only
 * waitlist has no standard policy.
 * @throws ConfigError for a group without a standard policy or a missing limit
 */
[[nodiscard]] AdmissionPolicy standard(EndpointGroup group, const LimitRegistry& registry);

/// Every group that has a standard policy
[[nodiscard]] std::vector<AdmissionPolicy> standard_all(const LimitRegistry& registry);

} // namespace policies

} // namespace gatekeeper
