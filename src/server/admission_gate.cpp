#include "server/admission_gate.hpp"
#include "events/event_emitter.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"

#include <format>

namespace gatekeeper {

AdmissionGate::AdmissionGate(std::shared_ptr<IRateLimiter> limiter,
                             std::shared_ptr<ConcurrencyGate> concurrency,
                             std::shared_ptr<EventEmitter> events,
                             const Options& options)
    : limiter_(std::move(limiter)),
      concurrency_(std::move(concurrency)),
      events_(std::move(events)),
      bypass_(options.bypass) {
    if (!limiter_ || !concurrency_) {
        throw std::invalid_argument("AdmissionGate requires a rate limiter and a concurrency gate");
    }
    if (options.bypass) {
        utils::log::warn("Admission bypass is ENABLED: all requests skip rate limiting");
    }
}

AdmissionGate::AdmissionGate(std::shared_ptr<IRateLimiter> limiter,
                             std::shared_ptr<ConcurrencyGate> concurrency)
    : AdmissionGate(std::move(limiter), std::move(concurrency), nullptr, Options{}) {}

// ============================================================================
// Keys
// ============================================================================

std::string AdmissionGate::ip_key(const std::string& prefix, const std::string& ip) {
    return std::format("{}:ip:{}", prefix, ip);
}

std::string AdmissionGate::user_key(const std::string& prefix, const std::string& user_id) {
    return std::format("{}:user:{}", prefix, user_id);
}

std::string AdmissionGate::concurrency_key(const std::string& prefix, const std::string& user_id) {
    return std::format("{}:concurrency:{}", prefix, user_id);
}

// ============================================================================
// Admission
// ============================================================================

AdmissionDecision AdmissionGate::admit(const AdmissionPolicy& policy,
                                       const CallerIdentity& caller,
                                       const std::string& ip) {
    // Admins are never throttled
    if (caller.is_admin() || bypass_.load(std::memory_order_relaxed)) {
        bypassed_.fetch_add(1, std::memory_order_relaxed);
        AdmissionDecision decision;
        decision.allowed = true;
        return decision;
    }

    if (policy.ip_limit) {
        const auto result = limiter_->check(ip_key(policy.prefix, ip), *policy.ip_limit);
        if (!result.allowed) {
            ip_denials_.fetch_add(1, std::memory_order_relaxed);
            emit_event(policy, caller, ip, result.retry_after_seconds);
            return deny(policy, caller, ip, DenyReason::IP_RATE, result.retry_after_seconds);
        }
    }

    if (policy.user_limit && caller.is_authenticated()) {
        const auto result = limiter_->check(user_key(policy.prefix, *caller.user_id), *policy.user_limit);
        if (!result.allowed) {
            user_denials_.fetch_add(1, std::memory_order_relaxed);
            emit_event(policy, caller, ip, result.retry_after_seconds);
            return deny(policy, caller, ip, DenyReason::USER_RATE, result.retry_after_seconds);
        }
    }

    AdmissionDecision decision;
    if (policy.max_concurrent > 0 && caller.is_authenticated()) {
        decision.slot = concurrency_->try_acquire_slot(
            concurrency_key(policy.prefix, *caller.user_id), policy.max_concurrent);
        if (!decision.slot.held()) {
            concurrency_denials_.fetch_add(1, std::memory_order_relaxed);
            return deny(policy, caller, ip, DenyReason::CONCURRENCY,
                        limits::kConcurrencyRetryAfterSeconds);
        }
    }

    admitted_.fetch_add(1, std::memory_order_relaxed);
    decision.allowed = true;
    return decision;
}

AdmissionDecision AdmissionGate::deny(const AdmissionPolicy& policy,
                                      const CallerIdentity& caller,
                                      const std::string& ip,
                                      DenyReason reason,
                                      uint32_t retry_after) {
    utils::log::debug(std::format("Admission denied: group={} reason={} user={} ip={} retry_after={}s",
        endpoint_group_to_string(policy.group), deny_reason_to_string(reason),
        caller.user_id.value_or("-"), ip, retry_after));

    AdmissionDecision decision;
    decision.allowed = false;
    decision.retry_after_seconds = retry_after;
    decision.reason = reason;
    return decision;
}

void AdmissionGate::emit_event(const AdmissionPolicy& policy,
                               const CallerIdentity& caller,
                               const std::string& ip,
                               uint32_t retry_after) {
    if (!events_) return;
    // Event delivery must never fail the request path
    try {
        (void)events_->emit(make_rate_limit_event(policy.group, retry_after, caller.user_id, ip));
    } catch (const std::exception& e) {
        utils::log::error(std::format("Failed to emit rate_limited event: {}", e.what()));
    }
}

void AdmissionGate::set_bypass(bool enabled) {
    bypass_.store(enabled, std::memory_order_relaxed);
    utils::log::info(std::format("Admission bypass {}", enabled ? "enabled" : "disabled"));
}

bool AdmissionGate::bypass_enabled() const {
    return bypass_.load(std::memory_order_relaxed);
}

AdmissionGate::Stats AdmissionGate::get_stats() const {
    return {
        .admitted = admitted_.load(std::memory_order_relaxed),
        .bypassed = bypassed_.load(std::memory_order_relaxed),
        .ip_denials = ip_denials_.load(std::memory_order_relaxed),
        .user_denials = user_denials_.load(std::memory_order_relaxed),
        .concurrency_denials = concurrency_denials_.load(std::memory_order_relaxed),
    };
}

// ============================================================================
// Standard Policies
// ============================================================================

namespace policies {

namespace {

AdmissionPolicy llm_policy(EndpointGroup group, const char* limit_name,
                           const LimitRegistry& registry) {
    AdmissionPolicy policy;
    policy.group = group;
    policy.prefix = endpoint_group_to_string(group);
    policy.user_limit = registry.get(limit_name);
    policy.max_concurrent = 1;
    return policy;
}

} // anonymous namespace

AdmissionPolicy standard(EndpointGroup group, const LimitRegistry& registry) {
    switch (group) {
        case EndpointGroup::EVIDENCE:
            return llm_policy(group, limits::kEvidenceUser, registry);
        case EndpointGroup::OUTREACH:
            return llm_policy(group, limits::kOutreachUser, registry);
        case EndpointGroup::KIT:
            return llm_policy(group, limits::kKitUser, registry);
        case EndpointGroup::JD_EXTRACT:
            return llm_policy(group, limits::kJdExtractUser, registry);
        case EndpointGroup::URL_FETCH: {
            AdmissionPolicy policy;
            policy.group = group;
            policy.prefix = "urlfetch";
            policy.user_limit = registry.get(limits::kUrlFetchUser);
            policy.ip_limit = registry.get(limits::kUrlFetchIp);
            return policy;
        }
        case EndpointGroup::AUTH: {
            AdmissionPolicy policy;
            policy.group = group;
            policy.prefix = "auth";
            policy.ip_limit = registry.get(limits::kAuthIp);
            return policy;
        }
        default:
            throw ConfigError(std::format("no standard admission policy for group '{}'",
                                          endpoint_group_to_string(group)));
    }
}

std::vector<AdmissionPolicy> standard_all(const LimitRegistry& registry) {
    std::vector<AdmissionPolicy> result;
    for (const auto group : {EndpointGroup::EVIDENCE, EndpointGroup::OUTREACH,
                             EndpointGroup::KIT, EndpointGroup::JD_EXTRACT,
                             EndpointGroup::URL_FETCH, EndpointGroup::AUTH}) {
        result.push_back(standard(group, registry));
    }
    return result;
}

} // namespace policies

} // namespace gatekeeper
