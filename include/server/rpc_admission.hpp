#pragma once

#include "server/admission_gate.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace gatekeeper {

enum class RpcErrorCode {
    TOO_MANY_REQUESTS,
    NOT_FOUND,
    BAD_GATEWAY,
    INTERNAL
};

[[nodiscard]] inline const char* rpc_error_code_to_string(RpcErrorCode code) {
    switch (code) {
        case RpcErrorCode::TOO_MANY_REQUESTS: return "TOO_MANY_REQUESTS";
        case RpcErrorCode::NOT_FOUND:         return "NOT_FOUND";
        case RpcErrorCode::BAD_GATEWAY:       return "BAD_GATEWAY";
        case RpcErrorCode::INTERNAL:          return "INTERNAL";
        default:                              return "UNKNOWN";
    }
}

/**
 * @brief Structured failure aborting an RPC procedure
 */
class RpcError : public std::runtime_error {
public:
    RpcError(RpcErrorCode code, const std::string& message,
             std::optional<uint32_t> retry_after_seconds = std::nullopt)
        : std::runtime_error(message),
          code_(code),
          retry_after_seconds_(retry_after_seconds) {}

    [[nodiscard]] RpcErrorCode code() const { return code_; }
    [[nodiscard]] std::optional<uint32_t> retry_after_seconds() const { return retry_after_seconds_; }

    /// TOO_MANY_REQUESTS with the standard throttling message
    [[nodiscard]] static RpcError rate_limited(uint32_t retry_after_seconds);

private:
    RpcErrorCode code_;
    std::optional<uint32_t> retry_after_seconds_;
};

/**
 * @brief Per-call state handed to RPC middleware and procedures
 *
 * set_header is empty when the transport cannot carry response headers.
 */
struct RpcCallContext {
    CallerIdentity caller;
    std::string ip = "unknown";
    std::string authorization;          // raw Authorization header, for forwarding
    std::function<void(const std::string& name, const std::string& value)> set_header;
};

/// Procedure body: JSON input -> JSON output
using RpcProcedure = std::function<std::string(RpcCallContext& ctx, const std::string& input)>;

/**
 * @brief RPC adapter around AdmissionGate
 *
 * On denial sets Retry-After through the context (when it can) and throws
 * RpcError{TOO_MANY_REQUESTS}. On allow runs the procedure while holding
 * the concurrency slot; the slot is released when it returns or throws.
 */
class RpcAdmissionMiddleware {
public:
    RpcAdmissionMiddleware(std::shared_ptr<AdmissionGate> gate, AdmissionPolicy policy);

    /**
     * @throws RpcError on denial; anything the procedure throws propagates
     */
    std::string invoke(RpcCallContext& ctx, const std::string& input,
                       const RpcProcedure& procedure) const;

    [[nodiscard]] const AdmissionPolicy& policy() const { return policy_; }

private:
    std::shared_ptr<AdmissionGate> gate_;
    AdmissionPolicy policy_;
};

} // namespace gatekeeper
