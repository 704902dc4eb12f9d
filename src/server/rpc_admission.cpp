#include "server/rpc_admission.hpp"
#include "server/http_constants.hpp"
#include "server/rate_limit_response.hpp"

#include <format>

namespace gatekeeper {

RpcError RpcError::rate_limited(uint32_t retry_after_seconds) {
    return RpcError(RpcErrorCode::TOO_MANY_REQUESTS,
                    rate_limit_message(retry_after_seconds),
                    retry_after_seconds);
}

RpcAdmissionMiddleware::RpcAdmissionMiddleware(std::shared_ptr<AdmissionGate> gate,
                                               AdmissionPolicy policy)
    : gate_(std::move(gate)),
      policy_(std::move(policy)) {}

std::string RpcAdmissionMiddleware::invoke(RpcCallContext& ctx,
                                           const std::string& input,
                                           const RpcProcedure& procedure) const {
    const auto decision = gate_->admit(policy_, ctx.caller, ctx.ip);
    if (!decision.allowed) {
        if (ctx.set_header) {
            ctx.set_header(http::kRetryAfterHeader,
                           std::format("{}", decision.retry_after_seconds));
        }
        throw RpcError::rate_limited(decision.retry_after_seconds);
    }
    return procedure(ctx, input);
}

} // namespace gatekeeper
