#include "server/rpc_dispatcher.hpp"
#include "server/http_constants.hpp"
#include "server/rate_limit_response.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace gatekeeper {

RpcDispatcher::RpcDispatcher(std::shared_ptr<AdmissionGate> gate)
    : gate_(std::move(gate)) {}

void RpcDispatcher::register_procedure(const std::string& name,
                                       std::optional<AdmissionPolicy> policy,
                                       RpcProcedure procedure) {
    auto entry = std::make_shared<Entry>();
    if (policy) {
        entry->admission.emplace(gate_, std::move(*policy));
    }
    entry->procedure = std::move(procedure);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    procedures_.insert_or_assign(name, std::move(entry));
}

bool RpcDispatcher::has_procedure(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return procedures_.contains(name);
}

std::vector<std::string> RpcDispatcher::procedure_names() const {
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        names.reserve(procedures_.size());
        for (const auto& [name, entry] : procedures_) {
            names.push_back(name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

RpcResponse RpcDispatcher::error_response(const RpcError& error) {
    RpcResponse response;
    switch (error.code()) {
        case RpcErrorCode::TOO_MANY_REQUESTS: {
            const uint32_t retry_after = error.retry_after_seconds().value_or(1);
            response.status = 429;
            response.body = rate_limit_json(retry_after);
            response.headers.emplace_back(http::kRetryAfterHeader, std::format("{}", retry_after));
            return response;
        }
        case RpcErrorCode::NOT_FOUND:   response.status = 404; break;
        case RpcErrorCode::BAD_GATEWAY: response.status = 502; break;
        case RpcErrorCode::INTERNAL:
        default:                        response.status = 500; break;
    }
    response.body = std::format(R"({{"error":"{}","message":"{}"}})",
        rpc_error_code_to_string(error.code()), utils::escape_json(error.what()));
    return response;
}

RpcResponse RpcDispatcher::call(const std::string& name,
                                RpcCallContext ctx,
                                const std::string& input) const {
    std::shared_ptr<const Entry> entry;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto it = procedures_.find(name);
        if (it != procedures_.end()) {
            entry = it->second;
        }
    }
    if (!entry) {
        return error_response(RpcError(RpcErrorCode::NOT_FOUND,
                                       std::format("No procedure '{}'", name)));
    }

    RpcResponse response;
    ctx.set_header = [&response](const std::string& header, const std::string& value) {
        response.headers.emplace_back(header, value);
    };

    try {
        response.body = entry->admission
            ? entry->admission->invoke(ctx, input, entry->procedure)
            : entry->procedure(ctx, input);
        response.status = 200;
        return response;
    } catch (const RpcError& e) {
        if (e.code() != RpcErrorCode::TOO_MANY_REQUESTS) {
            utils::log::warn(std::format("RPC {} failed: {} {}", name,
                rpc_error_code_to_string(e.code()), e.what()));
        }
        auto failure = error_response(e);
        // Keep headers a procedure set before failing, minus a duplicate Retry-After
        for (auto& header : response.headers) {
            if (header.first == http::kRetryAfterHeader && e.retry_after_seconds()) continue;
            failure.headers.push_back(std::move(header));
        }
        return failure;
    } catch (const std::exception& e) {
        utils::log::error(std::format("RPC {} threw: {}", name, e.what()));
        return error_response(RpcError(RpcErrorCode::INTERNAL, "Internal error"));
    }
}

} // namespace gatekeeper
