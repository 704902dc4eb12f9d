#pragma once

#include "server/rpc_admission.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gatekeeper {

/**
 * @brief Transport-neutral RPC result
 */
struct RpcResponse {
    int status = 200;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
};

/**
 * @brief Name -> procedure table with optional admission per procedure
 *
 * call() converts failures into structured responses:
 *   TOO_MANY_REQUESTS -> 429 + standard throttling body + Retry-After
 *   NOT_FOUND         -> 404
 *   BAD_GATEWAY       -> 502
 *   anything else     -> 500
 */
class RpcDispatcher {
public:
    explicit RpcDispatcher(std::shared_ptr<AdmissionGate> gate);

    /**
     * @brief Register a procedure; a later registration replaces an earlier one
     * @param policy Admission policy, or nullopt for an unthrottled procedure
     */
    void register_procedure(const std::string& name,
                            std::optional<AdmissionPolicy> policy,
                            RpcProcedure procedure);

    [[nodiscard]] RpcResponse call(const std::string& name,
                                   RpcCallContext ctx,
                                   const std::string& input) const;

    [[nodiscard]] bool has_procedure(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> procedure_names() const;

private:
    struct Entry {
        std::optional<RpcAdmissionMiddleware> admission;
        RpcProcedure procedure;
    };

    [[nodiscard]] static RpcResponse error_response(const RpcError& error);

    std::shared_ptr<AdmissionGate> gate_;
    std::unordered_map<std::string, std::shared_ptr<const Entry>> procedures_;
    mutable std::shared_mutex mutex_;
};

} // namespace gatekeeper
