#pragma once

#include "server/admission_gate.hpp"
#include "server/trusted_proxies.hpp"

#include <httplib.h>

#include <memory>
#include <optional>
#include <string>

namespace gatekeeper {

class IIdentityProvider;

inline constexpr const char* kUnknownClientIp = "unknown";

/**
 * @brief What the transport knows about the client's address
 *
 * resolved_ip: proxy-aware client IP (X-Forwarded-For first hop when the
 * peer is a trusted proxy). remote_address: the raw socket peer.
 */
struct ClientAddress {
    std::optional<std::string> resolved_ip;
    std::optional<std::string> remote_address;
};

/**
 * @brief Three-tier fallback: resolved IP -> socket peer -> "unknown"
 *
 * Empty strings count as absent.
 */
[[nodiscard]] std::string resolve_client_ip(const ClientAddress& address);

/**
 * @brief Build a ClientAddress from an httplib request
 */
[[nodiscard]] ClientAddress client_address_from(const httplib::Request& req,
                                                const TrustedProxySet& trusted_proxies);

/**
 * @brief HTTP adapter around AdmissionGate
 *
 * wrap() returns a handler that runs the gate before `next`. On denial it
 * writes the standard 429 and never calls `next`. On allow it calls
 * `next` while holding the concurrency slot; the slot is released when
 * `next` returns or throws. The middleware must outlive every handler
 * it returns.
 */
class HttpAdmissionMiddleware {
public:
    HttpAdmissionMiddleware(std::shared_ptr<AdmissionGate> gate,
                            std::shared_ptr<const IIdentityProvider> identity,
                            TrustedProxySet trusted_proxies);

    [[nodiscard]] httplib::Server::Handler wrap(AdmissionPolicy policy,
                                                httplib::Server::Handler next) const;

    /**
     * @brief Run the gate for one request; writes the 429 on denial
     */
    [[nodiscard]] AdmissionDecision admit(const AdmissionPolicy& policy,
                                          const httplib::Request& req,
                                          httplib::Response& res) const;

    [[nodiscard]] CallerIdentity identify(const httplib::Request& req) const;
    [[nodiscard]] std::string client_ip(const httplib::Request& req) const;

private:
    std::shared_ptr<AdmissionGate> gate_;
    std::shared_ptr<const IIdentityProvider> identity_;
    TrustedProxySet trusted_proxies_;
};

} // namespace gatekeeper
