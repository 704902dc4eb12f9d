#include "server/http_admission.hpp"
#include "server/http_constants.hpp"
#include "server/rate_limit_response.hpp"
#include "auth/identity_provider.hpp"
#include "core/utils.hpp"

namespace gatekeeper {

std::string resolve_client_ip(const ClientAddress& address) {
    if (address.resolved_ip && !address.resolved_ip->empty()) {
        return *address.resolved_ip;
    }
    if (address.remote_address && !address.remote_address->empty()) {
        return *address.remote_address;
    }
    return kUnknownClientIp;
}

ClientAddress client_address_from(const httplib::Request& req,
                                  const TrustedProxySet& trusted_proxies) {
    ClientAddress address;
    const std::string remote{strip_ipv6_mapped(req.remote_addr)};
    if (!remote.empty()) {
        address.remote_address = remote;
    }

    // Only a trusted peer may speak for the client
    if (!trusted_proxies.contains(req.remote_addr)) {
        address.resolved_ip = address.remote_address;
        return address;
    }

    const std::string xff = req.get_header_value(http::kForwardedForHeader);
    const auto comma = xff.find(',');
    std::string first_hop = utils::trim(comma == std::string::npos ? xff : xff.substr(0, comma));
    if (first_hop.empty()) {
        address.resolved_ip = address.remote_address;
    } else {
        address.resolved_ip = std::move(first_hop);
    }
    return address;
}

// ============================================================================
// HttpAdmissionMiddleware
// ============================================================================

HttpAdmissionMiddleware::HttpAdmissionMiddleware(std::shared_ptr<AdmissionGate> gate,
                                                 std::shared_ptr<const IIdentityProvider> identity,
                                                 TrustedProxySet trusted_proxies)
    : gate_(std::move(gate)),
      identity_(std::move(identity)),
      trusted_proxies_(std::move(trusted_proxies)) {}

CallerIdentity HttpAdmissionMiddleware::identify(const httplib::Request& req) const {
    if (!identity_) return CallerIdentity::anonymous();
    return identity_->identify(req.get_header_value(http::kAuthorizationHeader));
}

std::string HttpAdmissionMiddleware::client_ip(const httplib::Request& req) const {
    return resolve_client_ip(client_address_from(req, trusted_proxies_));
}

AdmissionDecision HttpAdmissionMiddleware::admit(const AdmissionPolicy& policy,
                                                 const httplib::Request& req,
                                                 httplib::Response& res) const {
    auto decision = gate_->admit(policy, identify(req), client_ip(req));
    if (!decision.allowed) {
        write_rate_limited(res, decision.retry_after_seconds);
    }
    return decision;
}

httplib::Server::Handler HttpAdmissionMiddleware::wrap(AdmissionPolicy policy,
                                                       httplib::Server::Handler next) const {
    return [this, policy = std::move(policy), next = std::move(next)](
               const httplib::Request& req, httplib::Response& res) {
        const auto decision = admit(policy, req, res);
        if (!decision.allowed) return;
        next(req, res);
    };
}

} // namespace gatekeeper
