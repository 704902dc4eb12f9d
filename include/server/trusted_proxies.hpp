#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace gatekeeper {

/**
 * @brief IPv4 addresses and CIDR ranges allowed to set X-Forwarded-For
 *
 * Empty set = trust nobody: the socket peer is always the client.
 */
class TrustedProxySet {
public:
    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    TrustedProxySet() = default;

    /// @throws ConfigError on an entry that is neither an IPv4 address nor a CIDR
    explicit TrustedProxySet(const std::vector<std::string>& entries);

    [[nodiscard]] bool contains(std::string_view ip) const;
    [[nodiscard]] bool empty() const { return ranges_.empty(); }

    static bool parse_ip(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);

private:
    std::vector<CidrRange> ranges_;
};

/// Strip the IPv6-mapped IPv4 prefix ("::ffff:") if present
[[nodiscard]] std::string_view strip_ipv6_mapped(std::string_view addr);

} // namespace gatekeeper
