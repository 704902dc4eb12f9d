#include "server/trusted_proxies.hpp"
#include "core/error.hpp"

#include <format>

namespace gatekeeper {

TrustedProxySet::TrustedProxySet(const std::vector<std::string>& entries) {
    ranges_.reserve(entries.size());
    for (const auto& entry : entries) {
        CidrRange range;
        if (!parse_cidr(entry, range)) {
            throw ConfigError(std::format("invalid trusted proxy '{}'", entry));
        }
        ranges_.push_back(range);
    }
}

bool TrustedProxySet::contains(std::string_view ip) const {
    if (ranges_.empty()) return false;

    uint32_t addr = 0;
    if (!parse_ip(strip_ipv6_mapped(ip), addr)) return false;

    for (const auto& range : ranges_) {
        if ((addr & range.mask) == range.network) {
            return true;
        }
    }
    return false;
}

bool TrustedProxySet::parse_ip(std::string_view ip, uint32_t& out) {
    uint32_t value = 0;
    uint32_t octet = 0;
    size_t octets = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || octet > 255 || octets == 4) return false;
            value = (value << 8) | octet;
            ++octets;
            octet = 0;
            digits = 0;
        } else if (ip[i] >= '0' && ip[i] <= '9') {
            if (++digits > 3) return false;
            octet = octet * 10 + static_cast<uint32_t>(ip[i] - '0');
        } else {
            return false;
        }
    }
    if (octets != 4) return false;
    out = value;
    return true;
}

bool TrustedProxySet::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        if (!parse_ip(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ip(cidr.substr(0, slash), out.network)) return false;

    const auto bits = cidr.substr(slash + 1);
    if (bits.empty() || bits.size() > 2) return false;
    uint32_t prefix = 0;
    for (const char c : bits) {
        if (c < '0' || c > '9') return false;
        prefix = prefix * 10 + static_cast<uint32_t>(c - '0');
    }
    if (prefix > 32) return false;
    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;
    return true;
}

std::string_view strip_ipv6_mapped(std::string_view addr) {
    constexpr std::string_view prefix = "::ffff:";
    if (addr.size() > prefix.size() && addr.substr(0, prefix.size()) == prefix) {
        return addr.substr(prefix.size());
    }
    return addr;
}

} // namespace gatekeeper
