#include "server/client_identity.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace edgeguard {

bool ClientIdentity::parse_ipv4(std::string_view ip, uint32_t& out) {
    uint32_t addr = 0;
    uint32_t octet = 0;
    size_t octets = 0;
    size_t digits = 0;

    for (size_t i = 0; i <= ip.size(); ++i) {
        if (i == ip.size() || ip[i] == '.') {
            if (digits == 0 || octet > 255 || octets == 4) return false;
            addr = (addr << 8) | octet;
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
    out = addr;
    return true;
}

bool ClientIdentity::parse_cidr(std::string_view cidr, CidrRange& out) {
    const auto slash = cidr.find('/');
    if (slash == std::string_view::npos) {
        if (!parse_ipv4(cidr, out.network)) return false;
        out.mask = 0xFFFFFFFFu;
        return true;
    }

    if (!parse_ipv4(cidr.substr(0, slash), out.network)) return false;

    const auto prefix_sv = cidr.substr(slash + 1);
    if (prefix_sv.empty() || prefix_sv.size() > 2) return false;
    const auto prefix = utils::parse_int<uint32_t>(prefix_sv, 33);
    if (prefix > 32) return false;

    out.mask = (prefix == 0) ? 0u : ~((1u << (32 - prefix)) - 1);
    out.network &= out.mask;
    return true;
}

ClientIdentity::ClientIdentity(Config config)
    : config_(std::move(config)) {
    proxies_.reserve(config_.trusted_proxies.size());
    for (const auto& entry : config_.trusted_proxies) {
        CidrRange range;
        if (!parse_cidr(entry, range)) {
            throw std::invalid_argument(std::format("Invalid trusted proxy entry '{}'", entry));
        }
        proxies_.push_back(range);
    }
}

bool ClientIdentity::is_trusted_proxy(std::string_view peer_addr) const {
    if (proxies_.empty()) return true;

    uint32_t peer = 0;
    if (!parse_ipv4(peer_addr, peer)) return false;
    return std::any_of(proxies_.begin(), proxies_.end(), [peer](const CidrRange& r) {
        return (peer & r.mask) == r.network;
    });
}

std::string ClientIdentity::resolve(std::string_view peer_addr,
                                    std::string_view forwarded_for) const {
    if (config_.trust_forwarded_for && !forwarded_for.empty() && is_trusted_proxy(peer_addr)) {
        // Leftmost entry is the original client
        const auto comma = forwarded_for.find(',');
        const std::string client = utils::trim(std::string(forwarded_for.substr(0, comma)));
        if (!client.empty()) {
            return client;
        }
    }
    return peer_addr.empty() ? std::string(kUnknown) : std::string(peer_addr);
}

} // namespace edgeguard
