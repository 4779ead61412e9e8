#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace edgeguard {

/**
 * @brief Resolves the rate-limiting identifier of a request.
 *
 * With trust_forwarded_for off, the peer address is used as-is. With it on,
 * the first entry of X-Forwarded-For wins, provided the peer is one of the
 * trusted proxies (an empty list trusts every peer). Only enable behind a
 * proxy that sets or strips the header: a spoofed header otherwise bypasses
 * every limit.
 */
class ClientIdentity {
public:
    static constexpr std::string_view kUnknown = "unknown";

    struct Config {
        bool trust_forwarded_for = false;
        std::vector<std::string> trusted_proxies;   // IPv4 address or CIDR
    };

    struct CidrRange {
        uint32_t network = 0;
        uint32_t mask = 0;
    };

    ClientIdentity() = default;

    /**
     * @throws std::invalid_argument if a trusted_proxies entry is not IPv4/CIDR
     */
    explicit ClientIdentity(Config config);

    [[nodiscard]] std::string resolve(std::string_view peer_addr,
                                      std::string_view forwarded_for) const;

    [[nodiscard]] bool is_trusted_proxy(std::string_view peer_addr) const;

    static bool parse_ipv4(std::string_view ip, uint32_t& out);
    static bool parse_cidr(std::string_view cidr, CidrRange& out);

private:
    Config config_;
    std::vector<CidrRange> proxies_;
};

} // namespace edgeguard
