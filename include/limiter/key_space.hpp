#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace edgeguard {

/**
 * @brief Derives store keys for a (identifier, rule) pair.
 *
 * Identifiers never reach the store in plaintext: they are SHA-256 digested
 * and truncated to kDigestHexChars hex characters.
 *
 * Layout:
 *   rate key (rule)   rl:<tag>:<digest>:<limit>:<window>:<scope>
 *   rate key (bare)   rl:<tag>:<digest>:<limit>:<window>
 *   ban (site)        ban:<digest>
 *   ban (per rule)    <rate key>:ban
 *   meta              <key>:meta
 *
 * <scope> is a short digest of the normalized path pattern (the root pattern
 * "" included), so two rules with equal numbers never share counters, and no
 * rule shares them with a bare limit/window hit.
 */
class KeySpace {
public:
    static constexpr size_t kDigestHexChars = 16;
    static constexpr size_t kScopeHexChars = 8;

    [[nodiscard]] static std::string hash_identifier(std::string_view identifier);

    [[nodiscard]] static std::string rate_key(std::string_view identifier, const Rule& rule);

    /// Key of a hit that is not tied to any configured rule.
    [[nodiscard]] static std::string rate_key(std::string_view identifier, StrategyKind kind,
                                              uint32_t limit, uint32_t window_seconds);

    [[nodiscard]] static std::string ban_key(std::string_view identifier,
                                             std::string_view rule_key,
                                             bool site_wide);

    [[nodiscard]] static std::string meta_key(std::string_view key);

private:
    [[nodiscard]] static std::string sha256_hex(std::string_view data, size_t hex_chars);
};

} // namespace edgeguard
