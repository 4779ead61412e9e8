#include "limiter/key_space.hpp"
#include "core/utils.hpp"

#include <openssl/evp.h>

#include <format>
#include <stdexcept>

namespace edgeguard {

std::string KeySpace::sha256_hex(std::string_view data, size_t hex_chars) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(),
                   digest, &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    std::string hex = utils::bytes_to_hex(digest, digest_len);
    hex.resize(hex_chars);
    return hex;
}

std::string KeySpace::hash_identifier(std::string_view identifier) {
    return sha256_hex(identifier, kDigestHexChars);
}

std::string KeySpace::rate_key(std::string_view identifier, StrategyKind kind,
                               uint32_t limit, uint32_t window_seconds) {
    return std::format("rl:{}:{}:{}:{}",
        strategy_kind_tag(kind), hash_identifier(identifier), limit, window_seconds);
}

std::string KeySpace::rate_key(std::string_view identifier, const Rule& rule) {
    const std::string pattern = rule.is_wildcard
        ? rule.path_pattern + "/*"
        : rule.path_pattern;
    return std::format("{}:{}",
        rate_key(identifier, rule.strategy, rule.limit, rule.window_seconds),
        sha256_hex(pattern, kScopeHexChars));
}

std::string KeySpace::ban_key(std::string_view identifier, std::string_view rule_key, bool site_wide) {
    if (site_wide) {
        return std::format("ban:{}", hash_identifier(identifier));
    }
    return std::format("{}:ban", rule_key);
}

std::string KeySpace::meta_key(std::string_view key) {
    return std::format("{}:meta", key);
}

} // namespace edgeguard
