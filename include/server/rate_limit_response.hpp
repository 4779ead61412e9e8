#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace edgeguard {

/**
 * @brief Transport-neutral rendering of an admission decision.
 *
 * Allowed:      200, RateLimit-Policy / RateLimit headers when a rule matched
 * RateLimited:  429, Retry-After, RateLimit headers with remaining=0
 * Banned:       403, Retry-After = ban TTL
 *
 * Denials carry a JSON body and its Content-Type.
 *
 * Stream transports that cannot carry a status code close with 1008 and
 * close_reason instead.
 */
struct RateLimitResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;               // JSON, empty when allowed
    uint16_t close_code = 0;        // 0 when allowed
    std::string close_reason;

    [[nodiscard]] static RateLimitResponse from_decision(const AdmissionDecision& decision);

    /// Cut reason to the close-frame limit without splitting a UTF-8 sequence.
    [[nodiscard]] static std::string truncate_close_reason(const std::string& reason);

    [[nodiscard]] const std::string* header(const std::string& name) const;
};

} // namespace edgeguard
