#include "server/rate_limit_response.hpp"
#include "server/http_constants.hpp"

#include <format>
#include <string_view>

namespace edgeguard {

std::string RateLimitResponse::truncate_close_reason(const std::string& reason) {
    if (reason.size() <= http::kWsMaxCloseReasonBytes) {
        return reason;
    }
    static constexpr std::string_view kEllipsis = "...";
    size_t cut = http::kWsMaxCloseReasonBytes - kEllipsis.size();
    // Back off continuation bytes (10xxxxxx) so the cut lands on a boundary
    while (cut > 0 && (static_cast<unsigned char>(reason[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return reason.substr(0, cut) + std::string(kEllipsis);
}

RateLimitResponse RateLimitResponse::from_decision(const AdmissionDecision& decision) {
    RateLimitResponse r;

    switch (decision.verdict) {
        case Verdict::ALLOWED:
            r.status = http::kStatusOk;
            if (decision.headers) {
                r.headers.emplace_back(http::kRateLimitPolicyHeader, decision.headers->policy_string());
                r.headers.emplace_back(http::kRateLimitHeader, decision.headers->status_string());
            }
            break;

        case Verdict::RATE_LIMITED: {
            const uint32_t retry = decision.retry_after_seconds;
            const PolicyHeaders exhausted{
                .limit = decision.limit,
                .window_seconds = decision.window_seconds,
                .remaining = 0,
                .reset_seconds = retry,
            };
            r.status = http::kStatusTooManyRequests;
            r.headers.emplace_back(http::kRetryAfterHeader, std::to_string(retry));
            r.headers.emplace_back(http::kRateLimitPolicyHeader, exhausted.policy_string());
            r.headers.emplace_back(http::kRateLimitHeader, exhausted.status_string());
            r.headers.emplace_back(http::kContentTypeHeader, http::kJsonContentType);
            r.body = std::format(R"({{"error":"rate_limit_exceeded","retry_after":{}}})", retry);
            r.close_code = http::kWsPolicyViolation;
            r.close_reason = truncate_close_reason(std::format("Rate limited. Retry in {}s", retry));
            break;
        }

        case Verdict::BANNED: {
            const uint32_t ttl = decision.ban_ttl_seconds;
            r.status = http::kStatusForbidden;
            r.headers.emplace_back(http::kRetryAfterHeader, std::to_string(ttl));
            r.headers.emplace_back(http::kContentTypeHeader, http::kJsonContentType);
            r.body = std::format(R"({{"error":"forbidden","retry_after":{}}})", ttl);
            r.close_code = http::kWsPolicyViolation;
            r.close_reason = truncate_close_reason(std::format("Banned for {}s", ttl));
            break;
        }
    }
    return r;
}

const std::string* RateLimitResponse::header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (key == name) return &value;
    }
    return nullptr;
}

} // namespace edgeguard
