#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace edgeguard::http {

inline const std::string kRetryAfterHeader = "Retry-After";
inline const std::string kRateLimitPolicyHeader = "RateLimit-Policy";
inline const std::string kRateLimitHeader = "RateLimit";
inline const std::string kContentTypeHeader = "Content-Type";
inline const std::string kJsonContentType = "application/json";

inline constexpr int kStatusOk = 200;
inline constexpr int kStatusForbidden = 403;
inline constexpr int kStatusTooManyRequests = 429;

// WebSocket close code 1008, and the payload limit of a close reason
inline constexpr uint16_t kWsPolicyViolation = 1008;
inline constexpr size_t kWsMaxCloseReasonBytes = 123;

} // namespace edgeguard::http
