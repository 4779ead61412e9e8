#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace edgeguard {

// ============================================================================
// Strategy Kinds
// ============================================================================

enum class StrategyKind {
    FIXED,          // Epoch-aligned counter, reset every window
    SLIDING_LOG,    // One timestamp per admitted request
    MOVING          // Two adjacent buckets with linear weighting
};

/// Storage tag written into every rate key; never derived from class names.
[[nodiscard]] inline constexpr const char* strategy_kind_tag(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::FIXED:       return "fixed";
        case StrategyKind::SLIDING_LOG: return "sliding";
        case StrategyKind::MOVING:      return "moving";
    }
    return "unknown";
}

/// Case-insensitive lookup of a configured strategy name.
[[nodiscard]] inline std::optional<StrategyKind> parse_strategy_kind(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (const char c : name) {
        lower += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    if (lower == "fixed")   return StrategyKind::FIXED;
    if (lower == "sliding") return StrategyKind::SLIDING_LOG;
    if (lower == "moving")  return StrategyKind::MOVING;
    return std::nullopt;
}

// ============================================================================
// Rules
// ============================================================================

/**
 * @brief Normalized rate rule. Immutable after configuration load.
 *
 * path_pattern holds the exact path, or the prefix when is_wildcard is set,
 * with trailing '/' already stripped.
 */
struct Rule {
    std::string path_pattern;
    bool is_wildcard = false;
    uint32_t limit = 0;
    uint32_t window_seconds = 0;
    StrategyKind strategy = StrategyKind::FIXED;

    bool operator==(const Rule&) const = default;
};

/**
 * @brief Ban escalation knobs shared by every strategy
 */
struct BanPolicy {
    bool enabled = true;
    uint32_t threshold = 8;                 // offenses before a ban fires
    uint32_t initial_ban_seconds = 300;
    uint32_t max_ban_seconds = 1800;
    uint32_t decay_window_seconds = 3600;   // inactivity before escalation resets
    bool site_wide = true;                  // one ban key per identifier
};

// ============================================================================
// Strategy Results
// ============================================================================

/**
 * @brief Outcome of one atomic hit against a window
 *
 * reset_at and server_now are absolute Unix seconds read from the store clock.
 * ban_ttl > 0 means the identifier is banned (either already, or by this hit);
 * ban_issued tells the two apart.
 */
struct HitResult {
    bool allowed = false;
    uint32_t remaining = 0;
    int64_t reset_at = 0;
    uint32_t ban_ttl = 0;
    int64_t server_now = 0;
    bool ban_issued = false;
};

// ============================================================================
// Admission Decisions
// ============================================================================

/**
 * @brief Data behind the RateLimit-Policy / RateLimit response headers
 */
struct PolicyHeaders {
    uint32_t limit = 0;
    uint32_t window_seconds = 0;
    uint32_t remaining = 0;
    uint32_t reset_seconds = 0;

    [[nodiscard]] std::string policy_string() const {
        return std::format("{};w={}", limit, window_seconds);
    }

    [[nodiscard]] std::string status_string() const {
        return std::format("limit={}, remaining={}, reset={}", limit, remaining, reset_seconds);
    }
};

enum class Verdict {
    ALLOWED,
    RATE_LIMITED,
    BANNED
};

[[nodiscard]] inline constexpr const char* verdict_to_string(Verdict v) {
    switch (v) {
        case Verdict::ALLOWED:      return "allowed";
        case Verdict::RATE_LIMITED: return "rate_limited";
        case Verdict::BANNED:       return "banned";
    }
    return "unknown";
}

struct AdmissionDecision {
    Verdict verdict = Verdict::ALLOWED;

    // ALLOWED: most restrictive passing rule (absent when no rule matched)
    std::optional<PolicyHeaders> headers;

    // RATE_LIMITED
    uint32_t retry_after_seconds = 0;
    uint32_t limit = 0;
    uint32_t window_seconds = 0;

    // BANNED
    uint32_t ban_ttl_seconds = 0;

    static AdmissionDecision allowed(std::optional<PolicyHeaders> h = std::nullopt) {
        AdmissionDecision d;
        d.verdict = Verdict::ALLOWED;
        d.headers = std::move(h);
        return d;
    }

    static AdmissionDecision rate_limited(uint32_t retry_after, uint32_t limit, uint32_t window) {
        AdmissionDecision d;
        d.verdict = Verdict::RATE_LIMITED;
        d.retry_after_seconds = retry_after;
        d.limit = limit;
        d.window_seconds = window;
        return d;
    }

    static AdmissionDecision banned(uint32_t ttl) {
        AdmissionDecision d;
        d.verdict = Verdict::BANNED;
        d.ban_ttl_seconds = ttl;
        return d;
    }

    [[nodiscard]] bool is_allowed() const { return verdict == Verdict::ALLOWED; }
};

} // namespace edgeguard
