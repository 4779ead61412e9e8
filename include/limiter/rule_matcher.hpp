#pragma once

#include "core/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace edgeguard {

/**
 * @brief A rule as written in configuration, before normalization
 */
struct RuleSpec {
    std::string path;           // "/login", "/api/*"
    uint32_t limit = 0;
    uint32_t window_seconds = 0;
    std::string strategy;       // "fixed" | "sliding" | "moving"
};

/**
 * @brief Selects the rules and exemptions that apply to a request path.
 *
 * Patterns ending in "/*" match the prefix itself and anything nested under
 * it; other patterns match exactly. Trailing '/' is ignored on both sides.
 * Every matching rule is returned (multi-match); order only affects which
 * rule the evaluator reports first.
 *
 * Immutable after construction, safe to share between threads.
 */
class RuleMatcher {
public:
    static constexpr std::string_view kWildcardSuffix = "/*";

    struct PathPattern {
        std::string prefix;
        bool wildcard = false;
    };

    RuleMatcher() = default;

    /**
     * @throws std::invalid_argument on an unknown strategy name or a zero window
     */
    RuleMatcher(const std::vector<RuleSpec>& rules, const std::vector<std::string>& exempt);

    [[nodiscard]] std::vector<Rule> match_rules(std::string_view path) const;

    [[nodiscard]] bool is_exempt(std::string_view path) const;

    [[nodiscard]] const std::vector<Rule>& rules() const { return rules_; }

    [[nodiscard]] static PathPattern normalize_pattern(std::string_view pattern);

    /// Predicate on an already normalized path.
    [[nodiscard]] static bool matches(std::string_view path, std::string_view pattern, bool wildcard);

private:
    std::vector<Rule> rules_;
    std::vector<PathPattern> exempt_;
};

} // namespace edgeguard
