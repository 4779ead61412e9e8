#include "limiter/rule_matcher.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>

namespace edgeguard {

RuleMatcher::PathPattern RuleMatcher::normalize_pattern(std::string_view pattern) {
    PathPattern out;
    if (pattern.ends_with(kWildcardSuffix)) {
        out.wildcard = true;
        pattern.remove_suffix(kWildcardSuffix.size());
    }
    out.prefix = utils::strip_trailing_slashes(pattern);
    return out;
}

bool RuleMatcher::matches(std::string_view path, std::string_view pattern, bool wildcard) {
    if (!wildcard) {
        return path == pattern;
    }
    if (path == pattern) return true;
    return path.size() > pattern.size()
        && path.starts_with(pattern)
        && path[pattern.size()] == '/';
}

RuleMatcher::RuleMatcher(const std::vector<RuleSpec>& rules, const std::vector<std::string>& exempt) {
    rules_.reserve(rules.size());
    for (const auto& spec : rules) {
        const auto kind = parse_strategy_kind(spec.strategy);
        if (!kind) {
            throw std::invalid_argument(std::format(
                "Unknown strategy '{}' for rule '{}'", spec.strategy, spec.path));
        }
        if (spec.window_seconds == 0) {
            throw std::invalid_argument(std::format(
                "Rule '{}' has a zero-length window", spec.path));
        }

        auto pattern = normalize_pattern(spec.path);
        Rule rule;
        rule.path_pattern = std::move(pattern.prefix);
        rule.is_wildcard = pattern.wildcard;
        rule.limit = spec.limit;
        rule.window_seconds = spec.window_seconds;
        rule.strategy = *kind;
        rules_.emplace_back(std::move(rule));
    }

    // Wildcards first (broadest prefix first), then exact paths (longest first)
    std::stable_sort(rules_.begin(), rules_.end(), [](const Rule& a, const Rule& b) {
        if (a.is_wildcard != b.is_wildcard) return a.is_wildcard;
        if (a.is_wildcard) return a.path_pattern.size() < b.path_pattern.size();
        return a.path_pattern.size() > b.path_pattern.size();
    });

    exempt_.reserve(exempt.size());
    for (const auto& p : exempt) {
        exempt_.emplace_back(normalize_pattern(p));
    }
}

std::vector<Rule> RuleMatcher::match_rules(std::string_view path) const {
    const std::string normalized = utils::strip_trailing_slashes(path);
    std::vector<Rule> matched;
    for (const auto& rule : rules_) {
        if (matches(normalized, rule.path_pattern, rule.is_wildcard)) {
            matched.push_back(rule);
        }
    }
    return matched;
}

bool RuleMatcher::is_exempt(std::string_view path) const {
    const std::string normalized = utils::strip_trailing_slashes(path);
    return std::any_of(exempt_.begin(), exempt_.end(), [&](const PathPattern& p) {
        return matches(normalized, p.prefix, p.wildcard);
    });
}

} // namespace edgeguard
