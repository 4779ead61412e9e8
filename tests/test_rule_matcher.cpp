#include <catch2/catch_test_macros.hpp>
#include "limiter/rule_matcher.hpp"

#include <stdexcept>

using namespace edgeguard;

namespace {

RuleSpec spec(std::string path, uint32_t limit, uint32_t window, std::string strategy = "fixed") {
    return RuleSpec{.path = std::move(path), .limit = limit,
                    .window_seconds = window, .strategy = std::move(strategy)};
}

} // anonymous namespace

TEST_CASE("RuleMatcher: pattern normalization", "[rule_matcher]") {
    auto p = RuleMatcher::normalize_pattern("/api/*");
    REQUIRE(p.wildcard);
    REQUIRE(p.prefix == "/api");

    p = RuleMatcher::normalize_pattern("/login/");
    REQUIRE_FALSE(p.wildcard);
    REQUIRE(p.prefix == "/login");

    p = RuleMatcher::normalize_pattern("/*");
    REQUIRE(p.wildcard);
    REQUIRE(p.prefix.empty());
}

TEST_CASE("RuleMatcher: path predicate", "[rule_matcher]") {
    SECTION("exact") {
        REQUIRE(RuleMatcher::matches("/login", "/login", false));
        REQUIRE_FALSE(RuleMatcher::matches("/login/x", "/login", false));
    }

    SECTION("wildcard matches the prefix itself and nested paths") {
        REQUIRE(RuleMatcher::matches("/api", "/api", true));
        REQUIRE(RuleMatcher::matches("/api/users", "/api", true));
        REQUIRE(RuleMatcher::matches("/api/users/7", "/api", true));
    }

    SECTION("wildcard respects segment boundaries") {
        REQUIRE_FALSE(RuleMatcher::matches("/apiary", "/api", true));
    }

    SECTION("root wildcard matches everything") {
        REQUIRE(RuleMatcher::matches("/anything", "", true));
        REQUIRE(RuleMatcher::matches("", "", true));
    }
}

TEST_CASE("RuleMatcher: multi-match", "[rule_matcher]") {
    RuleMatcher matcher({
        spec("/api/users", 5, 60),
        spec("/api/*", 100, 60, "moving"),
        spec("/login", 5, 300, "sliding"),
    }, {});

    const auto rules = matcher.match_rules("/api/users/");
    REQUIRE(rules.size() == 2);
    REQUIRE(rules[0].is_wildcard);
    REQUIRE(rules[0].path_pattern == "/api");
    REQUIRE(rules[0].strategy == StrategyKind::MOVING);
    REQUIRE(rules[1].path_pattern == "/api/users");

    REQUIRE(matcher.match_rules("/login").size() == 1);
    REQUIRE(matcher.match_rules("/login").front().strategy == StrategyKind::SLIDING_LOG);
    REQUIRE(matcher.match_rules("/other").empty());
}

TEST_CASE("RuleMatcher: exemptions", "[rule_matcher]") {
    RuleMatcher matcher({spec("/*", 10, 60)}, {"/health", "/static/*"});

    REQUIRE(matcher.is_exempt("/health"));
    REQUIRE(matcher.is_exempt("/health/"));
    REQUIRE(matcher.is_exempt("/static/app.js"));
    REQUIRE_FALSE(matcher.is_exempt("/healthz"));
    REQUIRE_FALSE(matcher.is_exempt("/login"));
}

TEST_CASE("RuleMatcher: invalid rules are rejected", "[rule_matcher]") {
    REQUIRE_THROWS_AS(RuleMatcher({spec("/x", 5, 60, "token_bucket")}, {}), std::invalid_argument);
    REQUIRE_THROWS_AS(RuleMatcher({spec("/x", 5, 0)}, {}), std::invalid_argument);
    REQUIRE_NOTHROW(RuleMatcher({spec("/x", 5, 60, "SLIDING")}, {}));
}
