#include <catch2/catch_test_macros.hpp>
#include "limiter/window_strategy.hpp"
#include "limiter/ban_state_machine.hpp"
#include "limiter/key_space.hpp"
#include "store/window_scripts.hpp"
#include "mocks/failing_window_store.hpp"
#include "mocks/manual_clock.hpp"

#include <optional>

using namespace edgeguard;
using edgeguard::testing::FailingWindowStore;
using edgeguard::testing::ManualClock;

namespace {

BanPolicy no_bans() {
    BanPolicy p;
    p.enabled = false;
    return p;
}

HitResult must_hit(WindowStrategy& s, const std::string& id, uint32_t limit, uint32_t window) {
    auto r = s.hit(id, limit, window);
    REQUIRE(r.is_ok());
    return r.value();
}

} // anonymous namespace

TEST_CASE("FixedWindow: counts up to the limit", "[fixed_window]") {
    ManualClock clock(6000);
    FixedWindowStrategy fixed(clock.make_store(), no_bans());

    for (uint32_t expected = 4; ; --expected) {
        const auto h = must_hit(fixed, "1.1.1.1", 5, 60);
        REQUIRE(h.allowed);
        REQUIRE(h.remaining == expected);
        REQUIRE(h.reset_at == 6060);
        REQUIRE(h.server_now == 6000);
        REQUIRE(h.ban_ttl == 0);
        if (expected == 0) break;
    }

    const auto denied = must_hit(fixed, "1.1.1.1", 5, 60);
    REQUIRE_FALSE(denied.allowed);
    REQUIRE(denied.remaining == 0);
    REQUIRE(denied.reset_at == 6060);

    // Other identifiers have their own counters
    REQUIRE(must_hit(fixed, "2.2.2.2", 5, 60).allowed);

    const auto stats = fixed.get_stats();
    REQUIRE(stats.hits == 7);
    REQUIRE(stats.denials == 1);
}

TEST_CASE("FixedWindow: denied hits do not consume quota", "[fixed_window]") {
    ManualClock clock(6000);
    auto store = clock.make_store();
    FixedWindowStrategy fixed(store, no_bans());

    for (int i = 0; i < 8; ++i) {
        (void)must_hit(fixed, "id", 3, 60);
    }

    const auto key = scripts::fixed_bucket_key(
        KeySpace::rate_key("id", StrategyKind::FIXED, 3, 60), 60, 6000);
    store->execute([&](IStoreTransaction& tx) {
        REQUIRE(tx.get(key) == 3);
        REQUIRE(tx.ttl(key) == 60);
    });
}

TEST_CASE("FixedWindow: windows are epoch aligned", "[fixed_window]") {
    ManualClock clock(6059);
    FixedWindowStrategy fixed(clock.make_store(), no_bans());

    for (int i = 0; i < 5; ++i) {
        const auto h = must_hit(fixed, "id", 5, 60);
        REQUIRE(h.allowed);
        REQUIRE(h.reset_at == 6060);
    }
    REQUIRE_FALSE(must_hit(fixed, "id", 5, 60).allowed);

    // Boundary burst: a fresh window opens one second later
    clock.set(6060);
    for (int i = 0; i < 5; ++i) {
        const auto h = must_hit(fixed, "id", 5, 60);
        REQUIRE(h.allowed);
        REQUIRE(h.reset_at == 6120);
    }
    REQUIRE_FALSE(must_hit(fixed, "id", 5, 60).allowed);
}

TEST_CASE("FixedWindow: active ban takes precedence over counting", "[fixed_window]") {
    ManualClock clock(6000);
    auto store = clock.make_store();
    BanPolicy policy;
    policy.threshold = 1;
    policy.initial_ban_seconds = 300;
    policy.max_ban_seconds = 1800;
    FixedWindowStrategy fixed(store, policy);

    REQUIRE(must_hit(fixed, "id", 1, 60).allowed);

    const auto offense = must_hit(fixed, "id", 1, 60);
    REQUIRE_FALSE(offense.allowed);
    REQUIRE(offense.ban_ttl == 300);

    clock.advance(100);   // next window, counter would have room again
    const auto banned = must_hit(fixed, "id", 1, 60);
    REQUIRE_FALSE(banned.allowed);
    REQUIRE(banned.ban_ttl == 200);
    REQUIRE(banned.reset_at == 6120);

    const auto key = scripts::fixed_bucket_key(
        KeySpace::rate_key("id", StrategyKind::FIXED, 1, 60), 60, 6100);
    store->execute([&](IStoreTransaction& tx) {
        REQUIRE_FALSE(tx.get(key).has_value());
    });

    clock.advance(200);
    REQUIRE(must_hit(fixed, "id", 1, 60).allowed);

    const auto stats = fixed.get_stats();
    REQUIRE(stats.bans_issued == 1);
    REQUIRE(stats.banned_hits == 1);
}

TEST_CASE("FixedWindow: banned hit in the same window leaves all state untouched", "[fixed_window][bans]") {
    ManualClock clock(6000);
    auto store = clock.make_store();
    BanPolicy policy;
    policy.threshold = 2;
    policy.initial_ban_seconds = 300;
    FixedWindowStrategy fixed(store, policy);

    REQUIRE(must_hit(fixed, "id", 2, 60).allowed);
    REQUIRE(must_hit(fixed, "id", 2, 60).allowed);
    REQUIRE(must_hit(fixed, "id", 2, 60).ban_ttl == 0);     // first offense
    clock.advance(5);
    const auto offense = must_hit(fixed, "id", 2, 60);
    REQUIRE(offense.ban_ttl == 300);

    const auto bucket = scripts::fixed_bucket_key(
        KeySpace::rate_key("id", StrategyKind::FIXED, 2, 60), 60, 6005);
    const auto ban = KeySpace::ban_key("id", "", true);
    const auto meta = KeySpace::meta_key(ban);

    struct Snapshot {
        std::optional<int64_t> count;
        int64_t count_ttl = 0;
        std::optional<int64_t> offenses;
        std::optional<int64_t> bans;
        int64_t meta_ttl = 0;
        int64_t ban_ttl = 0;
    };
    const auto snapshot = [&] {
        Snapshot s;
        store->execute([&](IStoreTransaction& tx) {
            s.count = tx.get(bucket);
            s.count_ttl = tx.ttl(bucket);
            s.offenses = tx.hget(meta, BanStateMachine::kOffenseField);
            s.bans = tx.hget(meta, BanStateMachine::kBanCountField);
            s.meta_ttl = tx.ttl(meta);
            s.ban_ttl = tx.ttl(ban);
        });
        return s;
    };

    const auto before = snapshot();
    REQUIRE(before.count == 2);
    REQUIRE(before.offenses == 0);
    REQUIRE(before.bans == 1);

    // Still inside the window the offense happened in
    clock.advance(10);
    const auto banned = must_hit(fixed, "id", 2, 60);
    REQUIRE_FALSE(banned.allowed);
    REQUIRE_FALSE(banned.ban_issued);
    REQUIRE(banned.ban_ttl == 290);
    REQUIRE(banned.reset_at == 6060);

    const auto after = snapshot();
    REQUIRE(after.count == before.count);
    REQUIRE(after.count_ttl == before.count_ttl - 10);
    REQUIRE(after.offenses == before.offenses);
    REQUIRE(after.bans == before.bans);
    REQUIRE(after.meta_ttl == before.meta_ttl - 10);
    REQUIRE(after.ban_ttl == before.ban_ttl - 10);
}

TEST_CASE("FixedWindow: store failure is reported, not swallowed", "[fixed_window]") {
    auto store = std::make_shared<FailingWindowStore>();
    FixedWindowStrategy fixed(store, BanPolicy{});

    const auto r = fixed.hit("id", 5, 60);
    REQUIRE(r.is_error());
    REQUIRE(r.error_category() == ErrorCategory::STORE_UNAVAILABLE);
    REQUIRE(r.error_message() == "connection refused");
    REQUIRE(fixed.get_stats().store_errors == 1);
    REQUIRE(store->attempts() == 1);
}

TEST_CASE("FixedWindow: zero window is a configuration error", "[fixed_window]") {
    ManualClock clock(6000);
    FixedWindowStrategy fixed(clock.make_store(), BanPolicy{});

    const auto r = fixed.hit("id", 5, 0);
    REQUIRE(r.is_error());
    REQUIRE(r.error_category() == ErrorCategory::CONFIG_ERROR);
}
