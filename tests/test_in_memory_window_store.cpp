#include <catch2/catch_test_macros.hpp>
#include "store/in_memory_window_store.hpp"
#include "core/error.hpp"
#include "store/window_scripts.hpp"
#include "mocks/manual_clock.hpp"

#include <stdexcept>

using namespace edgeguard;
using edgeguard::testing::ManualClock;

TEST_CASE("InMemoryWindowStore: counters and expiry", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store();

    SECTION("incr creates a key starting from zero") {
        int64_t first = 0, second = 0;
        store->execute([&](IStoreTransaction& tx) {
            first = tx.incr("c");
            second = tx.incr("c");
        });
        REQUIRE(first == 1);
        REQUIRE(second == 2);
    }

    SECTION("ttl reports missing, persistent and expiring keys") {
        store->execute([](IStoreTransaction& tx) {
            tx.incr("persistent");
            tx.set("flag", 1, 30);
        });
        store->execute([](IStoreTransaction& tx) {
            REQUIRE(tx.ttl("missing") == -2);
            REQUIRE(tx.ttl("persistent") == -1);
            REQUIRE(tx.ttl("flag") == 30);
        });
        clock.advance(10);
        store->execute([](IStoreTransaction& tx) {
            REQUIRE(tx.ttl("flag") == 20);
        });
    }

    SECTION("keys vanish once their expiry is reached") {
        store->execute([](IStoreTransaction& tx) { tx.set("flag", 7, 5); });
        clock.advance(5);
        store->execute([](IStoreTransaction& tx) {
            REQUIRE_FALSE(tx.get("flag").has_value());
            REQUIRE(tx.ttl("flag") == -2);
        });
    }

    SECTION("expire_at in the past deletes the key") {
        store->execute([](IStoreTransaction& tx) {
            tx.incr("c");
            tx.expire_at("c", tx.time());
            REQUIRE_FALSE(tx.get("c").has_value());
        });
    }

    SECTION("set with a non-positive ttl is rejected") {
        REQUIRE_THROWS_AS(store->execute([](IStoreTransaction& tx) { tx.set("k", 1, 0); }),
                          StoreError);
    }

    SECTION("time is the injected clock") {
        store->execute([](IStoreTransaction& tx) { REQUIRE(tx.time() == 1000); });
    }
}

TEST_CASE("InMemoryWindowStore: transactions are all-or-nothing", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store();

    store->execute([](IStoreTransaction& tx) { tx.incr("c"); });

    REQUIRE_THROWS_AS(store->execute([](IStoreTransaction& tx) {
        tx.incr("c");
        tx.hset("h", "f", 1);
        throw std::runtime_error("script failed midway");
    }), std::runtime_error);

    store->execute([](IStoreTransaction& tx) {
        REQUIRE(tx.get("c") == 1);
        REQUIRE_FALSE(tx.hget("h", "f").has_value());
    });
}

TEST_CASE("InMemoryWindowStore: type mismatch raises StoreError", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store();

    store->execute([](IStoreTransaction& tx) { tx.hset("h", "f", 1); });
    REQUIRE_THROWS_AS(store->execute([](IStoreTransaction& tx) { tx.incr("h"); }), StoreError);
    REQUIRE_THROWS_AS(store->execute([](IStoreTransaction& tx) { (void)tx.zcard("h"); }), StoreError);
}

TEST_CASE("InMemoryWindowStore: hashes", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store();

    store->execute([](IStoreTransaction& tx) {
        REQUIRE(tx.hincrby("meta", "off", 1) == 1);
        REQUIRE(tx.hincrby("meta", "off", 2) == 3);
        tx.hset("meta", "off", 0);
        REQUIRE(tx.hget("meta", "off") == 0);
        REQUIRE_FALSE(tx.hget("meta", "bc").has_value());
    });
}

TEST_CASE("InMemoryWindowStore: sorted sets", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store();

    store->execute([](IStoreTransaction& tx) {
        tx.zadd("log", 10, "a");
        tx.zadd("log", 20, "b");
        tx.zadd("log", 30, "c");
    });

    SECTION("min score and cardinality") {
        store->execute([](IStoreTransaction& tx) {
            REQUIRE(tx.zcard("log") == 3);
            REQUIRE(tx.zmin_score("log") == 10);
        });
    }

    SECTION("range removal is inclusive of max") {
        store->execute([](IStoreTransaction& tx) {
            REQUIRE(tx.zremrangebyscore("log", 20) == 2);
            REQUIRE(tx.zcard("log") == 1);
            REQUIRE(tx.zmin_score("log") == 30);
        });
    }

    SECTION("re-adding a member moves its score") {
        store->execute([](IStoreTransaction& tx) {
            tx.zadd("log", 40, "a");
            REQUIRE(tx.zcard("log") == 3);
            REQUIRE(tx.zmin_score("log") == 20);
        });
    }

    SECTION("emptied set is deleted") {
        store->execute([](IStoreTransaction& tx) {
            tx.zremrangebyscore("log", 100);
            REQUIRE(tx.ttl("log") == -2);
            REQUIRE_FALSE(tx.zmin_score("log").has_value());
        });
    }
}

TEST_CASE("InMemoryWindowStore: purge drops expired keys", "[store]") {
    ManualClock clock(1000);
    auto store = clock.make_store(2);

    store->execute([](IStoreTransaction& tx) {
        tx.set("short", 1, 5);
        tx.set("long", 1, 500);
    });
    REQUIRE(store->live_key_count() == 2);

    clock.advance(10);
    REQUIRE(store->live_key_count() == 1);

    // Second transaction triggers the periodic purge
    store->execute([](IStoreTransaction& tx) { (void)tx.time(); });
    REQUIRE(store->transaction_count() == 2);
    REQUIRE(store->live_key_count() == 1);

    clock.advance(1000);
    store->purge_expired();
    REQUIRE(store->live_key_count() == 0);
}

TEST_CASE("InMemoryWindowStore: window operations are single atomic units", "[store]") {
    ManualClock clock(1010);
    auto store = clock.make_store();

    WindowKeys keys{.rate_key = "rl:log", .ban_key = "ban:x", .meta_key = "ban:x:meta"};
    WindowArgs args;
    args.limit = 1;
    args.window_seconds = 10;
    args.bans.threshold = 1;
    args.member = "m3";

    store->execute([&](IStoreTransaction& tx) {
        tx.zadd(keys.rate_key, 1000, "m1");
        tx.zadd(keys.rate_key, 1005, "m2");
        tx.set(keys.meta_key, 1, 500);     // wrong type: offense bookkeeping fails
    });

    SECTION("failure after pruning rolls the prune back") {
        REQUIRE_THROWS_AS(store->sliding_log_hit(keys, args), StoreError);
        store->execute([&](IStoreTransaction& tx) {
            REQUIRE(tx.zcard(keys.rate_key) == 2);
            REQUIRE(tx.zmin_score(keys.rate_key) == 1000);
            REQUIRE(tx.ttl(keys.ban_key) == -2);
        });
    }

    SECTION("successful operation commits every write") {
        store->execute([&](IStoreTransaction& tx) { tx.expire(keys.meta_key, 0); });
        const auto denied = store->sliding_log_hit(keys, args);
        REQUIRE_FALSE(denied.allowed);
        REQUIRE(denied.ban_issued);
        REQUIRE(denied.server_now == 1010);
        store->execute([&](IStoreTransaction& tx) {
            REQUIRE(tx.zcard(keys.rate_key) == 1);
            REQUIRE(tx.ttl(keys.ban_key) == static_cast<int64_t>(args.bans.initial_ban_seconds));
        });
    }

    SECTION("zero window is rejected before touching state") {
        args.window_seconds = 0;
        REQUIRE_THROWS_AS(store->fixed_window_hit(keys, args), StoreError);
        REQUIRE_THROWS_AS(store->moving_window_hit(keys, args), StoreError);
        REQUIRE(store->transaction_count() == 1);
    }
}
