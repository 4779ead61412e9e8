#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"

using namespace edgeguard;

TEST_CASE("parse_duration: units", "[duration]") {
    REQUIRE(utils::parse_duration("30") == 30);
    REQUIRE(utils::parse_duration("45s") == 45);
    REQUIRE(utils::parse_duration("5m") == 300);
    REQUIRE(utils::parse_duration("2h") == 7200);
    REQUIRE(utils::parse_duration("1d") == 86400);
    REQUIRE(utils::parse_duration(" 10M ") == 600);
}

TEST_CASE("parse_duration: lenient input", "[duration]") {
    SECTION("no digits means one unit") {
        REQUIRE(utils::parse_duration("h") == 3600);
        REQUIRE(utils::parse_duration("m") == 60);
        REQUIRE(utils::parse_duration("abc") == 1);
    }

    SECTION("empty and blank strings behave like any digit-free input") {
        REQUIRE(utils::parse_duration("") == 1);
        REQUIRE(utils::parse_duration("   ") == 1);
        REQUIRE(utils::parse_duration("") == utils::parse_duration("abc"));
    }

    SECTION("unit is picked by presence, days first") {
        REQUIRE(utils::parse_duration("1 hour and a day") == 86400);
        REQUIRE(utils::parse_duration("15min") == 900);
    }
}
