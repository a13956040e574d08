// Warden UUID Unit Tests

#include <catch2/catch_test_macros.hpp>

#include "../../src/core/containers.hpp"
#include "../../src/core/uuid.hpp"

using namespace warden::core;

TEST_CASE("Uuid parsing", "[uuid]") {
    SECTION("canonical lowercase form round trips") {
        auto id = Uuid::parse("a37ee56e-3302-4a7b-b67e-ddbea64cd032");
        REQUIRE(id.has_value());
        REQUIRE(id->to_string() == "a37ee56e-3302-4a7b-b67e-ddbea64cd032");
        REQUIRE(id->bytes[0] == 0xa3);
        REQUIRE(id->bytes[15] == 0x32);
    }

    SECTION("uppercase input is accepted and printed lowercase") {
        auto id = Uuid::parse("712D9EC3-5D2B-4B13-824F-71F00191DCCA");
        REQUIRE(id.has_value());
        REQUIRE(id->to_string() == "712d9ec3-5d2b-4b13-824f-71f00191dcca");
    }

    SECTION("malformed input is rejected") {
        REQUIRE_FALSE(Uuid::parse("").has_value());
        REQUIRE_FALSE(Uuid::parse("a37ee56e33024a7bb67eddbea64cd032").has_value());
        REQUIRE_FALSE(Uuid::parse("a37ee56e-3302-4a7b-b67e-ddbea64cd03").has_value());
        REQUIRE_FALSE(Uuid::parse("g37ee56e-3302-4a7b-b67e-ddbea64cd032").has_value());
        REQUIRE_FALSE(Uuid::parse("a37ee56e_3302-4a7b-b67e-ddbea64cd032").has_value());
    }

    SECTION("uuid_or_nil falls back to nil") {
        REQUIRE(uuid_or_nil("not-a-uuid").is_nil());
        REQUIRE_FALSE(uuid_or_nil("a37ee56e-3302-4a7b-b67e-ddbea64cd032").is_nil());
    }
}

TEST_CASE("Uuid random generation", "[uuid]") {
    Uuid a = Uuid::random();
    Uuid b = Uuid::random();

    REQUIRE(a != b);
    REQUIRE_FALSE(a.is_nil());

    // Version 4, RFC 4122 variant
    REQUIRE((a.bytes[6] & 0xF0) == 0x40);
    REQUIRE((a.bytes[8] & 0xC0) == 0x80);
}

TEST_CASE("Uuid works as a fast_map key", "[uuid]") {
    fast_map<Uuid, int> map;
    Uuid a = Uuid::random();
    Uuid b = Uuid::random();

    map[a] = 1;
    map[b] = 2;

    REQUIRE(map.size() == 2);
    REQUIRE(map.at(a) == 1);
    REQUIRE(map.at(b) == 2);
    REQUIRE(map.find(Uuid{}) == map.end());
}
