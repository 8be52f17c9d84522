#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>

using namespace aiu;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\nabc\r\n") == "abc");
}

TEST_CASE("trim: empty and all-whitespace", "[util]") {
    REQUIRE(trim("").empty());
    REQUIRE(trim("   ").empty());
}

TEST_CASE("trim: inner whitespace kept", "[util]") {
    REQUIRE(trim(" a b ") == "a b");
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (!home) return;
    REQUIRE(expand_home("~/.aiu") == std::string(home) + "/.aiu");
}

TEST_CASE("expand_home: absolute path unchanged", "[util]") {
    REQUIRE(expand_home("/etc/aiu.json") == "/etc/aiu.json");
}

// ── parse_number ─────────────────────────────────────────────────

TEST_CASE("parse_number: integers and decimals", "[util]") {
    REQUIRE(parse_number("42") == 42.0);
    REQUIRE(parse_number(" 2.5 ") == 2.5);
}

TEST_CASE("parse_number: rejects trailing garbage", "[util]") {
    REQUIRE_FALSE(parse_number("12abc").has_value());
    REQUIRE_FALSE(parse_number("").has_value());
    REQUIRE_FALSE(parse_number("abc").has_value());
}

// ── epoch_seconds ────────────────────────────────────────────────

TEST_CASE("epoch_seconds: after 2020", "[util]") {
    REQUIRE(epoch_seconds() > 1577836800ULL);
}
