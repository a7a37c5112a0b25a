#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include "http.hpp"
#include <cstdlib>

using namespace guidctl;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── is_upper_hex ─────────────────────────────────────────────────

TEST_CASE("is_upper_hex: digits and A-F", "[util]") {
    REQUIRE(is_upper_hex("0123456789ABCDEF"));
}

TEST_CASE("is_upper_hex: rejects lower case, other letters and empty", "[util]") {
    REQUIRE_FALSE(is_upper_hex("abc"));
    REQUIRE_FALSE(is_upper_hex("ABG"));
    REQUIRE_FALSE(is_upper_hex("AB CD"));
    REQUIRE_FALSE(is_upper_hex(""));
}

// ── is_integer ───────────────────────────────────────────────────

TEST_CASE("is_integer: signed and unsigned digits", "[util]") {
    REQUIRE(is_integer("0"));
    REQUIRE(is_integer("2000000000"));
    REQUIRE(is_integer("-12"));
    REQUIRE(is_integer("+12"));
}

TEST_CASE("is_integer: rejects everything else", "[util]") {
    REQUIRE_FALSE(is_integer(""));
    REQUIRE_FALSE(is_integer("-"));
    REQUIRE_FALSE(is_integer("1.5"));
    REQUIRE_FALSE(is_integer("12a"));
}

// ── epoch_seconds ────────────────────────────────────────────────

TEST_CASE("epoch_seconds: after 2023", "[util]") {
    REQUIRE(epoch_seconds() > 1672531200);
}

// ── expand_home ──────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    if (home) {
        REQUIRE(expand_home("~/.guidctl") == std::string(home) + "/.guidctl");
    }
    REQUIRE(expand_home("/abs/path") == "/abs/path");
}

// ── URL helpers ──────────────────────────────────────────────────

TEST_CASE("url_scheme: text before ://", "[util][http]") {
    REQUIRE(url_scheme("https://a.example/x") == "https");
    REQUIRE(url_scheme("mock://test.net") == "mock");
    REQUIRE(url_scheme("test.net/guid").empty());
}

TEST_CASE("url_path: path with query, or /", "[util][http]") {
    REQUIRE(url_path("mock://test.net/guid/AB") == "/guid/AB");
    REQUIRE(url_path("https://h:8443/guid?x=1") == "/guid?x=1");
    REQUIRE(url_path("https://h") == "/");
}

TEST_CASE("default_reason: common codes", "[util][http]") {
    REQUIRE(default_reason(200) == "OK");
    REQUIRE(default_reason(404) == "Not Found");
    REQUIRE(default_reason(503) == "Service Unavailable");
    REQUIRE(default_reason(299).empty());
}
