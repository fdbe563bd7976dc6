#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <cstdlib>
#include <string>

using namespace cedarmcp;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: strips leading and trailing whitespace", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
    REQUIRE(trim("\t\nhello\r\n") == "hello");
}

TEST_CASE("trim: keeps inner whitespace", "[util]") {
    REQUIRE(trim(" a b ") == "a b");
}

TEST_CASE("trim: empty and all-whitespace", "[util]") {
    REQUIRE(trim("").empty());
    REQUIRE(trim("   ").empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: splits on delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("split: keeps empty inner fields", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: no delimiter returns whole string", "[util]") {
    REQUIRE(split("abc", ',') == std::vector<std::string>{"abc"});
}

// ── split_whitespace ────────────────────────────────────────────

TEST_CASE("split_whitespace: collapses runs", "[util]") {
    auto parts = split_whitespace("  python3 \t -m  editor\n");
    REQUIRE(parts == std::vector<std::string>{"python3", "-m", "editor"});
}

TEST_CASE("split_whitespace: blank input yields nothing", "[util]") {
    REQUIRE(split_whitespace("   ").empty());
}

// ── case conversion ─────────────────────────────────────────────

TEST_CASE("to_lower / to_upper", "[util]") {
    REQUIRE(to_lower("MiXeD 123") == "mixed 123");
    REQUIRE(to_upper("warn") == "WARN");
}

// ── timestamp_now ───────────────────────────────────────────────

TEST_CASE("timestamp_now: ISO 8601 UTC shape", "[util]") {
    auto ts = timestamp_now();
    REQUIRE(ts.size() == 20);
    REQUIRE(ts[4] == '-');
    REQUIRE(ts[10] == 'T');
    REQUIRE(ts.back() == 'Z');
}

// ── expand_home ─────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/x/y") == std::string(home) + "/x/y");
}

TEST_CASE("expand_home: other paths unchanged", "[util]") {
    REQUIRE(expand_home("/abs/path") == "/abs/path");
    REQUIRE(expand_home("rel/~path") == "rel/~path");
    REQUIRE(expand_home("").empty());
}
