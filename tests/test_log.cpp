#include <catch2/catch_test_macros.hpp>
#include "log.hpp"
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace cedarmcp;

// RAII guard: captures std::cerr and restores the previous logger settings
struct LogCapture {
    std::ostringstream buffer;
    std::streambuf* old_buf;
    LogLevel old_level;

    LogCapture() : old_buf(std::cerr.rdbuf(buffer.rdbuf())), old_level(log_level()) {}

    ~LogCapture() {
        std::cerr.rdbuf(old_buf);
        log_init(old_level, LogFormat::Text);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;
};

// ── Level and format parsing ────────────────────────────────────

TEST_CASE("parse_log_level: known names, any case", "[log]") {
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("info") == LogLevel::Info);
    REQUIRE(parse_log_level("Warning") == LogLevel::Warning);
    REQUIRE(parse_log_level("WARN") == LogLevel::Warning);
    REQUIRE(parse_log_level(" error ") == LogLevel::Error);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE_FALSE(parse_log_level("").has_value());
}

TEST_CASE("parse_log_format: text and json", "[log]") {
    REQUIRE(parse_log_format("text") == LogFormat::Text);
    REQUIRE(parse_log_format("JSON") == LogFormat::Json);
    REQUIRE_FALSE(parse_log_format("xml").has_value());
}

TEST_CASE("log_level_name: canonical spelling", "[log]") {
    REQUIRE(std::string(log_level_name(LogLevel::Debug)) == "DEBUG");
    REQUIRE(std::string(log_level_name(LogLevel::Warning)) == "WARNING");
}

// ── Formatting ──────────────────────────────────────────────────

TEST_CASE("format_log_line: text layout", "[log]") {
    auto line = format_log_line(LogLevel::Warning, LogFormat::Text, "policy", "denied");
    REQUIRE(line.front() == '[');
    REQUIRE(line.find("] WARNING [policy] denied") != std::string::npos);
}

TEST_CASE("format_log_line: json record", "[log]") {
    auto line = format_log_line(LogLevel::Error, LogFormat::Json, "tools", "failed \"x\"");
    auto j = nlohmann::json::parse(line);
    REQUIRE(j["level"] == "ERROR");
    REQUIRE(j["tag"] == "tools");
    REQUIRE(j["message"] == "failed \"x\"");
    REQUIRE(j["timestamp"].is_string());
}

TEST_CASE("format_log_line: invalid UTF-8 does not throw", "[log]") {
    std::string bad = "path \xff\xfe";
    REQUIRE_NOTHROW(format_log_line(LogLevel::Info, LogFormat::Json, "x", bad));
}

// ── Sink ────────────────────────────────────────────────────────

TEST_CASE("log_write: records below the threshold are dropped", "[log]") {
    LogCapture cap;
    log_init(LogLevel::Warning, LogFormat::Text);

    log_debug("t", "debug message");
    log_info("t", "info message");
    log_warn("t", "warn message");
    log_error("t", "error message");

    auto out = cap.buffer.str();
    REQUIRE(out.find("debug message") == std::string::npos);
    REQUIRE(out.find("info message") == std::string::npos);
    REQUIRE(out.find("WARNING [t] warn message") != std::string::npos);
    REQUIRE(out.find("ERROR [t] error message") != std::string::npos);
}

TEST_CASE("log_write: json format emits one object per line", "[log]") {
    LogCapture cap;
    log_init(LogLevel::Debug, LogFormat::Json);

    log_debug("mcp", "first");
    log_info("mcp", "second");

    std::istringstream lines(cap.buffer.str());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        auto j = nlohmann::json::parse(line);
        REQUIRE(j["tag"] == "mcp");
        count++;
    }
    REQUIRE(count == 2);
}
