#include <catch2/catch_test_macros.hpp>
#include "config.hpp"
#include "temp_project.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace cedarmcp;

static const char* kEnvVars[] = {
    "CEDARSCRIPT_ROOT", "CEDARSCRIPT_READ_ONLY", "CEDARSCRIPT_MAX_FILE_SIZE",
    "CEDARSCRIPT_DENYLIST", "CEDARSCRIPT_LOG_LEVEL", "CEDARSCRIPT_LOG_FORMAT",
    "CEDARSCRIPT_EDITOR", "CEDARSCRIPT_EDITOR_TIMEOUT_MS"
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* name : kEnvVars) unsetenv(name);
    }

    ~ConfigTestGuard() {
        for (const char* name : kEnvVars) unsetenv(name);
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.cedarmcp/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.cedarmcp");
        std::ofstream f(config_path());
        f << content;
    }
};

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.root.empty());
    REQUIRE_FALSE(cfg.read_only);
    REQUIRE(cfg.max_file_size == 10485760);
    REQUIRE_FALSE(cfg.denylist.has_value());
    REQUIRE(cfg.log_level == "INFO");
    REQUIRE(cfg.log_format == "text");
    REQUIRE(cfg.editor_command == "cedarscript-editor");
    REQUIRE(cfg.editor_timeout_ms == 30000);
}

TEST_CASE("Config::defaults_json: round-trips through apply_json", "[config]") {
    Config cfg;
    cfg.apply_json(Config::defaults_json());
    REQUIRE(cfg.max_file_size == 10485760);
    REQUIRE(cfg.editor_timeout_ms == 30000);
    REQUIRE_FALSE(cfg.denylist.has_value());
}

TEST_CASE("Config::default_config_path: lives under HOME", "[config]") {
    ConfigTestGuard g;
    REQUIRE(Config::default_config_path() == g.config_path());
}

// ── Config::load ────────────────────────────────────────────────

TEST_CASE("Config::load: missing config file uses defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.root.empty());
    REQUIRE_FALSE(cfg.read_only);
    REQUIRE(cfg.max_file_size == 10485760);
    REQUIRE_FALSE(cfg.denylist.has_value());
}

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "root": "/srv/project",
        "read_only": true,
        "max_file_size": 2048,
        "denylist": ["*.tmp", "cache/**"],
        "log_level": "DEBUG",
        "log_format": "json",
        "editor_command": "python3 -m cedarscript_editor",
        "editor_timeout_ms": 5000
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.root == "/srv/project");
    REQUIRE(cfg.read_only);
    REQUIRE(cfg.max_file_size == 2048);
    REQUIRE(cfg.denylist == std::vector<std::string>{"*.tmp", "cache/**"});
    REQUIRE(cfg.log_level == "DEBUG");
    REQUIRE(cfg.log_format == "json");
    REQUIRE(cfg.editor_command == "python3 -m cedarscript_editor");
    REQUIRE(cfg.editor_timeout_ms == 5000);
}

TEST_CASE("Config::load: empty denylist in file disables the defaults", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"denylist": []})");
    Config cfg = Config::load();
    REQUIRE(cfg.denylist.has_value());
    REQUIRE(cfg.denylist->empty());
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"root": "/from/file", "read_only": false, "max_file_size": 100})");

    setenv("CEDARSCRIPT_ROOT", "/from/env", 1);
    setenv("CEDARSCRIPT_READ_ONLY", "yes", 1);
    setenv("CEDARSCRIPT_MAX_FILE_SIZE", "4096", 1);
    setenv("CEDARSCRIPT_DENYLIST", " *.log , secrets/** ,", 1);
    setenv("CEDARSCRIPT_EDITOR_TIMEOUT_MS", "750", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.root == "/from/env");
    REQUIRE(cfg.read_only);
    REQUIRE(cfg.max_file_size == 4096);
    REQUIRE(cfg.denylist == std::vector<std::string>{"*.log", "secrets/**"});
    REQUIRE(cfg.editor_timeout_ms == 750);
}

TEST_CASE("Config::load: explicit path is used instead of HOME", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"root": "/from/home"})");
    auto other = g.dir + "/other.json";
    {
        std::ofstream f(other);
        f << R"({"root": "/from/explicit"})";
    }
    Config cfg = Config::load(other);
    REQUIRE(cfg.root == "/from/explicit");
}

TEST_CASE("Config::load: explicit missing file is an error", "[config]") {
    ConfigTestGuard g;
    REQUIRE_THROWS_AS(Config::load(g.dir + "/nope.json"), std::runtime_error);
}

TEST_CASE("Config::load: malformed JSON is an error", "[config]") {
    ConfigTestGuard g;
    g.write_config("not valid json {{{");
    try {
        Config::load();
        FAIL("expected runtime_error");
    } catch (const std::runtime_error& e) {
        REQUIRE(std::string(e.what()).find("Malformed config file") != std::string::npos);
    }
}

TEST_CASE("Config::load: wrong types are rejected", "[config]") {
    ConfigTestGuard g;

    g.write_config(R"({"max_file_size": -5})");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);

    g.write_config(R"({"max_file_size": 0})");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);

    g.write_config(R"({"read_only": "true"})");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);

    g.write_config(R"({"denylist": "*.env"})");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);

    g.write_config(R"({"denylist": ["ok", 3]})");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);

    g.write_config(R"(["not", "an", "object"])");
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);
}

TEST_CASE("Config::load: invalid env values are rejected", "[config]") {
    ConfigTestGuard g;

    setenv("CEDARSCRIPT_READ_ONLY", "maybe", 1);
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);
    unsetenv("CEDARSCRIPT_READ_ONLY");

    setenv("CEDARSCRIPT_MAX_FILE_SIZE", "10MB", 1);
    REQUIRE_THROWS_AS(Config::load(), std::invalid_argument);
    unsetenv("CEDARSCRIPT_MAX_FILE_SIZE");
}

TEST_CASE("Config::load: unknown keys are ignored", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"future_option": 1, "root": "/x"})");
    REQUIRE(Config::load().root == "/x");
}

// ── effective_root ──────────────────────────────────────────────

TEST_CASE("Config::effective_root: falls back to the working directory", "[config]") {
    Config cfg;
    REQUIRE(cfg.effective_root() == std::filesystem::current_path().string());
}

TEST_CASE("Config::effective_root: expands home", "[config]") {
    ConfigTestGuard g;
    Config cfg;
    cfg.root = "~/work";
    REQUIRE(cfg.effective_root() == g.dir + "/work");
}

// ── Setting parsers ─────────────────────────────────────────────

TEST_CASE("parse_bool_setting: accepted spellings", "[config]") {
    REQUIRE(parse_bool_setting("true", "x"));
    REQUIRE(parse_bool_setting("TRUE", "x"));
    REQUIRE(parse_bool_setting("1", "x"));
    REQUIRE(parse_bool_setting(" yes ", "x"));
    REQUIRE_FALSE(parse_bool_setting("false", "x"));
    REQUIRE_FALSE(parse_bool_setting("0", "x"));
    REQUIRE_FALSE(parse_bool_setting("No", "x"));
    REQUIRE_FALSE(parse_bool_setting("", "x"));
    REQUIRE_THROWS_AS(parse_bool_setting("on", "x"), std::invalid_argument);
}

TEST_CASE("parse_positive_setting: digits only, non-zero", "[config]") {
    REQUIRE(parse_positive_setting("10485760", "x") == 10485760);
    REQUIRE(parse_positive_setting(" 42 ", "x") == 42);
    REQUIRE_THROWS_AS(parse_positive_setting("0", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_positive_setting("-1", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_positive_setting("1.5", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_positive_setting("", "x"), std::invalid_argument);
    REQUIRE_THROWS_AS(parse_positive_setting("99999999999999999999999", "--max-file-size"),
                      std::invalid_argument);
}
