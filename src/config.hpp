#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cedarmcp {

struct Config {
    std::string root;                  // empty = current directory
    bool read_only = false;
    uint64_t max_file_size = 10 * 1024 * 1024;
    std::optional<std::vector<std::string>> denylist;  // nullopt = built-in list

    std::string log_level = "INFO";
    std::string log_format = "text";

    std::string editor_command = "cedarscript-editor";
    uint32_t editor_timeout_ms = 30000;

    // Defaults, then the config file, then CEDARSCRIPT_* env vars.
    // config_path empty = ~/.cedarmcp/config.json, silently skipped if absent.
    // Throws std::invalid_argument / std::runtime_error on bad input.
    static Config load(const std::string& config_path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    static std::string default_config_path();

    // Overlay recognised keys from a parsed config object.
    void apply_json(const nlohmann::json& j);

    // Overlay CEDARSCRIPT_* environment variables.
    void apply_env();

    // root, or the current directory when unset
    std::string effective_root() const;
};

// "true"/"false"/"1"/"0"/"yes"/"no", case-insensitive
bool parse_bool_setting(const std::string& value, const std::string& source);

// Positive decimal integer
uint64_t parse_positive_setting(const std::string& value, const std::string& source);

} // namespace cedarmcp
