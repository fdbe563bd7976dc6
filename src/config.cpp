#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace cedarmcp {

nlohmann::json Config::defaults_json() {
    return {
        {"root", ""},
        {"read_only", false},
        {"max_file_size", uint64_t{10 * 1024 * 1024}},
        {"log_level", "INFO"},
        {"log_format", "text"},
        {"editor_command", "cedarscript-editor"},
        {"editor_timeout_ms", uint32_t{30000}}
    };
}

std::string Config::default_config_path() {
    return expand_home("~/.cedarmcp/config.json");
}

bool parse_bool_setting(const std::string& value, const std::string& source) {
    std::string v = to_lower(trim(value));
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no" || v.empty()) return false;
    throw std::invalid_argument(source + ": expected true or false, got '" + value + "'");
}

uint64_t parse_positive_setting(const std::string& value, const std::string& source) {
    std::string v = trim(value);
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument(source + ": expected a positive integer, got '" +
                                    value + "'");
    }
    uint64_t parsed = 0;
    try {
        parsed = std::stoull(v);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(source + ": value out of range: " + value);
    }
    if (parsed == 0) {
        throw std::invalid_argument(source + ": must be greater than zero");
    }
    return parsed;
}

static uint64_t json_positive(const nlohmann::json& j, const char* key) {
    const auto& v = j[key];
    if (!v.is_number_unsigned() || v.get<uint64_t>() == 0) {
        throw std::invalid_argument(std::string("config: '") + key +
                                    "' must be a positive integer");
    }
    return v.get<uint64_t>();
}

static std::string json_string(const nlohmann::json& j, const char* key) {
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string("config: '") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

void Config::apply_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("config: top level must be a JSON object");
    }

    if (j.contains("root"))
        root = json_string(j, "root");
    if (j.contains("read_only")) {
        if (!j["read_only"].is_boolean())
            throw std::invalid_argument("config: 'read_only' must be a boolean");
        read_only = j["read_only"].get<bool>();
    }
    if (j.contains("max_file_size"))
        max_file_size = json_positive(j, "max_file_size");
    if (j.contains("denylist")) {
        const auto& list = j["denylist"];
        if (!list.is_array())
            throw std::invalid_argument("config: 'denylist' must be an array of strings");
        std::vector<std::string> patterns;
        for (const auto& p : list) {
            if (!p.is_string())
                throw std::invalid_argument("config: 'denylist' must be an array of strings");
            patterns.push_back(p.get<std::string>());
        }
        denylist = std::move(patterns);
    }
    if (j.contains("log_level"))
        log_level = json_string(j, "log_level");
    if (j.contains("log_format"))
        log_format = json_string(j, "log_format");
    if (j.contains("editor_command"))
        editor_command = json_string(j, "editor_command");
    if (j.contains("editor_timeout_ms")) {
        uint64_t ms = json_positive(j, "editor_timeout_ms");
        if (ms > std::numeric_limits<uint32_t>::max())
            throw std::invalid_argument("config: 'editor_timeout_ms' out of range");
        editor_timeout_ms = static_cast<uint32_t>(ms);
    }
}

void Config::apply_env() {
    if (const char* v = std::getenv("CEDARSCRIPT_ROOT"))
        root = v;
    if (const char* v = std::getenv("CEDARSCRIPT_READ_ONLY"))
        read_only = parse_bool_setting(v, "CEDARSCRIPT_READ_ONLY");
    if (const char* v = std::getenv("CEDARSCRIPT_MAX_FILE_SIZE"))
        max_file_size = parse_positive_setting(v, "CEDARSCRIPT_MAX_FILE_SIZE");
    if (const char* v = std::getenv("CEDARSCRIPT_DENYLIST")) {
        std::vector<std::string> patterns;
        for (const auto& p : split(v, ',')) {
            std::string t = trim(p);
            if (!t.empty()) patterns.push_back(t);
        }
        denylist = std::move(patterns);
    }
    if (const char* v = std::getenv("CEDARSCRIPT_LOG_LEVEL"))
        log_level = v;
    if (const char* v = std::getenv("CEDARSCRIPT_LOG_FORMAT"))
        log_format = v;
    if (const char* v = std::getenv("CEDARSCRIPT_EDITOR"))
        editor_command = v;
    if (const char* v = std::getenv("CEDARSCRIPT_EDITOR_TIMEOUT_MS")) {
        uint64_t ms = parse_positive_setting(v, "CEDARSCRIPT_EDITOR_TIMEOUT_MS");
        if (ms > std::numeric_limits<uint32_t>::max())
            throw std::invalid_argument("CEDARSCRIPT_EDITOR_TIMEOUT_MS: value out of range");
        editor_timeout_ms = static_cast<uint32_t>(ms);
    }
}

Config Config::load(const std::string& config_path) {
    Config cfg;
    cfg.apply_json(defaults_json());

    bool explicit_path = !config_path.empty();
    std::string path = explicit_path ? expand_home(config_path) : default_config_path();

    std::ifstream file(path);
    if (file.is_open()) {
        nlohmann::json j;
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("Malformed config file " + path + ": " + e.what());
        }
        cfg.apply_json(j);
    } else if (explicit_path) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    cfg.apply_env();
    return cfg;
}

std::string Config::effective_root() const {
    if (!root.empty()) return expand_home(root);
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        throw std::runtime_error("Cannot determine working directory: " + ec.message());
    }
    return cwd.string();
}

} // namespace cedarmcp
