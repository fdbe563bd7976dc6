#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace cedarmcp {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Failed to parse arguments: expected a JSON object"};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// Optional boolean with a default. Returns error ToolResult on a wrong type.
inline std::optional<ToolResult> optional_bool(const nlohmann::json& args, const char* field,
                                               bool fallback, bool& out) {
    out = fallback;
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_boolean()) {
        return ToolResult{false, std::string("Parameter must be a boolean: ") + field};
    }
    out = args[field].get<bool>();
    return std::nullopt;
}

inline ToolResult json_result(const nlohmann::json& j) {
    return ToolResult{true, j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)};
}

} // namespace cedarmcp
