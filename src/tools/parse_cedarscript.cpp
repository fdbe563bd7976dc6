#include "parse_cedarscript.hpp"
#include "tool_util.hpp"
#include "../editor.hpp"
#include "../plugin.hpp"

static cedarmcp::ToolRegistrar reg_parse_cedarscript("parse_cedarscript",
    [](cedarmcp::ToolContext& ctx) {
        return std::make_unique<cedarmcp::ParseCedarscriptTool>(ctx.engine);
    });

namespace cedarmcp {

ToolResult ParseCedarscriptTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "content")) return *err;

    auto parsed = engine_.parse(args["content"].get<std::string>());

    nlohmann::json commands = nlohmann::json::array();
    for (const auto& cmd : parsed) {
        commands.push_back(serialize_command(cmd));
    }
    return json_result({
        {"success", true},
        {"count", parsed.size()},
        {"commands", commands}
    });
}

std::string ParseCedarscriptTool::description() const {
    return "Parse and validate CEDARScript commands without executing them. "
           "Returns the parsed commands and the files each one would touch.";
}

std::string ParseCedarscriptTool::parameters_json() const {
    return R"({"type":"object","properties":{"content":{"type":"string","description":"CEDARScript commands to parse"}},"required":["content"]})";
}

} // namespace cedarmcp
