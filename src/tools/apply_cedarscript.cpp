#include "apply_cedarscript.hpp"
#include "tool_util.hpp"
#include "../editor.hpp"
#include "../log.hpp"
#include "../plugin.hpp"
#include "../security/validator.hpp"

static cedarmcp::ToolRegistrar reg_apply_cedarscript("apply_cedarscript",
    [](cedarmcp::ToolContext& ctx) {
        return std::make_unique<cedarmcp::ApplyCedarscriptTool>(ctx.validator, ctx.engine);
    });

namespace cedarmcp {

ToolResult ApplyCedarscriptTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "commands")) return *err;
    if (auto err = require_string(args, "root")) return *err;
    bool dry_run = true;
    if (auto err = optional_bool(args, "dry_run", true, dry_run)) return *err;

    const std::string commands = args["commands"].get<std::string>();
    const AccessIntent intent = dry_run ? AccessIntent::Read : AccessIntent::Write;

    // The per-call root must exist and sit inside the session root. Write
    // intent here also turns a read-only session away before parsing.
    auto call_root = validator_.validate_root(args["root"].get<std::string>());
    call_root = validator_.validate_path(call_root.string(), intent);

    auto parsed = engine_.parse(commands);

    nlohmann::json files = nlohmann::json::array();
    for (const auto& cmd : parsed) {
        for (const auto& target : cmd.targets) {
            std::filesystem::path t(target);
            auto joined = t.is_absolute() ? t : call_root / t;
            auto validated = validator_.validate_path(joined.string(), intent);
            files.push_back(validated.string());
        }
    }

    nlohmann::json serialized = nlohmann::json::array();
    for (const auto& cmd : parsed) {
        serialized.push_back(serialize_command(cmd));
    }

    if (dry_run) {
        return json_result({
            {"success", true},
            {"dry_run", true},
            {"preview", {
                {"command_count", parsed.size()},
                {"commands", serialized},
                {"files", files}
            }}
        });
    }

    log_info("apply", "applying " + std::to_string(parsed.size()) + " command(s) under " +
             call_root.string());
    auto results = engine_.apply(call_root, commands);
    return json_result({
        {"success", true},
        {"dry_run", false},
        {"command_count", parsed.size()},
        {"files", files},
        {"results", results}
    });
}

std::string ApplyCedarscriptTool::description() const {
    return "Apply CEDARScript transformations to files under a project root. "
           "Runs as a dry run (preview only) unless dry_run is false.";
}

std::string ApplyCedarscriptTool::parameters_json() const {
    return R"json({"type":"object","properties":{"commands":{"type":"string","description":"CEDARScript commands to apply"},"root":{"type":"string","description":"Project root directory (must lie inside the server root)"},"dry_run":{"type":"boolean","description":"Preview changes without writing","default":true}},"required":["commands","root"]})json";
}

} // namespace cedarmcp
