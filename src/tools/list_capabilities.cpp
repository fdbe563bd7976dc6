#include "list_capabilities.hpp"
#include "tool_util.hpp"
#include "../editor.hpp"
#include "../plugin.hpp"
#include "../security/validator.hpp"
#include "../version.hpp"

static cedarmcp::ToolRegistrar reg_list_capabilities("list_capabilities",
    [](cedarmcp::ToolContext& ctx) {
        return std::make_unique<cedarmcp::ListCapabilitiesTool>(ctx.validator, ctx.engine);
    });

namespace cedarmcp {

ToolResult ListCapabilitiesTool::execute(const std::string& /*args_json*/) {
    return json_result({
        {"server", kServerName},
        {"version", kServerVersion},
        {"cedarscript_editor_version", engine_.version()},
        {"features", {
            {"commands", {"UPDATE", "CREATE", "DELETE", "MOVE"}},
            {"segments", {"imports", "functions", "classes", "methods"}},
            {"actions", {"INSERT", "DELETE", "REPLACE", "MOVE"}},
            {"dry_run", true}
        }},
        {"security", {
            {"path_validation", true},
            {"read_only_mode", true},
            {"file_size_limits", true}
        }},
        {"policy", {
            {"read_only", validator_.read_only()},
            {"max_file_size", validator_.max_file_size()},
            {"denylist", validator_.denylist().patterns()}
        }}
    });
}

std::string ListCapabilitiesTool::description() const {
    return "List server capabilities: supported CEDARScript features, versions "
           "and the active security policy";
}

std::string ListCapabilitiesTool::parameters_json() const {
    return R"({"type":"object","properties":{}})";
}

} // namespace cedarmcp
