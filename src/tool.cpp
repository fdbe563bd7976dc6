#include "tool.hpp"
#include "plugin.hpp"

namespace cedarmcp {

std::vector<std::unique_ptr<Tool>> create_builtin_tools(ToolContext& ctx) {
    return PluginRegistry::instance().create_all_tools(ctx);
}

} // namespace cedarmcp
