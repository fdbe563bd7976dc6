#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace cedarmcp {

using ToolFactory = std::function<std::unique_ptr<Tool>(ToolContext& ctx)>;

// Central registry for self-registering tools.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_tool(const std::string& name, ToolFactory factory);

    // Throws std::invalid_argument for an unknown name
    std::unique_ptr<Tool> create_tool(const std::string& name, ToolContext& ctx) const;

    // Sorted by name
    std::vector<std::unique_ptr<Tool>> create_all_tools(ToolContext& ctx) const;

    std::vector<std::string> tool_names() const;
    bool has_tool(const std::string& name) const;

    // Testing support
    void unregister_tool(const std::string& name);

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFactory> tools_;
};

// ── Self-registrar helper (used at file scope in each tool .cpp) ──

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

} // namespace cedarmcp
