#pragma once
#include <string>
#include <memory>
#include <vector>

namespace cedarmcp {

class PathValidator;
class EditEngine;

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

// success == false means the arguments were unusable; output holds the
// reason. Policy and engine failures are thrown instead so the transport
// can map them to their own error codes.
struct ToolResult {
    bool success;
    std::string output; // JSON text on success
};

// Session-wide collaborators handed to every tool at construction.
struct ToolContext {
    const PathValidator& validator;
    EditEngine& engine;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Create every registered tool bound to ctx
std::vector<std::unique_ptr<Tool>> create_builtin_tools(ToolContext& ctx);

} // namespace cedarmcp
