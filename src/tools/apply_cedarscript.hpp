#pragma once
#include "../tool.hpp"

namespace cedarmcp {

// Validates the call root and every command target against the session
// policy before the engine sees the commands. Dry run by default.
class ApplyCedarscriptTool : public Tool {
public:
    ApplyCedarscriptTool(const PathValidator& validator, EditEngine& engine)
        : validator_(validator), engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "apply_cedarscript"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathValidator& validator_;
    EditEngine& engine_;
};

} // namespace cedarmcp
