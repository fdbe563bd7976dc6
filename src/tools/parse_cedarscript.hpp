#pragma once
#include "../tool.hpp"

namespace cedarmcp {

// Syntax check only; nothing on disk is touched.
class ParseCedarscriptTool : public Tool {
public:
    explicit ParseCedarscriptTool(EditEngine& engine) : engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "parse_cedarscript"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    EditEngine& engine_;
};

} // namespace cedarmcp
