#pragma once
#include "../tool.hpp"

namespace cedarmcp {

class ListCapabilitiesTool : public Tool {
public:
    ListCapabilitiesTool(const PathValidator& validator, EditEngine& engine)
        : validator_(validator), engine_(engine) {}

    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "list_capabilities"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    const PathValidator& validator_;
    EditEngine& engine_;
};

} // namespace cedarmcp
