#include "errors.hpp"
#include "../editor.hpp"
#include "../security/validator.hpp"
#include "../util.hpp"

namespace cedarmcp::mcp {

nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message,
                              const nlohmann::json& data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) error["data"] = data;
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", error}};
}

static nlohmann::json policy_suggestions(PolicyErrorKind kind) {
    switch (kind) {
        case PolicyErrorKind::RootInvalid:
            return {"Verify the root directory exists and is a directory"};
        case PolicyErrorKind::PathEscape:
            return {"Verify the path is within the project root",
                    "Avoid '..' segments and symlinks that point outside the root"};
        case PolicyErrorKind::DenylistViolation:
            return {"Check file patterns against denylist",
                    "Sensitive files (VCS metadata, secrets, keys) cannot be accessed"};
        case PolicyErrorKind::ReadOnlyViolation:
            return {"Ensure server is not in read-only mode (if writing)",
                    "Use dry_run=true to preview changes"};
        case PolicyErrorKind::SizeLimitExceeded:
            return {"Split the file or raise the server's maximum file size"};
    }
    return nlohmann::json::array();
}

static nlohmann::json execution_suggestions(const std::string& message) {
    std::string lower = to_lower(message);
    if (lower.find("file not found") != std::string::npos) {
        return {"Verify the file path is correct",
                "Check if file exists in project root",
                "Consider using CREATE command if file should be created"};
    }
    if (lower.find("marker not found") != std::string::npos) {
        return {"Re-analyze the file structure (it may have changed)",
                "Use line numbers instead of markers if structure is unstable",
                "Verify the function/class name is correct"};
    }
    return {"Re-run parse_cedarscript to validate command syntax"};
}

nlohmann::json translate_exception(const std::exception& exc, const nlohmann::json& id) {
    if (const auto* policy = dynamic_cast<const PolicyError*>(&exc)) {
        nlohmann::json data = {
            {"type", "SecurityError"},
            {"kind", policy_error_kind_name(policy->kind())},
            {"details", policy->what()},
            {"path", policy->path()},
            {"suggestions", policy_suggestions(policy->kind())}
        };
        if (policy->pattern()) data["pattern"] = *policy->pattern();
        if (policy->actual_size()) data["actual_size"] = *policy->actual_size();
        if (policy->limit()) data["limit"] = *policy->limit();
        return error_response(id, error_code::kSecurityError, "Security violation", data);
    }

    if (const auto* exec = dynamic_cast<const EditExecutionError*>(&exc)) {
        nlohmann::json data = {
            {"type", "ExecutionError"},
            {"command_index", nullptr},
            {"details", exec->what()},
            {"suggestions", execution_suggestions(exec->what())}
        };
        if (exec->command_index()) data["command_index"] = *exec->command_index();
        return error_response(id, error_code::kExecutionError,
                              "CEDARScript execution failed", data);
    }

    if (dynamic_cast<const EditParseError*>(&exc)) {
        nlohmann::json data = {
            {"type", "ParseError"},
            {"details", exc.what()},
            {"suggestions", {"Check CEDARScript syntax",
                             "Valid commands: UPDATE, CREATE, DELETE, MOVE",
                             "Use parse_cedarscript tool to validate before applying"}}
        };
        return error_response(id, error_code::kCommandParseError,
                              "CEDARScript parse error", data);
    }

    return error_response(id, error_code::kInternalError, "Internal server error",
                          {{"type", "InternalError"}, {"details", exc.what()}});
}

} // namespace cedarmcp::mcp
