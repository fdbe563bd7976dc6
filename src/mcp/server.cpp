#include "server.hpp"
#include "errors.hpp"
#include "../log.hpp"
#include "../security/validator.hpp"
#include "../util.hpp"
#include "../version.hpp"

#include <istream>
#include <ostream>

namespace cedarmcp::mcp {

static nlohmann::json result_response(const nlohmann::json& id, nlohmann::json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

static nlohmann::json error_data(const char* type, const std::string& details) {
    return {{"type", type}, {"details", details}};
}

static std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Server::Server(std::vector<std::unique_ptr<Tool>> tools) : tools_(std::move(tools)) {}

std::vector<std::string> Server::tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& t : tools_) names.push_back(t->tool_name());
    return names;
}

Tool* Server::find_tool(const std::string& name) const {
    for (const auto& t : tools_) {
        if (t->tool_name() == name) return t.get();
    }
    return nullptr;
}

std::optional<nlohmann::json> Server::handle(const nlohmann::json& message) {
    if (!message.is_object()) {
        return error_response(nullptr, error_code::kInvalidRequest,
                              "Invalid request: expected a JSON object",
                              error_data("InvalidRequest", "message is not a JSON object"));
    }

    const bool is_notification = !message.contains("id");
    const nlohmann::json id = is_notification ? nlohmann::json(nullptr) : message["id"];

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0" ||
        !message.contains("method") || !message["method"].is_string()) {
        return error_response(id, error_code::kInvalidRequest,
                              "Invalid request: missing jsonrpc 2.0 envelope or method",
                              error_data("InvalidRequest", "expected jsonrpc \"2.0\" and a method"));
    }

    const std::string method = message["method"].get<std::string>();
    const nlohmann::json params = message.contains("params") ? message["params"]
                                                             : nlohmann::json::object();

    if (method == "notifications/initialized") {
        initialized_ = true;
        log_debug("mcp", "client initialized");
        return std::nullopt;
    }
    if (is_notification) {
        // Other notifications (cancelled, progress, ...) need no reply
        log_debug("mcp", "ignoring notification " + method);
        return std::nullopt;
    }

    if (method == "initialize") return handle_initialize(id, params);
    if (method == "ping") return result_response(id, nlohmann::json::object());
    if (method == "tools/list") return handle_tools_list(id);
    if (method == "tools/call") return handle_tools_call(id, params);

    return error_response(id, error_code::kMethodNotFound, "Method not found: " + method,
                          error_data("MethodNotFound", method));
}

nlohmann::json Server::handle_initialize(const nlohmann::json& id, const nlohmann::json& params) {
    std::string version = kProtocolVersion;
    if (params.is_object() && params.contains("protocolVersion") &&
        params["protocolVersion"].is_string()) {
        version = params["protocolVersion"].get<std::string>();
    }
    log_info("mcp", "initialize (protocol " + version + ")");
    return result_response(id, {
        {"protocolVersion", version},
        {"capabilities", {{"tools", nlohmann::json::object()}}},
        {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
    });
}

nlohmann::json Server::handle_tools_list(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& t : tools_) {
        nlohmann::json schema;
        try {
            schema = nlohmann::json::parse(t->parameters_json());
        } catch (const nlohmann::json::parse_error& e) {
            log_error("mcp", "tool " + t->tool_name() + " has an invalid schema: " + e.what());
            schema = {{"type", "object"}};
        }
        tools.push_back({
            {"name", t->tool_name()},
            {"description", t->description()},
            {"inputSchema", schema}
        });
    }
    return result_response(id, {{"tools", tools}});
}

nlohmann::json Server::handle_tools_call(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return error_response(id, error_code::kInvalidParams,
                              "Invalid params: tools/call requires a tool name",
                              error_data("InvalidParams", "missing string field 'name'"));
    }
    const std::string name = params["name"].get<std::string>();

    Tool* tool = find_tool(name);
    if (!tool) {
        return error_response(id, error_code::kMethodNotFound, "Unknown tool: " + name,
                              error_data("MethodNotFound", name));
    }

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        arguments = params["arguments"];
        if (!arguments.is_object()) {
            return error_response(id, error_code::kInvalidParams,
                                  "Invalid params: arguments must be an object",
                                  error_data("InvalidParams", "arguments is not an object"));
        }
    }

    log_info("tools", name + " called");

    ToolResult result{false, ""};
    try {
        result = tool->execute(dump(arguments));
    } catch (const PolicyError& e) {
        log_warn("policy", std::string(policy_error_kind_name(e.kind())) + ": " + e.what());
        log_error("tools", name + " failed: " + e.what());
        return translate_exception(e, id);
    } catch (const std::exception& e) {
        log_error("tools", name + " failed: " + e.what());
        return translate_exception(e, id);
    }

    if (!result.success) {
        log_error("tools", name + " rejected arguments: " + result.output);
        return error_response(id, error_code::kInvalidParams, result.output,
                              error_data("InvalidParams", result.output));
    }

    nlohmann::json reply = {
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", result.output}}})},
        {"isError", false}
    };
    try {
        reply["structuredContent"] = nlohmann::json::parse(result.output);
    } catch (const nlohmann::json::parse_error&) {
        // Plain-text output; the text block already carries it
    }
    return result_response(id, std::move(reply));
}

std::optional<std::string> Server::handle_line(const std::string& line) {
    const std::string text = trim(line);
    if (text.empty()) return std::nullopt;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("mcp", std::string("malformed request: ") + e.what());
        return dump(error_response(nullptr, error_code::kParseError, "Parse error",
                                   error_data("ParseError", e.what())));
    }

    auto response = handle(message);
    if (!response) return std::nullopt;
    return dump(*response);
}

int Server::run(std::istream& in, std::ostream& out, const std::atomic<bool>& stop) {
    std::string line;
    while (!stop.load() && std::getline(in, line)) {
        auto response = handle_line(line);
        if (response) {
            out << *response << '\n';
            out.flush();
        }
    }
    log_info("mcp", stop.load() ? "shutdown requested" : "input closed");
    return 0;
}

} // namespace cedarmcp::mcp
