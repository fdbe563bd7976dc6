#pragma once
#include <exception>
#include <string>
#include <nlohmann/json.hpp>

namespace cedarmcp::mcp {

// JSON-RPC error codes
namespace error_code {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;

// Application errors
constexpr int kSecurityError = -32001;
constexpr int kCommandParseError = -32002;
constexpr int kExecutionError = -32003;
} // namespace error_code

nlohmann::json error_response(const nlohmann::json& id, int code, const std::string& message,
                              const nlohmann::json& data = nullptr);

// Map an exception raised while serving a request to a JSON-RPC error
// response. PolicyError, EditParseError and EditExecutionError get their
// own codes; everything else is an internal error.
nlohmann::json translate_exception(const std::exception& exc, const nlohmann::json& id);

} // namespace cedarmcp::mcp
