#pragma once
#include "../tool.hpp"
#include <atomic>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cedarmcp::mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

// Newline-delimited JSON-RPC 2.0 over a pair of streams (MCP stdio
// transport). Single-threaded: one request is answered before the next
// line is read.
class Server {
public:
    explicit Server(std::vector<std::unique_ptr<Tool>> tools);

    // Handle one decoded message. Returns nullopt for notifications.
    std::optional<nlohmann::json> handle(const nlohmann::json& message);

    // Handle one raw input line (parse errors become -32700 responses).
    std::optional<std::string> handle_line(const std::string& line);

    // Serve until EOF or until stop becomes true. Returns 0 on clean exit.
    int run(std::istream& in, std::ostream& out, const std::atomic<bool>& stop);

    bool initialized() const { return initialized_; }
    std::vector<std::string> tool_names() const;

private:
    nlohmann::json handle_initialize(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json handle_tools_list(const nlohmann::json& id) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    Tool* find_tool(const std::string& name) const;

    std::vector<std::unique_ptr<Tool>> tools_;
    bool initialized_ = false;
};

} // namespace cedarmcp::mcp
