#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "tools/tool_router.hpp"

namespace ent::server {

// JSON-RPC 2.0 error codes
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

constexpr const char* kProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "ent";
constexpr const char* kServerVersion = "0.1.0";

// Line-delimited JSON-RPC over a pair of streams (stdin/stdout in production).
class McpServer {
public:
    McpServer(const tools::ToolRouter& router, std::istream& in, std::ostream& out);

    // Serve until the input stream closes. Returns the process exit code.
    int run();

    // Handle one raw line. nullopt for notifications and blank lines.
    std::optional<nlohmann::json> handle_line(const std::string& line);

    // Handle one decoded message. nullopt for notifications.
    std::optional<nlohmann::json> handle_message(const nlohmann::json& message);

private:
    nlohmann::json handle_initialize(const nlohmann::json& id, const nlohmann::json& params);
    nlohmann::json handle_tools_list(const nlohmann::json& id);
    nlohmann::json handle_tools_call(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json make_response(const nlohmann::json& id, nlohmann::json result);
    static nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);

    void send(const nlohmann::json& message);

    const tools::ToolRouter& router_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace ent::server
