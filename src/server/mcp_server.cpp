#include "server/mcp_server.hpp"
#include <utility>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace ent::server {

McpServer::McpServer(const tools::ToolRouter& router, std::istream& in, std::ostream& out)
    : router_(router), in_(in), out_(out) {}

int McpServer::run() {
    spdlog::info("MCP server listening on stdio ({} tools)", router_.definitions().size());

    std::string line;
    while (std::getline(in_, line)) {
        auto response = handle_line(line);
        if (response) {
            send(*response);
        }
    }

    spdlog::info("MCP input closed");
    return 0;
}

std::optional<json> McpServer::handle_line(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    json message;
    try {
        message = json::parse(line);
    } catch (const json::parse_error& e) {
        spdlog::warn("Unparseable MCP message: {}", e.what());
        return make_error(nullptr, kParseError, "JSON parse error");
    }
    return handle_message(message);
}

std::optional<json> McpServer::handle_message(const json& message) {
    if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
        json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
        return make_error(id, kInvalidRequest, "invalid request");
    }

    const std::string method = message["method"].get<std::string>();
    const bool is_notification = !message.contains("id");
    const json id = is_notification ? json(nullptr) : message["id"];
    const json params = message.contains("params") ? message["params"] : json::object();

    spdlog::debug("MCP <- {}", method);

    if (method == "initialize") {
        return handle_initialize(id, params);
    }
    if (method == "notifications/initialized") {
        return std::nullopt;
    }
    if (method == "ping") {
        return is_notification ? std::nullopt : std::optional<json>(make_response(id, json::object()));
    }
    if (method == "tools/list") {
        return handle_tools_list(id);
    }
    if (method == "tools/call") {
        return handle_tools_call(id, params);
    }

    if (is_notification) {
        return std::nullopt;
    }
    return make_error(id, kMethodNotFound, "Unknown method: " + method);
}

json McpServer::handle_initialize(const json& id, const json& params) {
    if (params.is_object() && params.contains("clientInfo") && params["clientInfo"].is_object()) {
        spdlog::info("MCP client: {}", params["clientInfo"].value("name", "unknown"));
    }
    json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {{"tools", json::object()}};
    result["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
    return make_response(id, std::move(result));
}

json McpServer::handle_tools_list(const json& id) {
    json tools = json::array();
    for (const auto& def : router_.definitions()) {
        tools.push_back(def.to_json());
    }
    return make_response(id, {{"tools", tools}});
}

json McpServer::handle_tools_call(const json& id, const json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        return make_error(id, kInvalidParams, "tools/call requires a tool name");
    }

    std::string name = params["name"].get<std::string>();
    if (!router_.has(name)) {
        return make_error(id, kInvalidParams, "Unknown tool: " + name);
    }

    json arguments = params.contains("arguments") && params["arguments"].is_object()
        ? params["arguments"]
        : json::object();

    auto result = router_.call(name, arguments);
    if (result.is_error) {
        spdlog::warn("Tool {} failed: {}", name, result.text);
    }
    return make_response(id, result.to_json());
}

json McpServer::make_response(const json& id, json result) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json McpServer::make_error(const json& id, int code, const std::string& message) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

void McpServer::send(const json& message) {
    out_ << message.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    out_.flush();
}

} // namespace ent::server
