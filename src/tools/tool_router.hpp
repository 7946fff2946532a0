#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace ent::tools {

// Outcome of one tool call: structured fields plus a rendered summary
struct ToolResult {
    bool is_error = false;
    nlohmann::json structured = nlohmann::json::object();
    std::string text;

    // MCP CallToolResult shape
    nlohmann::json to_json() const;

    static ToolResult error(const std::string& message);
};

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;

    nlohmann::json to_json() const;
};

// Centralized tool dispatch table.
class ToolRouter {
public:
    using Handler = std::function<ToolResult(const nlohmann::json& arguments)>;

    ToolRouter() = default;

    void register_tool(ToolDefinition definition, Handler handler);

    ToolResult call(const std::string& name, const nlohmann::json& arguments) const;
    bool has(const std::string& name) const;

    // Definitions in registration order
    const std::vector<ToolDefinition>& definitions() const { return definitions_; }

private:
    std::vector<ToolDefinition> definitions_;
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace ent::tools
