#include "tools/tool_router.hpp"
#include <exception>
#include <utility>
#include <spdlog/spdlog.h>

namespace ent::tools {

nlohmann::json ToolResult::to_json() const {
    nlohmann::json j;
    j["content"] = nlohmann::json::array();
    j["content"].push_back({{"type", "text"}, {"text", text}});
    if (!is_error && !structured.empty()) {
        j["structuredContent"] = structured;
    }
    j["isError"] = is_error;
    return j;
}

ToolResult ToolResult::error(const std::string& message) {
    ToolResult result;
    result.is_error = true;
    result.structured = {{"error", message}};
    result.text = "Error: " + message;
    return result;
}

nlohmann::json ToolDefinition::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

void ToolRouter::register_tool(ToolDefinition definition, Handler handler) {
    auto name = definition.name;
    auto existing = handlers_.find(name);
    if (existing != handlers_.end()) {
        spdlog::warn("Tool {} registered twice, replacing handler", name);
        existing->second = std::move(handler);
        return;
    }
    definitions_.push_back(std::move(definition));
    handlers_.emplace(std::move(name), std::move(handler));
}

ToolResult ToolRouter::call(const std::string& name, const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        spdlog::warn("Unknown tool: {}", name);
        return ToolResult::error("tool '" + name + "' not found");
    }

    spdlog::debug("[tool] start name={} args={}", name, arguments.dump());
    ToolResult result;
    try {
        result = it->second(arguments);
    } catch (const std::exception& e) {
        spdlog::error("[tool] {} threw: {}", name, e.what());
        return ToolResult::error("tool '" + name + "' failed: " + e.what());
    }
    spdlog::debug("[tool] end name={} error={} size={}", name, result.is_error, result.text.size());
    return result;
}

bool ToolRouter::has(const std::string& name) const {
    return handlers_.find(name) != handlers_.end();
}

} // namespace ent::tools
