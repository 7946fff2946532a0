#pragma once
#include <nlohmann/json.hpp>
#include "agent/manager.hpp"
#include "tools/module.hpp"
#include "tools/tool_router.hpp"

namespace ent::tools {

// agent_spawn, agent_status, agent_list, agent_kill and agent_output
class AgentTools : public ToolModule {
public:
    explicit AgentTools(agent::AgentManager& manager) : manager_(manager) {}

    void register_tools(ToolRouter& router) override;

    ToolResult handle_spawn(const nlohmann::json& args);
    ToolResult handle_status(const nlohmann::json& args);
    ToolResult handle_list(const nlohmann::json& args);
    ToolResult handle_kill(const nlohmann::json& args);
    ToolResult handle_output(const nlohmann::json& args);

private:
    agent::AgentManager& manager_;
};

} // namespace ent::tools
