#include "tools/agent_tools.hpp"
#include "agent/output_filter.hpp"
#include "tools/format.hpp"
#include <limits>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace ent::tools {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

json string_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

// String argument; empty when missing or null
std::string string_arg(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return "";
    }
    return args[key].get<std::string>();
}

std::string details_block(const json& response) {
    return "**Full Details**:\n\n```json\n" + response.dump(2) + "\n```";
}

ToolResult lookup_error(const std::string& agent_id, const agent::LookupResult& lookup) {
    if (lookup.code == agent::ErrorCode::NOT_FOUND) {
        return ToolResult::error("agent not found: " + agent_id);
    }
    return ToolResult::error("failed to get agent: " + lookup.error);
}

} // namespace

void AgentTools::register_tools(ToolRouter& router) {
    router.register_tool(
        ToolDefinition{
            "agent_spawn",
            "Spawn a background agent to execute a task asynchronously",
            {
                {"type", "object"},
                {"properties", {
                    {"task", string_property("Task description for the agent to execute")},
                    {"role", string_property("Optional: Override agent role (" + join(agent::valid_roles()) + ")")},
                    {"model", string_property("Optional: Override model selection (" + join(agent::valid_models()) + ")")},
                    {"timeout", {{"type", "integer"}, {"minimum", 1},
                                 {"description", "Optional: Maximum execution duration in seconds"}}}
                }},
                {"required", json::array({"task"})}
            }
        },
        [this](const json& args) { return handle_spawn(args); });

    router.register_tool(
        ToolDefinition{
            "agent_status",
            "Check the status, progress, and output of a specific background agent",
            {
                {"type", "object"},
                {"properties", {{"agent_id", string_property("ID of the agent to check")}}},
                {"required", json::array({"agent_id"})}
            }
        },
        [this](const json& args) { return handle_status(args); });

    router.register_tool(
        ToolDefinition{
            "agent_list",
            "List all background agents with optional status filtering",
            {
                {"type", "object"},
                {"properties", {
                    {"status", {
                        {"type", "string"},
                        {"description", "Filter by agent status. Valid values: " + join(agent::valid_statuses()) +
                                        ". Leave empty to list all agents."},
                        {"enum", agent::valid_statuses()}
                    }}
                }}
            }
        },
        [this](const json& args) { return handle_list(args); });

    router.register_tool(
        ToolDefinition{
            "agent_kill",
            "Terminate a running background agent",
            {
                {"type", "object"},
                {"properties", {{"agent_id", string_property("ID of the agent to terminate")}}},
                {"required", json::array({"agent_id"})}
            }
        },
        [this](const json& args) { return handle_kill(args); });

    router.register_tool(
        ToolDefinition{
            "agent_output",
            "Retrieve the output of a background agent with optional regex filtering",
            {
                {"type", "object"},
                {"properties", {
                    {"agent_id", string_property("ID of the agent to retrieve output from")},
                    {"filter_pattern", string_property(
                        "Optional: Regex pattern to filter output lines (e.g., 'ERROR:.*', '(?i)warn')")}
                }},
                {"required", json::array({"agent_id"})}
            }
        },
        [this](const json& args) { return handle_output(args); });
}

ToolResult AgentTools::handle_spawn(const json& args) {
    try {
        std::string task = string_arg(args, "task");
        if (task.empty()) {
            return ToolResult::error("task is required");
        }

        agent::SpawnOptions opts;
        opts.role = string_arg(args, "role");
        opts.model = string_arg(args, "model");
        for (const char* key : {"timeout", "timeout_seconds"}) {
            if (args.contains(key) && !args[key].is_null()) {
                auto timeout = agent::json_int(args[key]);
                if (!timeout || *timeout <= 0) {
                    return ToolResult::error(std::string(key) + " must be a positive integer no larger than " +
                                             std::to_string(std::numeric_limits<int>::max()));
                }
                opts.timeout_seconds = *timeout;
                break;
            }
        }

        auto spawned = manager_.spawn(task, opts);
        if (!spawned.success) {
            return ToolResult::error("failed to spawn agent: " + spawned.error);
        }

        auto snap = spawned.agent->snapshot();
        const char* role = agent::agent_role_to_string(snap.role);
        const char* model = agent::agent_model_to_string(snap.model);

        json response;
        response["agent_id"] = snap.id;
        response["role"] = role;
        response["model"] = model;
        response["task"] = snap.task;
        response["status"] = agent::agent_status_to_string(snap.status);
        response["created_at"] = format_iso8601(snap.created_at);
        response["message"] = "Agent " + snap.id + " spawned successfully with role " + role + " and model " + model;

        std::ostringstream msg;
        msg << "✅ Background Agent Spawned\n\n"
            << "**Next Steps:**\n"
            << "- Agent ID: `" << snap.id << "`\n"
            << "- Status: " << agent::agent_status_to_string(snap.status) << "\n"
            << "- Role: " << role << "\n"
            << "- Model: " << model << "\n"
            << "\nUse `agent_status` or `agent_list` to monitor progress.\n\n"
            << details_block(response);

        ToolResult result;
        result.structured = std::move(response);
        result.text = msg.str();
        return result;

    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid request: ") + e.what());
    }
}

ToolResult AgentTools::handle_status(const json& args) {
    try {
        std::string agent_id = string_arg(args, "agent_id");
        if (agent_id.empty()) {
            return ToolResult::error("agent_id is required");
        }

        auto lookup = manager_.get(agent_id);
        if (!lookup.success) {
            return lookup_error(agent_id, lookup);
        }

        auto snap = lookup.agent->snapshot();
        json response = snapshot_to_json(snap);

        std::ostringstream msg;
        msg << "# Background Agent Status " << status_icon(snap.status) << "\n\n"
            << "**Agent ID**: `" << snap.id << "`\n\n"
            << "**Status**: " << agent::agent_status_to_string(snap.status) << "\n"
            << "**Role**: " << agent::agent_role_to_string(snap.role) << "\n"
            << "**Model**: " << agent::agent_model_to_string(snap.model) << "\n"
            << "**Duration**: " << format_duration(snap.duration()) << "\n\n"
            << "## Task\n\n" << snap.task << "\n\n"
            << "## Timeline\n\n"
            << "- **Created**: " << format_timestamp(snap.created_at) << "\n";
        if (snap.started_at) {
            msg << "- **Started**: " << format_timestamp(*snap.started_at) << "\n";
        }
        if (snap.finished_at) {
            msg << "- **Completed**: " << format_timestamp(*snap.finished_at) << "\n";
        }
        msg << "\n";
        if (!snap.output.empty()) {
            msg << "## Output\n\n```\n" << snap.output << "\n```\n\n";
        }
        if (!snap.failure_reason.empty()) {
            msg << "## Error\n\n```\n" << snap.failure_reason << "\n```\n\n";
        }
        msg << "---\n\n" << details_block(response);

        ToolResult result;
        result.structured = std::move(response);
        result.text = msg.str();
        return result;

    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid request: ") + e.what());
    }
}

ToolResult AgentTools::handle_list(const json& args) {
    try {
        std::string status_filter = string_arg(args, "status");
        std::optional<agent::AgentStatus> status;
        if (!status_filter.empty()) {
            status = agent::agent_status_from_string(status_filter);
            if (!status) {
                return ToolResult::error("invalid status '" + status_filter + "'. Valid values: " +
                                         join(agent::valid_statuses()));
            }
        }

        auto snapshots = manager_.list(status);

        json response;
        response["agents"] = json::array();
        for (const auto& snap : snapshots) {
            response["agents"].push_back(snapshot_to_json(snap));
        }
        response["total_count"] = snapshots.size();
        if (status) {
            response["status_filter"] = status_filter;
            response["counts"] = {{status_filter, snapshots.size()}};
        } else {
            auto stats = manager_.stats();
            response["counts"] = {
                {"pending", stats.pending},
                {"running", stats.running},
                {"completed", stats.completed},
                {"failed", stats.failed},
                {"killed", stats.killed}
            };
        }

        std::ostringstream msg;
        msg << "# Background Agents\n\n";
        if (status) {
            msg << "Showing " << snapshots.size() << " agent(s) with status: **" << status_filter << "**\n\n";
        } else {
            msg << "Showing " << snapshots.size() << " total agent(s)\n\n";
        }

        msg << "## Summary\n\n";
        for (const auto& item : response["counts"].items()) {
            msg << "- **" << item.key() << "**: " << item.value().get<size_t>() << "\n";
        }
        msg << "\n";

        if (snapshots.empty()) {
            msg << "No agents found.\n\n";
        } else {
            msg << "## Agents\n\n";
            for (const auto& snap : snapshots) {
                msg << "### " << status_icon(snap.status) << " " << snap.id << "\n\n"
                    << "- **Status**: " << agent::agent_status_to_string(snap.status) << "\n"
                    << "- **Role**: " << agent::agent_role_to_string(snap.role) << "\n"
                    << "- **Model**: " << agent::agent_model_to_string(snap.model) << "\n"
                    << "- **Duration**: " << format_duration(snap.duration()) << "\n"
                    << "- **Created**: " << format_iso8601(snap.created_at) << "\n";
                if (snap.started_at) {
                    msg << "- **Started**: " << format_iso8601(*snap.started_at) << "\n";
                }
                if (snap.finished_at) {
                    msg << "- **Completed**: " << format_iso8601(*snap.finished_at) << "\n";
                }
                msg << "\n**Task**:\n" << snap.task << "\n\n";
                if (!snap.failure_reason.empty()) {
                    msg << "**Error**:\n```\n" << snap.failure_reason << "\n```\n\n";
                }
                msg << "---\n\n";
            }
        }
        msg << details_block(response);

        ToolResult result;
        result.structured = std::move(response);
        result.text = msg.str();
        return result;

    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid request: ") + e.what());
    }
}

ToolResult AgentTools::handle_kill(const json& args) {
    try {
        std::string agent_id = string_arg(args, "agent_id");
        if (agent_id.empty()) {
            return ToolResult::error("agent_id is required");
        }

        auto killed = manager_.kill(agent_id);
        if (!killed.success) {
            if (killed.code == agent::ErrorCode::NOT_FOUND) {
                return ToolResult::error("agent not found: " + agent_id);
            }
            return ToolResult::error("failed to kill agent: " + killed.error);
        }

        const auto& snap = killed.snapshot;
        const char* status = agent::agent_status_to_string(snap.status);

        json response;
        response["agent_id"] = snap.id;
        response["role"] = agent::agent_role_to_string(snap.role);
        response["model"] = agent::agent_model_to_string(snap.model);
        response["task"] = snap.task;
        response["status"] = status;
        response["message"] = killed.sealed
            ? "Agent " + snap.id + " terminated successfully"
            : "Agent " + snap.id + " already " + status;

        std::ostringstream msg;
        msg << "🛑 Background Agent Terminated\n\n"
            << "**Agent ID**: `" << snap.id << "`\n\n"
            << "**Status**: " << status << "\n"
            << "**Role**: " << agent::agent_role_to_string(snap.role) << "\n"
            << "**Model**: " << agent::agent_model_to_string(snap.model) << "\n"
            << "**Task**: " << snap.task << "\n\n"
            << "---\n\n" << details_block(response);

        ToolResult result;
        result.structured = std::move(response);
        result.text = msg.str();
        return result;

    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid request: ") + e.what());
    }
}

ToolResult AgentTools::handle_output(const json& args) {
    try {
        std::string agent_id = string_arg(args, "agent_id");
        if (agent_id.empty()) {
            return ToolResult::error("agent_id is required");
        }
        std::string pattern = string_arg(args, "filter_pattern");

        auto lookup = manager_.get(agent_id);
        if (!lookup.success) {
            return lookup_error(agent_id, lookup);
        }

        auto snap = lookup.agent->snapshot();
        auto filtered = agent::filter_output(snap, pattern);
        if (!filtered.success) {
            return ToolResult::error("failed to filter output: " + filtered.error);
        }

        json response;
        response["agent_id"] = snap.id;
        response["status"] = agent::agent_status_to_string(snap.status);
        response["filter"] = pattern;
        response["output"] = filtered.output;

        std::ostringstream msg;
        msg << "# Agent Output " << status_icon(snap.status) << "\n\n"
            << "**Agent ID**: `" << snap.id << "`\n\n"
            << "**Status**: " << agent::agent_status_to_string(snap.status) << "\n";
        if (!pattern.empty()) {
            msg << "**Filter Pattern**: `" << pattern << "`\n\n";
        } else {
            msg << "\n";
        }
        msg << "## Output\n\n";
        if (filtered.output.empty()) {
            msg << (snap.status == agent::AgentStatus::RUNNING
                        ? "Agent is still running. No output captured yet.\n\n"
                        : "No output available.\n\n");
        } else {
            msg << "```\n";
            if (!pattern.empty()) {
                msg << "(Filtered output)\n\n";
            }
            msg << filtered.output << "\n```\n\n";
        }
        msg << "---\n\n" << details_block(response);

        ToolResult result;
        result.structured = std::move(response);
        result.text = msg.str();
        return result;

    } catch (const json::exception& e) {
        return ToolResult::error(std::string("invalid request: ") + e.what());
    }
}

} // namespace ent::tools
