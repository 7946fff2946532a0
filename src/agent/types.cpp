#include "agent/types.hpp"

namespace ent::agent {

const char* agent_role_to_string(AgentRole role) {
    switch (role) {
        case AgentRole::ARCHITECT: return "architect";
        case AgentRole::SENIOR:    return "senior";
        case AgentRole::DEVELOPER: return "developer";
        case AgentRole::OPS:       return "ops";
        case AgentRole::REVIEWER:  return "reviewer";
        default: return "unknown";
    }
}

std::optional<AgentRole> agent_role_from_string(const std::string& str) {
    if (str == "architect") return AgentRole::ARCHITECT;
    if (str == "senior")    return AgentRole::SENIOR;
    if (str == "developer") return AgentRole::DEVELOPER;
    if (str == "ops")       return AgentRole::OPS;
    if (str == "reviewer")  return AgentRole::REVIEWER;
    return std::nullopt;
}

const char* agent_model_to_string(AgentModel model) {
    switch (model) {
        case AgentModel::OPUS:   return "opus";
        case AgentModel::SONNET: return "sonnet";
        case AgentModel::HAIKU:  return "haiku";
        default: return "unknown";
    }
}

std::optional<AgentModel> agent_model_from_string(const std::string& str) {
    if (str == "opus")   return AgentModel::OPUS;
    if (str == "sonnet") return AgentModel::SONNET;
    if (str == "haiku")  return AgentModel::HAIKU;
    return std::nullopt;
}

const char* agent_status_to_string(AgentStatus status) {
    switch (status) {
        case AgentStatus::PENDING:   return "pending";
        case AgentStatus::RUNNING:   return "running";
        case AgentStatus::COMPLETED: return "completed";
        case AgentStatus::FAILED:    return "failed";
        case AgentStatus::KILLED:    return "killed";
        default: return "unknown";
    }
}

std::optional<AgentStatus> agent_status_from_string(const std::string& str) {
    if (str == "pending")   return AgentStatus::PENDING;
    if (str == "running")   return AgentStatus::RUNNING;
    if (str == "completed") return AgentStatus::COMPLETED;
    if (str == "failed")    return AgentStatus::FAILED;
    if (str == "killed")    return AgentStatus::KILLED;
    return std::nullopt;
}

bool is_terminal(AgentStatus status) {
    return status == AgentStatus::COMPLETED ||
           status == AgentStatus::FAILED ||
           status == AgentStatus::KILLED;
}

const std::vector<std::string>& valid_roles() {
    static const std::vector<std::string> roles = {
        "architect", "senior", "developer", "ops", "reviewer"
    };
    return roles;
}

const std::vector<std::string>& valid_models() {
    static const std::vector<std::string> models = {"opus", "sonnet", "haiku"};
    return models;
}

const std::vector<std::string>& valid_statuses() {
    static const std::vector<std::string> statuses = {
        "pending", "running", "completed", "failed", "killed"
    };
    return statuses;
}

std::chrono::milliseconds Snapshot::duration() const {
    if (!started_at) {
        return std::chrono::milliseconds(0);
    }
    auto end = finished_at ? *finished_at : Clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - *started_at);
    return elapsed.count() < 0 ? std::chrono::milliseconds(0) : elapsed;
}

} // namespace ent::agent
