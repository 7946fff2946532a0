#include "agent/selector.hpp"
#include <algorithm>
#include <cctype>
#include <vector>

namespace ent::agent {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains_any(const std::string& text, const std::vector<std::string>& keywords) {
    for (const auto& kw : keywords) {
        if (text.find(kw) != std::string::npos) {
            return true;
        }
    }
    return false;
}

const std::vector<std::string> kCriticalKeywords = {
    "critical", "important", "decision", "approve", "security",
    "breaking", "delete", "remove", "dangerous", "production"
};

const std::vector<std::string> kComplexityKeywords = {
    "implement", "refactor", "optimize", "design", "architect",
    "solve", "debug", "write", "create", "build", "integrate",
    "migrate", "transform", "restructure"
};

const std::vector<std::string> kExplorationKeywords = {
    "explore", "analyze", "find", "search", "list", "check",
    "investigate", "read", "view", "examine", "review", "inspect"
};

} // namespace

const char* task_class_to_string(TaskClass task_class) {
    switch (task_class) {
        case TaskClass::EXPLORATION: return "exploration";
        case TaskClass::COMPLEXITY:  return "complexity";
        case TaskClass::CRITICAL:    return "critical";
        default: return "unknown";
    }
}

TaskClass classify_task(const std::string& task) {
    auto lower = to_lower(task);
    if (contains_any(lower, kCriticalKeywords)) {
        return TaskClass::CRITICAL;
    }
    if (contains_any(lower, kComplexityKeywords)) {
        return TaskClass::COMPLEXITY;
    }
    if (contains_any(lower, kExplorationKeywords)) {
        return TaskClass::EXPLORATION;
    }
    return TaskClass::EXPLORATION;
}

SelectionResult KeywordSelector::select(const SelectionRequest& request, const ManagerConfig& config) {
    SelectionResult result;
    if (request.task.empty()) {
        result.code = ErrorCode::VALIDATION;
        result.error = "task required";
        return result;
    }

    auto lower = to_lower(request.task);
    TaskClass task_class = classify_task(request.task);

    AgentRole role = config.default_role;
    AgentModel model = config.default_model;
    switch (task_class) {
        case TaskClass::CRITICAL:
            role = AgentRole::SENIOR;
            model = config.model_tier.critical;
            break;
        case TaskClass::COMPLEXITY:
            role = (lower.find("architect") != std::string::npos || lower.find("design") != std::string::npos)
                ? AgentRole::ARCHITECT
                : AgentRole::DEVELOPER;
            model = config.model_tier.complexity;
            break;
        case TaskClass::EXPLORATION:
            if (lower.find("review") != std::string::npos) {
                role = AgentRole::REVIEWER;
            }
            model = config.model_tier.exploration;
            break;
    }

    result.success = true;
    result.role = request.role.value_or(role);
    result.model = request.model.value_or(model);
    result.reason = std::string("task_class=") + task_class_to_string(task_class);
    return result;
}

} // namespace ent::agent
