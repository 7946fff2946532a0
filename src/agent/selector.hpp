#pragma once
#include <optional>
#include <string>
#include "agent/errors.hpp"
#include "agent/manager_config.hpp"
#include "agent/types.hpp"

namespace ent::agent {

// What the caller already pinned; unset fields are for the selector to decide
struct SelectionRequest {
    std::string task;
    std::optional<AgentRole> role;
    std::optional<AgentModel> model;
};

struct SelectionResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    AgentRole role = AgentRole::DEVELOPER;
    AgentModel model = AgentModel::HAIKU;
    std::string reason;
};

// Resolves role and model for a spawn
class Selector {
public:
    virtual ~Selector() = default;
    virtual SelectionResult select(const SelectionRequest& request, const ManagerConfig& config) = 0;
};

// Task classes used for tiered model selection
enum class TaskClass {
    EXPLORATION,
    COMPLEXITY,
    CRITICAL
};

const char* task_class_to_string(TaskClass task_class);

// Keyword classification; critical beats complexity beats exploration
TaskClass classify_task(const std::string& task);

// Default selector: keyword classification mapped onto roles and the
// configured model tiers. Explicit values always win.
class KeywordSelector : public Selector {
public:
    SelectionResult select(const SelectionRequest& request, const ManagerConfig& config) override;
};

} // namespace ent::agent
