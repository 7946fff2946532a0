#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ent::agent {

// Agent role assigned at spawn
enum class AgentRole {
    ARCHITECT,
    SENIOR,
    DEVELOPER,
    OPS,
    REVIEWER
};

// Model family used by an agent
enum class AgentModel {
    OPUS,
    SONNET,
    HAIKU
};

// Lifecycle: PENDING -> RUNNING -> {COMPLETED, FAILED, KILLED}
enum class AgentStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    KILLED
};

const char* agent_role_to_string(AgentRole role);
std::optional<AgentRole> agent_role_from_string(const std::string& str);

const char* agent_model_to_string(AgentModel model);
std::optional<AgentModel> agent_model_from_string(const std::string& str);

const char* agent_status_to_string(AgentStatus status);
std::optional<AgentStatus> agent_status_from_string(const std::string& str);

bool is_terminal(AgentStatus status);

const std::vector<std::string>& valid_roles();
const std::vector<std::string>& valid_models();
const std::vector<std::string>& valid_statuses();

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Point-in-time copy of an agent's observable state
struct Snapshot {
    std::string id;
    AgentRole role = AgentRole::DEVELOPER;
    AgentModel model = AgentModel::HAIKU;
    std::string task;
    AgentStatus status = AgentStatus::PENDING;

    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;

    std::string output;
    std::string failure_reason;  // FAILED / KILLED only

    // started -> finished, started -> now while running, zero if never started
    std::chrono::milliseconds duration() const;
};

// Optional overrides for a single spawn. Empty strings mean "not set".
struct SpawnOptions {
    std::string role;
    std::string model;
    std::optional<int> timeout_seconds;
};

} // namespace ent::agent
