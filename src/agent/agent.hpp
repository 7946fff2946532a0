#pragma once
#include <mutex>
#include <optional>
#include <string>
#include "agent/types.hpp"

namespace ent::agent {

class AgentManager;

// One background task: its state machine plus its output buffer.
//
// Identity fields (id, role, model, task, created_at) are fixed at
// construction. Everything else is guarded by the agent's own mutex and is
// only observable through snapshot(). Terminal transitions are first-wins:
// once COMPLETED, FAILED or KILLED, every later transition is a no-op.
class Agent {
public:
    Agent(std::string id, AgentRole role, AgentModel model, std::string task);

    Agent(const Agent&) = delete;
    Agent& operator=(const Agent&) = delete;

    const std::string& id() const { return id_; }
    AgentRole role() const { return role_; }
    AgentModel model() const { return model_; }
    const std::string& task() const { return task_; }
    TimePoint created_at() const { return created_at_; }

    // PENDING -> RUNNING. False if not pending.
    bool start();

    // {PENDING, RUNNING} -> COMPLETED. Non-empty output replaces anything
    // streamed so far. False if already terminal.
    bool complete(const std::string& output);

    // {PENDING, RUNNING} -> FAILED with the given reason. False if already terminal.
    bool fail(const std::string& reason);

    // Stream output while RUNNING. Discarded (false) in any other state.
    bool append_output(const std::string& chunk);

    AgentStatus status() const;
    Snapshot snapshot() const;

private:
    friend class AgentManager;

    // Force a terminal state (kill, timeout, shutdown). Idempotent.
    bool seal(AgentStatus status, const std::string& reason);

    bool finish_locked(AgentStatus status, const std::string& reason);

    const std::string id_;
    const AgentRole role_;
    const AgentModel model_;
    const std::string task_;
    const TimePoint created_at_;

    mutable std::mutex mutex_;
    AgentStatus status_ = AgentStatus::PENDING;
    std::optional<TimePoint> started_at_;
    std::optional<TimePoint> finished_at_;
    std::string output_;
    std::string failure_reason_;
};

} // namespace ent::agent
