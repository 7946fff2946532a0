#pragma once
#include <chrono>
#include <string>
#include "agent/agent.hpp"
#include "agent/execution_context.hpp"
#include "agent/types.hpp"

namespace ent::agent {

struct ExecutionRequest {
    std::string agent_id;
    std::string task;
    AgentRole role;
    AgentModel model;
};

// Performs an agent's work on the calling (per-agent) thread.
//
// Before returning, an executor reports exactly one outcome through
// agent.complete() or agent.fail(), and may stream through
// agent.append_output() meanwhile. Once `context` is cancelled the agent is
// already sealed and anything reported afterwards is discarded; the executor
// should return promptly. Exceptions thrown out of execute() fail the agent.
class Executor {
public:
    virtual ~Executor() = default;
    virtual void execute(const ExecutionRequest& request, Agent& agent, const ExecutionContext& context) = 0;
};

// Stand-in backend: streams a start line, waits out the work duration
// (returning early on cancellation), then completes with "task executed".
class SimulatedExecutor : public Executor {
public:
    explicit SimulatedExecutor(std::chrono::milliseconds work_duration = std::chrono::milliseconds(10));

    void execute(const ExecutionRequest& request, Agent& agent, const ExecutionContext& context) override;

private:
    std::chrono::milliseconds work_duration_;
};

} // namespace ent::agent
