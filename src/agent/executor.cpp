#include "agent/executor.hpp"
#include <spdlog/spdlog.h>

namespace ent::agent {

SimulatedExecutor::SimulatedExecutor(std::chrono::milliseconds work_duration)
    : work_duration_(work_duration) {}

void SimulatedExecutor::execute(const ExecutionRequest& request, Agent& agent, const ExecutionContext& context) {
    agent.append_output("starting " + std::string(agent_role_to_string(request.role)) +
                        " on " + agent_model_to_string(request.model) + "\n");

    if (context.wait_for(work_duration_)) {
        spdlog::debug("Agent {} cancelled ({}) before finishing",
            request.agent_id, cancel_reason_to_string(context.reason()));
        return;
    }

    agent.complete("task executed");
}

} // namespace ent::agent
