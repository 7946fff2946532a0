#include "agent/agent.hpp"
#include <utility>
#include <spdlog/spdlog.h>

namespace ent::agent {

Agent::Agent(std::string id, AgentRole role, AgentModel model, std::string task)
    : id_(std::move(id))
    , role_(role)
    , model_(model)
    , task_(std::move(task))
    , created_at_(Clock::now()) {}

bool Agent::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != AgentStatus::PENDING) {
        return false;
    }
    status_ = AgentStatus::RUNNING;
    started_at_ = Clock::now();
    spdlog::debug("Agent {} running", id_);
    return true;
}

bool Agent::complete(const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(status_)) {
        spdlog::debug("Agent {} already {}, completion discarded", id_, agent_status_to_string(status_));
        return false;
    }
    if (!output.empty()) {
        output_ = output;
    }
    return finish_locked(AgentStatus::COMPLETED, "");
}

bool Agent::fail(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(status_)) {
        spdlog::debug("Agent {} already {}, failure discarded", id_, agent_status_to_string(status_));
        return false;
    }
    return finish_locked(AgentStatus::FAILED, reason);
}

bool Agent::append_output(const std::string& chunk) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != AgentStatus::RUNNING) {
        return false;
    }
    output_ += chunk;
    return true;
}

AgentStatus Agent::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

Snapshot Agent::snapshot() const {
    Snapshot snap;
    snap.id = id_;
    snap.role = role_;
    snap.model = model_;
    snap.task = task_;
    snap.created_at = created_at_;

    std::lock_guard<std::mutex> lock(mutex_);
    snap.status = status_;
    snap.started_at = started_at_;
    snap.finished_at = finished_at_;
    snap.output = output_;
    snap.failure_reason = failure_reason_;
    return snap;
}

bool Agent::seal(AgentStatus status, const std::string& reason) {
    if (!is_terminal(status)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(status_)) {
        return false;
    }
    return finish_locked(status, reason);
}

bool Agent::finish_locked(AgentStatus status, const std::string& reason) {
    status_ = status;
    finished_at_ = Clock::now();
    if (status != AgentStatus::COMPLETED) {
        failure_reason_ = reason;
    }
    spdlog::debug("Agent {} -> {}", id_, agent_status_to_string(status));
    return true;
}

} // namespace ent::agent
