#include "agent/manager.hpp"
#include <algorithm>
#include <cstdio>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace ent::agent {

namespace {

std::string join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

} // namespace

AgentManager::AgentManager(ManagerConfig config,
                           std::shared_ptr<Selector> selector,
                           std::shared_ptr<Executor> executor)
    : config_(std::move(config))
    , selector_(std::move(selector))
    , executor_(std::move(executor))
    , rng_(std::random_device{}()) {
    if (!executor_) {
        spdlog::warn("AgentManager: no executor supplied, using SimulatedExecutor");
        executor_ = std::make_shared<SimulatedExecutor>();
    }
    watcher_ = std::thread([this]() { watch_deadlines(); });
    spdlog::debug("AgentManager initialized (default_role={}, default_model={}, timeout={}s, max_concurrent={})",
        agent_role_to_string(config_.default_role),
        agent_model_to_string(config_.default_model),
        config_.default_timeout_seconds,
        config_.max_concurrent_agents ? std::to_string(*config_.max_concurrent_agents) : "unlimited");
}

AgentManager::~AgentManager() {
    shutdown();
}

SpawnResult AgentManager::spawn(const std::string& task, const SpawnOptions& opts) {
    SpawnResult result;
    auto reject = [&result](ErrorCode code, std::string error) {
        spdlog::warn("Spawn rejected: {}", error);
        result.code = code;
        result.error = std::move(error);
        return result;
    };

    if (stopping_) {
        return reject(ErrorCode::VALIDATION, "manager is shut down");
    }
    if (task.empty()) {
        return reject(ErrorCode::VALIDATION, "task required");
    }

    std::optional<AgentRole> role;
    if (!opts.role.empty()) {
        role = agent_role_from_string(opts.role);
        if (!role) {
            return reject(ErrorCode::VALIDATION,
                "invalid role '" + opts.role + "' (valid: " + join(valid_roles()) + ")");
        }
    }

    std::optional<AgentModel> model;
    if (!opts.model.empty()) {
        model = agent_model_from_string(opts.model);
        if (!model) {
            return reject(ErrorCode::VALIDATION,
                "invalid model '" + opts.model + "' (valid: " + join(valid_models()) + ")");
        }
    }

    if (opts.timeout_seconds.has_value() && *opts.timeout_seconds <= 0) {
        return reject(ErrorCode::VALIDATION, "timeout must be a positive number of seconds");
    }

    AgentRole final_role = role.value_or(config_.default_role);
    AgentModel final_model = model.value_or(config_.default_model);
    if ((!role || !model) && selector_) {
        auto selection = selector_->select(SelectionRequest{task, role, model}, config_);
        if (!selection.success) {
            auto code = selection.code == ErrorCode::NONE ? ErrorCode::VALIDATION : selection.code;
            return reject(code, "select: " + selection.error);
        }
        final_role = role.value_or(selection.role);
        final_model = model.value_or(selection.model);
        spdlog::debug("Selector chose {}/{} ({})",
            agent_role_to_string(selection.role), agent_model_to_string(selection.model), selection.reason);
    }

    int timeout_seconds = opts.timeout_seconds.value_or(config_.default_timeout_seconds);
    auto deadline = ExecutionContext::SteadyClock::now() + std::chrono::seconds(timeout_seconds);
    auto context = std::make_shared<ExecutionContext>(deadline);

    Entry entry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        if (config_.max_concurrent_agents.has_value() &&
            active_count_locked() >= static_cast<size_t>(*config_.max_concurrent_agents)) {
            return reject(ErrorCode::LIMIT_REACHED,
                "max concurrent agents (" + std::to_string(*config_.max_concurrent_agents) + ") reached");
        }

        auto id = generate_id_locked();
        entry.agent = std::make_shared<Agent>(id, final_role, final_model, task);
        entry.context = context;
        entry.sequence = next_sequence_++;
        agents_.emplace(id, entry);
    }

    {
        std::lock_guard<std::mutex> lock(watcher_mutex_);
        deadlines_.emplace(deadline, entry);
    }
    watcher_cv_.notify_one();

    reap_finished_workers();

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (stopping_) {
            entry.agent->seal(AgentStatus::KILLED, cancel_reason_to_string(CancelReason::SHUTDOWN));
            context->cancel(CancelReason::SHUTDOWN);
        } else {
            try {
                workers_.emplace(entry.sequence,
                    std::thread(&AgentManager::run_agent, this, entry.agent, context, entry.sequence));
            } catch (const std::system_error& e) {
                spdlog::error("Failed to launch thread for agent {}: {}", entry.agent->id(), e.what());
                entry.agent->fail(std::string("launch failed: ") + e.what());
                context->cancel(CancelReason::SHUTDOWN);
            }
        }
    }

    spdlog::info("Spawned agent {} (role={}, model={}, timeout={}s)",
        entry.agent->id(), agent_role_to_string(final_role), agent_model_to_string(final_model), timeout_seconds);

    result.success = true;
    result.agent = entry.agent;
    return result;
}

LookupResult AgentManager::get(const std::string& id) const {
    LookupResult result;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = agents_.find(id);
    if (it == agents_.end()) {
        result.code = ErrorCode::NOT_FOUND;
        result.error = kErrAgentNotFound;
        return result;
    }
    result.success = true;
    result.agent = it->second.agent;
    return result;
}

std::vector<Snapshot> AgentManager::list(std::optional<AgentStatus> status) const {
    auto all = entries();
    std::sort(all.begin(), all.end(), [](const Entry& a, const Entry& b) {
        if (a.agent->created_at() != b.agent->created_at()) {
            return a.agent->created_at() < b.agent->created_at();
        }
        return a.sequence < b.sequence;
    });

    std::vector<Snapshot> result;
    result.reserve(all.size());
    for (const auto& entry : all) {
        auto snap = entry.agent->snapshot();
        if (!status || snap.status == *status) {
            result.push_back(std::move(snap));
        }
    }
    return result;
}

KillResult AgentManager::kill(const std::string& id) {
    KillResult result;
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto it = agents_.find(id);
        if (it == agents_.end()) {
            result.code = ErrorCode::NOT_FOUND;
            result.error = kErrAgentNotFound;
            return result;
        }
        entry = it->second;
    }

    // Seal before cancelling so anything the executor reports after seeing
    // the cancellation is discarded.
    result.sealed = entry.agent->seal(AgentStatus::KILLED, cancel_reason_to_string(CancelReason::KILLED));
    if (result.sealed) {
        entry.context->cancel(CancelReason::KILLED);
        spdlog::info("Agent {} killed", id);
    } else {
        spdlog::debug("Kill for agent {} ignored, already {}", id, agent_status_to_string(entry.agent->status()));
    }

    result.success = true;
    result.snapshot = entry.agent->snapshot();
    return result;
}

size_t AgentManager::count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return agents_.size();
}

size_t AgentManager::count_by_status(AgentStatus status) const {
    size_t n = 0;
    for (const auto& entry : entries()) {
        if (entry.agent->status() == status) {
            ++n;
        }
    }
    return n;
}

RegistryStats AgentManager::stats() const {
    RegistryStats stats;
    for (const auto& entry : entries()) {
        switch (entry.agent->status()) {
            case AgentStatus::PENDING:   stats.pending++; break;
            case AgentStatus::RUNNING:   stats.running++; break;
            case AgentStatus::COMPLETED: stats.completed++; break;
            case AgentStatus::FAILED:    stats.failed++; break;
            case AgentStatus::KILLED:    stats.killed++; break;
        }
        stats.total++;
    }
    return stats;
}

void AgentManager::on_shutdown(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    shutdown_hooks_.push_back(std::move(hook));
}

void AgentManager::shutdown() {
    std::call_once(shutdown_once_, [this]() {
        spdlog::info("Shutting down agent manager...");

        {
            std::lock_guard<std::mutex> lock(watcher_mutex_);
            stopping_ = true;
            deadlines_.clear();
        }
        watcher_cv_.notify_all();
        if (watcher_.joinable()) {
            watcher_.join();
        }

        size_t killed = 0;
        for (const auto& entry : entries()) {
            if (entry.agent->seal(AgentStatus::KILLED, cancel_reason_to_string(CancelReason::SHUTDOWN))) {
                killed++;
            }
            entry.context->cancel(CancelReason::SHUTDOWN);
        }

        std::unordered_map<uint64_t, std::thread> workers;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers.swap(workers_);
            finished_workers_.clear();
        }
        for (auto& [_, worker] : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }

        std::vector<std::function<void()>> hooks;
        {
            std::lock_guard<std::mutex> lock(hooks_mutex_);
            hooks.swap(shutdown_hooks_);
        }
        for (auto& hook : hooks) {
            try {
                hook();
            } catch (const std::exception& e) {
                spdlog::error("Shutdown hook failed: {}", e.what());
            }
        }

        spdlog::info("Agent manager stopped ({} live agents killed)", killed);
    });
}

void AgentManager::run_agent(std::shared_ptr<Agent> agent,
                             std::shared_ptr<ExecutionContext> context,
                             uint64_t worker_id) {
    if (!context->is_cancelled() && agent->start()) {
        ExecutionRequest request{agent->id(), agent->task(), agent->role(), agent->model()};
        try {
            executor_->execute(request, *agent, *context);
        } catch (const std::exception& e) {
            spdlog::error("Executor error for agent {}: {}", agent->id(), e.what());
            agent->fail(std::string("executor error: ") + e.what());
        }

        // No-op when the executor reported or the agent was sealed
        if (agent->fail("executor returned without reporting an outcome")) {
            spdlog::warn("Agent {} executor returned without an outcome", agent->id());
        }
    }

    auto snap = agent->snapshot();
    spdlog::info("Agent {} {} after {}ms{}",
        snap.id, agent_status_to_string(snap.status), snap.duration().count(),
        snap.failure_reason.empty() ? "" : " (" + snap.failure_reason + ")");

    {
        std::lock_guard<std::mutex> lock(watcher_mutex_);
        auto range = deadlines_.equal_range(context->deadline());
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second.context == context) {
                deadlines_.erase(it);
                break;
            }
        }
    }

    std::lock_guard<std::mutex> lock(workers_mutex_);
    finished_workers_.push_back(worker_id);
}

void AgentManager::watch_deadlines() {
    std::unique_lock<std::mutex> lock(watcher_mutex_);
    while (!stopping_) {
        if (deadlines_.empty()) {
            watcher_cv_.wait(lock, [this]() { return stopping_ || !deadlines_.empty(); });
            continue;
        }

        auto next = deadlines_.begin();
        if (ExecutionContext::SteadyClock::now() < next->first) {
            watcher_cv_.wait_until(lock, next->first);
            continue;
        }

        Entry entry = next->second;
        deadlines_.erase(next);

        lock.unlock();
        expire(entry);
        lock.lock();
    }
}

void AgentManager::expire(const Entry& entry) {
    if (entry.agent->seal(AgentStatus::KILLED, cancel_reason_to_string(CancelReason::TIMEOUT))) {
        spdlog::info("Agent {} timed out", entry.agent->id());
    }
    entry.context->cancel(CancelReason::TIMEOUT);
}

void AgentManager::reap_finished_workers() {
    std::vector<std::thread> done;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto id : finished_workers_) {
            auto it = workers_.find(id);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        finished_workers_.clear();
    }
    for (auto& worker : done) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

std::string AgentManager::generate_id_locked() {
    std::uniform_int_distribution<uint64_t> dist;
    while (true) {
        uint64_t hi = dist(rng_);
        uint64_t lo = dist(rng_);
        hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
        lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant

        char buf[37];
        std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
            static_cast<unsigned>(hi >> 32),
            static_cast<unsigned>((hi >> 16) & 0xFFFF),
            static_cast<unsigned>(hi & 0xFFFF),
            static_cast<unsigned>(lo >> 48),
            static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));

        std::string id(buf);
        if (agents_.count(id) == 0) {
            return id;
        }
    }
}

size_t AgentManager::active_count_locked() const {
    size_t active = 0;
    for (const auto& [_, entry] : agents_) {
        if (!is_terminal(entry.agent->status())) {
            active++;
        }
    }
    return active;
}

std::vector<AgentManager::Entry> AgentManager::entries() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::vector<Entry> all;
    all.reserve(agents_.size());
    for (const auto& [_, entry] : agents_) {
        all.push_back(entry);
    }
    return all;
}

} // namespace ent::agent
