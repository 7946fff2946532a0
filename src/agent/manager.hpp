#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "agent/agent.hpp"
#include "agent/errors.hpp"
#include "agent/execution_context.hpp"
#include "agent/executor.hpp"
#include "agent/manager_config.hpp"
#include "agent/selector.hpp"
#include "agent/types.hpp"

namespace ent::agent {

struct SpawnResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    std::shared_ptr<Agent> agent;
};

struct LookupResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    std::shared_ptr<Agent> agent;
};

struct KillResult {
    bool success = false;
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    bool sealed = false;   // false when the agent was already terminal
    Snapshot snapshot;     // post-kill state
};

struct RegistryStats {
    size_t pending = 0;
    size_t running = 0;
    size_t completed = 0;
    size_t failed = 0;
    size_t killed = 0;
    size_t total = 0;
};

// Registry and lifecycle owner for background agents.
//
// Each spawned agent gets its own thread running the executor against a
// cancellable, deadline-scoped ExecutionContext. A single watcher thread
// expires deadlines. Agents are never removed; they live as long as the
// manager does.
//
// Locking: registry_mutex_ guards only the map; every Agent guards its own
// state. Lock order is registry -> agent, never the reverse.
class AgentManager {
public:
    AgentManager(ManagerConfig config,
                 std::shared_ptr<Selector> selector,
                 std::shared_ptr<Executor> executor);
    ~AgentManager();

    // Non-copyable
    AgentManager(const AgentManager&) = delete;
    AgentManager& operator=(const AgentManager&) = delete;

    // Validate, resolve role/model, register a PENDING agent and launch it.
    // Never waits for the task itself.
    SpawnResult spawn(const std::string& task, const SpawnOptions& opts = {});

    LookupResult get(const std::string& id) const;

    // Snapshots ordered by creation time, optionally filtered by status
    std::vector<Snapshot> list(std::optional<AgentStatus> status = std::nullopt) const;

    // Seal a live agent as KILLED and cancel its context without waiting for
    // the executor. Killing a terminal agent succeeds and changes nothing.
    KillResult kill(const std::string& id);

    size_t count() const;
    size_t count_by_status(AgentStatus status) const;
    RegistryStats stats() const;

    // Hooks run once, in registration order, at the end of shutdown()
    void on_shutdown(std::function<void()> hook);

    // Kill every live agent, stop the watcher and join all agent threads.
    // Safe to call more than once; the destructor calls it.
    void shutdown();

    bool is_shut_down() const { return stopping_; }
    const ManagerConfig& config() const { return config_; }

private:
    struct Entry {
        std::shared_ptr<Agent> agent;
        std::shared_ptr<ExecutionContext> context;
        uint64_t sequence = 0;
    };

    void run_agent(std::shared_ptr<Agent> agent, std::shared_ptr<ExecutionContext> context, uint64_t worker_id);
    void watch_deadlines();
    void expire(const Entry& entry);
    void reap_finished_workers();

    std::string generate_id_locked();
    size_t active_count_locked() const;
    std::vector<Entry> entries() const;

    ManagerConfig config_;
    std::shared_ptr<Selector> selector_;
    std::shared_ptr<Executor> executor_;

    // Registry
    std::unordered_map<std::string, Entry> agents_;
    mutable std::mutex registry_mutex_;
    uint64_t next_sequence_ = 1;
    std::mt19937_64 rng_;

    // Agent threads
    std::unordered_map<uint64_t, std::thread> workers_;
    std::vector<uint64_t> finished_workers_;
    std::mutex workers_mutex_;

    // Deadline watcher
    std::multimap<ExecutionContext::SteadyClock::time_point, Entry> deadlines_;
    std::mutex watcher_mutex_;
    std::condition_variable watcher_cv_;
    std::thread watcher_;

    std::atomic<bool> stopping_{false};
    std::once_flag shutdown_once_;

    std::vector<std::function<void()>> shutdown_hooks_;
    std::mutex hooks_mutex_;
};

} // namespace ent::agent
