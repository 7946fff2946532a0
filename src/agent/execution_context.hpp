#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ent::agent {

// Why an execution context was cancelled
enum class CancelReason {
    NONE,
    KILLED,     // explicit kill
    TIMEOUT,    // deadline expired
    SHUTDOWN    // manager shutting down
};

// Failure reason recorded on the agent for each cancel reason
const char* cancel_reason_to_string(CancelReason reason);

// Cancellable, deadline-scoped context handed to an executor.
// Cancellation is one-shot: the first reason wins.
class ExecutionContext {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit ExecutionContext(SteadyClock::time_point deadline);

    ExecutionContext(const ExecutionContext&) = delete;
    ExecutionContext& operator=(const ExecutionContext&) = delete;

    // Returns true if this call performed the cancellation
    bool cancel(CancelReason reason);

    bool is_cancelled() const;
    CancelReason reason() const;

    SteadyClock::time_point deadline() const { return deadline_; }
    bool deadline_passed() const { return SteadyClock::now() >= deadline_; }

    // Block until cancelled or `timeout` elapses. Returns true if cancelled.
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Block until cancelled.
    void wait() const;

private:
    const SteadyClock::time_point deadline_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    CancelReason reason_ = CancelReason::NONE;
};

} // namespace ent::agent
