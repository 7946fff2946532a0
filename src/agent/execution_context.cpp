#include "agent/execution_context.hpp"

namespace ent::agent {

const char* cancel_reason_to_string(CancelReason reason) {
    switch (reason) {
        case CancelReason::KILLED:   return "cancelled";
        case CancelReason::TIMEOUT:  return "timeout";
        case CancelReason::SHUTDOWN: return "shutdown";
        default: return "";
    }
}

ExecutionContext::ExecutionContext(SteadyClock::time_point deadline)
    : deadline_(deadline) {}

bool ExecutionContext::cancel(CancelReason reason) {
    if (reason == CancelReason::NONE) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (reason_ != CancelReason::NONE) {
            return false;
        }
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

bool ExecutionContext::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_ != CancelReason::NONE;
}

CancelReason ExecutionContext::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool ExecutionContext::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return reason_ != CancelReason::NONE; });
}

void ExecutionContext::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return reason_ != CancelReason::NONE; });
}

} // namespace ent::agent
