#include "tools/format.hpp"
#include <cstdio>
#include <ctime>

namespace ent::tools {

namespace {

std::string format_utc(agent::TimePoint tp, const char* pattern) {
    std::time_t t = agent::Clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[64];
    size_t len = std::strftime(buf, sizeof(buf), pattern, &tm);
    return std::string(buf, len);
}

} // namespace

std::string format_iso8601(agent::TimePoint tp) {
    return format_utc(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string format_timestamp(agent::TimePoint tp) {
    return format_utc(tp, "%Y-%m-%d %H:%M:%S");
}

std::string format_duration(std::chrono::milliseconds duration) {
    auto ms = duration.count();
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    }

    char buf[32];
    long long minutes = ms / 60000;
    long long rem_ms = ms % 60000;
    if (minutes == 0) {
        std::snprintf(buf, sizeof(buf), "%lld.%03llds", rem_ms / 1000, rem_ms % 1000);
    } else {
        std::snprintf(buf, sizeof(buf), "%lldm%lld.%03llds", minutes, rem_ms / 1000, rem_ms % 1000);
    }
    return buf;
}

const char* status_icon(agent::AgentStatus status) {
    switch (status) {
        case agent::AgentStatus::PENDING:   return "⏳";
        case agent::AgentStatus::RUNNING:   return "▶️";
        case agent::AgentStatus::COMPLETED: return "✅";
        case agent::AgentStatus::FAILED:    return "❌";
        case agent::AgentStatus::KILLED:    return "🛑";
        default: return "❓";
    }
}

nlohmann::json snapshot_to_json(const agent::Snapshot& snap) {
    nlohmann::json j;
    j["id"] = snap.id;
    j["role"] = agent::agent_role_to_string(snap.role);
    j["model"] = agent::agent_model_to_string(snap.model);
    j["task"] = snap.task;
    j["status"] = agent::agent_status_to_string(snap.status);
    j["created_at"] = format_iso8601(snap.created_at);
    if (snap.started_at) {
        j["started_at"] = format_iso8601(*snap.started_at);
    }
    if (snap.finished_at) {
        j["completed_at"] = format_iso8601(*snap.finished_at);
    }
    j["duration"] = format_duration(snap.duration());
    if (!snap.output.empty()) {
        j["output"] = snap.output;
    }
    if (!snap.failure_reason.empty()) {
        j["error"] = snap.failure_reason;
    }
    return j;
}

} // namespace ent::tools
