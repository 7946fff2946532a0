#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>
#include "agent/types.hpp"

namespace ent::tools {

// 2026-01-02T15:04:05Z
std::string format_iso8601(agent::TimePoint tp);

// 2026-01-02 15:04:05 (UTC)
std::string format_timestamp(agent::TimePoint tp);

// 850ms, 1.250s, 2m3.500s
std::string format_duration(std::chrono::milliseconds duration);

// Status marker used in rendered summaries
const char* status_icon(agent::AgentStatus status);

// Full status view of a snapshot (id, role, model, task, status, times, output, error)
nlohmann::json snapshot_to_json(const agent::Snapshot& snap);

} // namespace ent::tools
