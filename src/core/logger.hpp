#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace ent::core {

// Initialize logging on stderr (stdout carries the MCP stream)
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse a level name ("trace".."off"); unknown names map to info
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace ent::core
