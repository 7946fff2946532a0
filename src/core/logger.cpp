#include "core/logger.hpp"
#include "core/config.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ent::core {

void init_logger() {
    auto logger = spdlog::get("ent");
    if (!logger) {
        logger = spdlog::stderr_color_mt("ent");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_default_logger(logger);

    set_log_level(parse_log_level(config::get_env_or("ENT_LOG_LEVEL", "info")));
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace ent::core
