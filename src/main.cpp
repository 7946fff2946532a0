#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "agent/executor.hpp"
#include "agent/manager.hpp"
#include "agent/manager_config.hpp"
#include "agent/selector.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "server/mcp_server.hpp"
#include "tools/agent_tools.hpp"
#include "tools/tool_router.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options]\n"
              << "\n"
              << "Serves background agent tools over MCP (JSON-RPC on stdin/stdout).\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>     Config file (default: $ENT_CONFIG or ~/.ent/config.json)\n"
              << "  --log-level <lvl>   trace|debug|info|warn|error|off (default: $ENT_LOG_LEVEL or info)\n"
              << "  -h, --help          Show this help\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    ent::core::config::load_dotenv();
    ent::core::init_logger();
    if (!log_level.empty()) {
        ent::core::set_log_level(ent::core::parse_log_level(log_level));
    }

    ::signal(SIGPIPE, SIG_IGN);

    auto loaded = ent::agent::load_manager_config(config_path);
    if (!loaded.success) {
        spdlog::error("Invalid configuration: {}", loaded.error);
        return 1;
    }
    if (!loaded.source.empty()) {
        spdlog::info("Using config {}", loaded.source);
    }

    ent::agent::AgentManager manager(
        loaded.config,
        std::make_shared<ent::agent::KeywordSelector>(),
        std::make_shared<ent::agent::SimulatedExecutor>());

    ent::tools::ToolRouter router;
    ent::tools::AgentTools agent_tools(manager);
    agent_tools.register_tools(router);

    ent::server::McpServer server(router, std::cin, std::cout);
    int rc = server.run();

    manager.shutdown();
    return rc;
}
