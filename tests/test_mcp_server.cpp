#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agent/manager.hpp"
#include "fakes.hpp"
#include "server/mcp_server.hpp"
#include "tools/agent_tools.hpp"

using namespace ent;
using json = nlohmann::json;

namespace {

class McpServerTest : public ::testing::Test {
protected:
    McpServerTest()
        : manager_(agent::ManagerConfig{}, std::make_shared<agent::KeywordSelector>(),
                   std::make_shared<test::InstantExecutor>("task executed"))
        , tools_(manager_)
        , server_(router_, in_, out_) {
        tools_.register_tools(router_);
    }

    json request(const json& message) {
        auto response = server_.handle_line(message.dump());
        EXPECT_TRUE(response.has_value());
        return response.value_or(json());
    }

    agent::AgentManager manager_;
    tools::ToolRouter router_;
    tools::AgentTools tools_;
    std::istringstream in_;
    std::ostringstream out_;
    server::McpServer server_;
};

std::vector<json> read_lines(const std::string& text) {
    std::vector<json> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(json::parse(line));
    }
    return lines;
}

} // namespace

TEST_F(McpServerTest, Initialize) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                             {"params", {{"clientInfo", {{"name", "test-client"}}}}}});
    EXPECT_EQ("2.0", response["jsonrpc"]);
    EXPECT_EQ(1, response["id"]);
    EXPECT_EQ("2024-11-05", response["result"]["protocolVersion"]);
    EXPECT_EQ("ent", response["result"]["serverInfo"]["name"]);
    EXPECT_TRUE(response["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, NotificationsGetNoReply) {
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").has_value());
    EXPECT_FALSE(server_.handle_line(R"({"jsonrpc":"2.0","method":"notifications/cancelled"})").has_value());
    EXPECT_FALSE(server_.handle_line("   ").has_value());
}

TEST_F(McpServerTest, Ping) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", "p1"}, {"method", "ping"}});
    EXPECT_EQ("p1", response["id"]);
    EXPECT_EQ(json::object(), response["result"]);
}

TEST_F(McpServerTest, ToolsList) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});
    const auto& tools = response["result"]["tools"];
    ASSERT_EQ(5u, tools.size());
    EXPECT_EQ("agent_spawn", tools[0]["name"]);
    EXPECT_TRUE(tools[0].contains("inputSchema"));
}

TEST_F(McpServerTest, ToolsCallSpawnsAgent) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 3}, {"method", "tools/call"},
                             {"params", {{"name", "agent_spawn"}, {"arguments", {{"task", "list open files"}}}}}});
    const auto& result = response["result"];
    EXPECT_FALSE(result["isError"].get<bool>());
    auto id = result["structuredContent"]["agent_id"].get<std::string>();
    EXPECT_TRUE(manager_.get(id).success);
    EXPECT_EQ("text", result["content"][0]["type"]);
}

TEST_F(McpServerTest, ToolErrorsAreResultsNotProtocolErrors) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 4}, {"method", "tools/call"},
                             {"params", {{"name", "agent_status"}, {"arguments", {{"agent_id", "ghost"}}}}}});
    ASSERT_TRUE(response.contains("result"));
    EXPECT_TRUE(response["result"]["isError"].get<bool>());
    EXPECT_EQ("Error: agent not found: ghost", response["result"]["content"][0]["text"]);
}

TEST_F(McpServerTest, UnknownToolIsInvalidParams) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/call"},
                             {"params", {{"name", "agent_refactor"}}}});
    EXPECT_EQ(server::kInvalidParams, response["error"]["code"]);
    EXPECT_EQ("Unknown tool: agent_refactor", response["error"]["message"]);
}

TEST_F(McpServerTest, UnknownMethod) {
    auto response = request({{"jsonrpc", "2.0"}, {"id", 6}, {"method", "resources/list"}});
    EXPECT_EQ(6, response["id"]);
    EXPECT_EQ(server::kMethodNotFound, response["error"]["code"]);
}

TEST_F(McpServerTest, MalformedInput) {
    auto parse = server_.handle_line("{not json");
    ASSERT_TRUE(parse.has_value());
    EXPECT_EQ(server::kParseError, (*parse)["error"]["code"]);
    EXPECT_TRUE((*parse)["id"].is_null());

    auto invalid = request({{"jsonrpc", "2.0"}, {"id", 7}});
    EXPECT_EQ(server::kInvalidRequest, invalid["error"]["code"]);
    EXPECT_EQ(7, invalid["id"]);
}

TEST(McpServerRunTest, ServesUntilInputCloses) {
    agent::AgentManager manager(agent::ManagerConfig{}, nullptr, std::make_shared<test::InstantExecutor>());
    tools::ToolRouter router;
    tools::AgentTools tools(manager);
    tools.register_tools(router);

    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"agent_list","arguments":{}}})" "\n");
    std::ostringstream out;

    server::McpServer server(router, in, out);
    EXPECT_EQ(0, server.run());

    auto lines = read_lines(out.str());
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ(1, lines[0]["id"]);
    EXPECT_EQ(2, lines[1]["id"]);
    EXPECT_EQ(3, lines[2]["id"]);
    EXPECT_EQ(0, lines[2]["result"]["structuredContent"]["total_count"]);
}
