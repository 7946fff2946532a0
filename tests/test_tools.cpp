#include <limits>
#include <memory>
#include <new>
#include <stdexcept>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "agent/manager.hpp"
#include "fakes.hpp"
#include "tools/agent_tools.hpp"
#include "tools/format.hpp"
#include "tools/tool_router.hpp"

using namespace ent;
using json = nlohmann::json;

namespace {

class AgentToolsTest : public ::testing::Test {
protected:
    AgentToolsTest()
        : executor_(std::make_shared<test::BlockingExecutor>())
        , manager_(make_config(), std::make_shared<agent::KeywordSelector>(), executor_)
        , tools_(manager_) {
        tools_.register_tools(router_);
    }

    static agent::ManagerConfig make_config() {
        agent::ManagerConfig config;
        config.max_concurrent_agents = 3;
        return config;
    }

    std::string spawn_running(const std::string& task) {
        auto result = router_.call("agent_spawn", {{"task", task}, {"role", "developer"}, {"model", "haiku"}});
        EXPECT_FALSE(result.is_error) << result.text;
        auto id = result.structured["agent_id"].get<std::string>();
        EXPECT_TRUE(test::wait_for_status(manager_, id, agent::AgentStatus::RUNNING));
        return id;
    }

    std::shared_ptr<test::BlockingExecutor> executor_;
    agent::AgentManager manager_;
    tools::ToolRouter router_;
    tools::AgentTools tools_;
};

} // namespace

TEST_F(AgentToolsTest, RegistersAllAgentTools) {
    const auto& defs = router_.definitions();
    ASSERT_EQ(5u, defs.size());
    EXPECT_EQ("agent_spawn", defs[0].name);
    EXPECT_EQ("agent_status", defs[1].name);
    EXPECT_EQ("agent_list", defs[2].name);
    EXPECT_EQ("agent_kill", defs[3].name);
    EXPECT_EQ("agent_output", defs[4].name);

    auto spawn_schema = defs[0].to_json();
    EXPECT_EQ("agent_spawn", spawn_schema["name"]);
    EXPECT_EQ(json::array({"task"}), spawn_schema["inputSchema"]["required"]);
}

TEST_F(AgentToolsTest, SpawnUsesSelectorForUnsetFields) {
    auto result = router_.call("agent_spawn", {{"task", "design the plugin architecture"}, {"timeout", 30}});
    ASSERT_FALSE(result.is_error) << result.text;

    const auto& s = result.structured;
    EXPECT_EQ("architect", s["role"]);
    EXPECT_EQ("sonnet", s["model"]);
    EXPECT_EQ("design the plugin architecture", s["task"]);
    EXPECT_EQ(36u, s["agent_id"].get<std::string>().size());
    EXPECT_EQ('Z', s["created_at"].get<std::string>().back());
    EXPECT_NE(std::string::npos, result.text.find("Background Agent Spawned"));
    EXPECT_NE(std::string::npos, result.text.find("```json"));
}

TEST_F(AgentToolsTest, SpawnValidationErrors) {
    auto missing = router_.call("agent_spawn", json::object());
    EXPECT_TRUE(missing.is_error);
    EXPECT_EQ("Error: task is required", missing.text);

    auto bad_role = router_.call("agent_spawn", {{"task", "x"}, {"role", "intern"}});
    EXPECT_TRUE(bad_role.is_error);
    EXPECT_NE(std::string::npos, bad_role.text.find("failed to spawn agent: invalid role 'intern'"));

    auto bad_timeout = router_.call("agent_spawn", {{"task", "x"}, {"timeout", "soon"}});
    EXPECT_TRUE(bad_timeout.is_error);

    auto zero_timeout = router_.call("agent_spawn", {{"task", "x"}, {"timeout_seconds", 0}});
    EXPECT_TRUE(zero_timeout.is_error);

    auto wrong_type = router_.call("agent_spawn", {{"task", 42}});
    EXPECT_TRUE(wrong_type.is_error);
    EXPECT_NE(std::string::npos, wrong_type.text.find("invalid request: "));

    EXPECT_EQ(0u, manager_.count());
}

TEST_F(AgentToolsTest, SpawnRejectsTimeoutOutsideIntRange) {
    auto huge = router_.call("agent_spawn", {{"task", "x"}, {"timeout", 4294967297LL}});
    EXPECT_TRUE(huge.is_error);
    EXPECT_NE(std::string::npos, huge.text.find("timeout must be a positive integer"));

    auto negative = router_.call("agent_spawn", {{"task", "x"}, {"timeout", -1}});
    EXPECT_TRUE(negative.is_error);
    EXPECT_NE(std::string::npos, negative.text.find("timeout must be a positive integer"));

    auto just_over = router_.call("agent_spawn",
        {{"task", "x"}, {"timeout_seconds", static_cast<int64_t>(std::numeric_limits<int>::max()) + 1}});
    EXPECT_TRUE(just_over.is_error);

    EXPECT_EQ(0u, manager_.count());

    auto largest = router_.call("agent_spawn", {{"task", "x"}, {"timeout", std::numeric_limits<int>::max()}});
    EXPECT_FALSE(largest.is_error) << largest.text;
    EXPECT_EQ(1u, manager_.count());
}

TEST_F(AgentToolsTest, SpawnReportsLimit) {
    spawn_running("one");
    spawn_running("two");
    spawn_running("three");
    auto result = router_.call("agent_spawn", {{"task", "four"}});
    EXPECT_TRUE(result.is_error);
    EXPECT_NE(std::string::npos, result.text.find("max concurrent agents (3) reached"));
}

TEST_F(AgentToolsTest, StatusReportsSnapshot) {
    auto id = spawn_running("check the logs");

    auto result = router_.call("agent_status", {{"agent_id", id}});
    ASSERT_FALSE(result.is_error) << result.text;
    const auto& s = result.structured;
    EXPECT_EQ(id, s["id"]);
    EXPECT_EQ("running", s["status"]);
    EXPECT_EQ("working\n", s["output"]);
    EXPECT_TRUE(s.contains("started_at"));
    EXPECT_FALSE(s.contains("completed_at"));
    EXPECT_FALSE(s.contains("error"));
    EXPECT_NE(std::string::npos, result.text.find("## Timeline"));
}

TEST_F(AgentToolsTest, StatusUnknownAgent) {
    auto result = router_.call("agent_status", {{"agent_id", "nope"}});
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ("Error: agent not found: nope", result.text);

    auto missing = router_.call("agent_status", json::object());
    EXPECT_TRUE(missing.is_error);
    EXPECT_EQ("Error: agent_id is required", missing.text);
}

TEST_F(AgentToolsTest, ListWithCountsAndFilter) {
    auto first = spawn_running("one");
    auto second = spawn_running("two");
    manager_.kill(first);

    auto all = router_.call("agent_list", json::object());
    ASSERT_FALSE(all.is_error) << all.text;
    EXPECT_EQ(2, all.structured["total_count"]);
    ASSERT_EQ(2u, all.structured["agents"].size());
    EXPECT_EQ(first, all.structured["agents"][0]["id"]);
    EXPECT_EQ(1, all.structured["counts"]["killed"]);
    EXPECT_EQ(1, all.structured["counts"]["running"]);
    EXPECT_EQ(0, all.structured["counts"]["pending"]);
    EXPECT_FALSE(all.structured.contains("status_filter"));

    auto running = router_.call("agent_list", {{"status", "running"}});
    ASSERT_FALSE(running.is_error);
    EXPECT_EQ(1, running.structured["total_count"]);
    EXPECT_EQ(second, running.structured["agents"][0]["id"]);
    EXPECT_EQ("running", running.structured["status_filter"]);
    EXPECT_EQ(json({{"running", 1}}), running.structured["counts"]);

    auto invalid = router_.call("agent_list", {{"status", "sleeping"}});
    EXPECT_TRUE(invalid.is_error);
    EXPECT_NE(std::string::npos, invalid.text.find("invalid status 'sleeping'"));
}

TEST_F(AgentToolsTest, ListEmptyRegistry) {
    auto result = router_.call("agent_list", json::object());
    ASSERT_FALSE(result.is_error);
    EXPECT_EQ(0, result.structured["total_count"]);
    EXPECT_NE(std::string::npos, result.text.find("No agents found."));
}

TEST_F(AgentToolsTest, KillThenKillAgain) {
    auto id = spawn_running("long job");

    auto killed = router_.call("agent_kill", {{"agent_id", id}});
    ASSERT_FALSE(killed.is_error) << killed.text;
    EXPECT_EQ("killed", killed.structured["status"]);
    EXPECT_EQ("Agent " + id + " terminated successfully", killed.structured["message"]);

    auto again = router_.call("agent_kill", {{"agent_id", id}});
    ASSERT_FALSE(again.is_error);
    EXPECT_EQ("killed", again.structured["status"]);
    EXPECT_EQ("Agent " + id + " already killed", again.structured["message"]);

    auto unknown = router_.call("agent_kill", {{"agent_id", "ghost"}});
    EXPECT_TRUE(unknown.is_error);
    EXPECT_EQ("Error: agent not found: ghost", unknown.text);
}

TEST_F(AgentToolsTest, OutputWithAndWithoutFilter) {
    auto id = spawn_running("stream things");
    auto agent = manager_.get(id).agent;
    agent->append_output("ERROR: disk full\n");
    agent->append_output("info: retrying\n");

    auto full = router_.call("agent_output", {{"agent_id", id}});
    ASSERT_FALSE(full.is_error);
    EXPECT_EQ("working\nERROR: disk full\ninfo: retrying\n", full.structured["output"]);
    EXPECT_EQ("", full.structured["filter"]);

    auto filtered = router_.call("agent_output", {{"agent_id", id}, {"filter_pattern", "(?i)error"}});
    ASSERT_FALSE(filtered.is_error);
    EXPECT_EQ("ERROR: disk full", filtered.structured["output"]);
    EXPECT_NE(std::string::npos, filtered.text.find("(Filtered output)"));

    auto bad = router_.call("agent_output", {{"agent_id", id}, {"filter_pattern", "[oops"}});
    EXPECT_TRUE(bad.is_error);
    EXPECT_NE(std::string::npos, bad.text.find("failed to filter output: invalid regex pattern"));
}

TEST(ToolRouterTest, UnknownToolIsError) {
    tools::ToolRouter router;
    EXPECT_FALSE(router.has("missing"));
    auto result = router.call("missing", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ("Error: tool 'missing' not found", result.text);

    auto wire = result.to_json();
    EXPECT_TRUE(wire["isError"].get<bool>());
    EXPECT_FALSE(wire.contains("structuredContent"));
    EXPECT_EQ("text", wire["content"][0]["type"]);
}

TEST(ToolRouterTest, SuccessfulResultCarriesStructuredContent) {
    tools::ToolRouter router;
    router.register_tool(tools::ToolDefinition{"echo", "Echo arguments", {{"type", "object"}}},
                         [](const json& args) {
                             tools::ToolResult result;
                             result.structured = args;
                             result.text = "echoed";
                             return result;
                         });
    auto wire = router.call("echo", {{"x", 1}}).to_json();
    EXPECT_FALSE(wire["isError"].get<bool>());
    EXPECT_EQ(1, wire["structuredContent"]["x"]);
    EXPECT_EQ("echoed", wire["content"][0]["text"]);
}

TEST(FormatTest, Durations) {
    using std::chrono::milliseconds;
    EXPECT_EQ("850ms", tools::format_duration(milliseconds(850)));
    EXPECT_EQ("1.250s", tools::format_duration(milliseconds(1250)));
    EXPECT_EQ("2m3.500s", tools::format_duration(milliseconds(123500)));
}

TEST(FormatTest, Iso8601IsUtc) {
    auto epoch = agent::TimePoint{};
    EXPECT_EQ("1970-01-01T00:00:00Z", tools::format_iso8601(epoch));
    EXPECT_EQ("1970-01-01 00:00:00", tools::format_timestamp(epoch));
}

TEST(ToolRouterTest, HandlerExceptionBecomesErrorResult) {
    tools::ToolRouter router;
    router.register_tool(tools::ToolDefinition{"explode", "Always throws", {{"type", "object"}}},
                         [](const json&) -> tools::ToolResult { throw std::bad_alloc(); });
    router.register_tool(tools::ToolDefinition{"broken", "Throws a runtime error", {{"type", "object"}}},
                         [](const json&) -> tools::ToolResult { throw std::runtime_error("disk gone"); });

    auto oom = router.call("explode", json::object());
    EXPECT_TRUE(oom.is_error);
    EXPECT_EQ(0u, oom.text.rfind("Error: tool 'explode' failed: ", 0));

    auto broken = router.call("broken", json::object());
    EXPECT_TRUE(broken.is_error);
    EXPECT_EQ("Error: tool 'broken' failed: disk gone", broken.text);
}
