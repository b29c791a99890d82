#include <gtest/gtest.h>
#include "sshmcp/dispatcher.hpp"
#include "sshmcp/codec.hpp"
#include "test_util.hpp"

using namespace sshmcp;
using sshmcp::testing::TempDir;
using sshmcp::testing::write_tool;
using sshmcp::testing::read_lines;
using sshmcp::testing::count_files_with_prefix;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_tool(tools_.path(), "test.echo", R"(cat "$1")",
                   "# Tool: test.echo - Echoes its arguments\n"
                   "# Tags: test\n");
        write_tool(tools_.path(), "test.fail", "echo 'something broke' >&2\nexit 2",
                   "# Tool: test.fail - Always fails\n"
                   "# Tags: test\n");
        write_tool(tools_.path(), "test.sleep", "sleep 30\necho '{}'",
                   "# Tool: test.sleep - Sleeps too long\n");
        write_tool(tools_.path(), "test.text", "echo 'plain text'",
                   "# Tool: test.text - Prints text, not JSON\n");
    }

    Dispatcher::Options options() {
        Dispatcher::Options opts;
        opts.policy = SearchPolicy({tools_.path(), std::filesystem::path(SSHMCP_SAMPLE_TOOLS_DIR)});
        opts.sandbox.timeout = 10s;
        opts.sandbox.kill_grace = 500ms;
        opts.sandbox.temp_dir = scratch_.path();
        opts.log_file = state_ / "mcp.log";
        return opts;
    }

    json run(Dispatcher& d, const std::string& payload, int expected_exit = 0) {
        auto result = d.handle(payload);
        EXPECT_EQ(result.exit_code, expected_exit) << payload;
        EXPECT_EQ(result.body.find('\n'), std::string::npos);
        auto envelope = json::parse(result.body);
        // exactly one of result / error
        EXPECT_NE(envelope["result"].is_null(), envelope["error"].is_null()) << result.body;
        return envelope;
    }

    TempDir tools_;
    TempDir scratch_;
    TempDir state_;
};

} // namespace

TEST_F(DispatcherTest, SystemInfoScenario) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"system.info","args":{"verbose":false},"conversation_id":"c-42"})");
    EXPECT_EQ(env["conversation_id"], "c-42");
    EXPECT_EQ(env["status"]["code"], 0);
    ASSERT_TRUE(env["result"].is_object());
    ASSERT_TRUE(env["result"]["hostname"].is_string());
    EXPECT_FALSE(env["result"]["hostname"].get<std::string>().empty());
    EXPECT_TRUE(env["explanation"].is_string());
    EXPECT_TRUE(env["suggestions"].is_array());
}

TEST_F(DispatcherTest, UnknownToolIs404) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"no.such.tool"})");
    EXPECT_EQ(env["conversation_id"], "none");
    EXPECT_EQ(env["status"]["code"], 404);
    EXPECT_EQ(env["error"]["code"], "TOOL_NOT_FOUND");
    EXPECT_EQ(env["error"]["details"]["tool"], "no.such.tool");
}

TEST_F(DispatcherTest, TraversalIdIs404) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"../test.echo"})");
    EXPECT_EQ(env["status"]["code"], 404);
}

TEST_F(DispatcherTest, InvalidJsonNeverTouchesRegistry) {
    Dispatcher d(options());
    auto env = run(d, "not json", 1);
    EXPECT_EQ(env["status"]["code"], 400);
    EXPECT_EQ(env["status"]["message"], "Invalid JSON");
    EXPECT_EQ(env["error"]["code"], "INVALID_JSON");
    EXPECT_TRUE(env["error"]["details"].contains("reason"));
    EXPECT_EQ(d.registry_scans(), 0u);
}

TEST_F(DispatcherTest, EmptyBodyIsInvalidJson) {
    Dispatcher d(options());
    auto env = run(d, "\n", 1);
    EXPECT_EQ(env["error"]["code"], "INVALID_JSON");
}

TEST_F(DispatcherTest, StructuralViolationIsInvalidRequest) {
    Dispatcher d(options());
    auto env = run(d, R"({"args":{},"conversation_id":"c9"})");
    EXPECT_EQ(env["conversation_id"], "c9");
    EXPECT_EQ(env["status"]["code"], 400);
    EXPECT_EQ(env["error"]["code"], "INVALID_REQUEST");
    EXPECT_EQ(d.registry_scans(), 0u);
}

TEST_F(DispatcherTest, MissingJsonBackend) {
    auto opts = options();
    opts.json_available = [] { return false; };
    Dispatcher d(opts);
    auto env = run(d, R"({"tool":"system.info"})", 1);
    EXPECT_EQ(env["error"]["code"], "MISSING_DEPENDENCY");
    EXPECT_EQ(env["status"]["code"], 500);
}

TEST_F(DispatcherTest, ToolArgumentsRoundTrip) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"test.echo","args":{"path":"/tmp/a b","n":[1,2]}})");
    EXPECT_EQ(env["result"]["path"], "/tmp/a b");
    EXPECT_EQ(env["result"]["n"], json({1, 2}));
    EXPECT_EQ(count_files_with_prefix(scratch_.path(), "sshmcp-args-"), 0u);
}

TEST_F(DispatcherTest, FailingToolReportsExitCodeAndStderr) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"test.fail"})");
    EXPECT_EQ(env["status"]["code"], 2);
    EXPECT_EQ(env["error"]["code"], "EXECUTION_ERROR");
    EXPECT_EQ(env["error"]["message"], "something broke");
    EXPECT_EQ(env["error"]["details"]["exit_code"], 2);
    EXPECT_EQ(count_files_with_prefix(scratch_.path(), "sshmcp-args-"), 0u);
}

TEST_F(DispatcherTest, NonJsonOutputIs502) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"test.text"})");
    EXPECT_EQ(env["status"]["code"], 502);
    EXPECT_EQ(env["error"]["code"], "INVALID_TOOL_OUTPUT");
}

TEST_F(DispatcherTest, TimeoutIsReported) {
    auto opts = options();
    opts.sandbox.timeout = 300ms;
    Dispatcher d(opts);
    auto env = run(d, R"({"tool":"test.sleep"})");
    EXPECT_EQ(env["status"]["code"], 124);
    EXPECT_EQ(env["error"]["code"], "EXECUTION_TIMEOUT");
    EXPECT_EQ(count_files_with_prefix(scratch_.path(), "sshmcp-args-"), 0u);
}

TEST_F(DispatcherTest, DiscoverThenDescribeEveryTool) {
    Dispatcher d(options());
    auto listing = run(d, R"({"tool":"meta.discover","args":{}})");
    ASSERT_EQ(listing["status"]["code"], 0);
    ASSERT_GE(listing["result"]["count"].get<size_t>(), 8u);

    for (const auto& tool : listing["result"]["tools"]) {
        json req = {{"tool", "meta.describe"}, {"args", {{"tool", tool["name"]}}}};
        auto described = run(d, req.dump());
        EXPECT_EQ(described["status"]["code"], 0) << tool["name"];
        EXPECT_EQ(described["result"]["tool"], tool["name"]);
    }
}

TEST_F(DispatcherTest, SchemaAgreesWithDescribe) {
    Dispatcher d(options());
    for (const char* id : {"system.info", "test.echo", "meta.discover", "meta.schema"}) {
        json args = {{"tool", id}};
        auto schema = run(d, json({{"tool", "meta.schema"}, {"args", args}}).dump());
        auto describe = run(d, json({{"tool", "meta.describe"}, {"args", args}}).dump());
        EXPECT_EQ(schema["result"]["schema"], describe["result"]["schema"]) << id;
    }
}

TEST_F(DispatcherTest, DiscoverIsIdempotent) {
    Dispatcher d(options());
    const std::string req = R"({"tool":"meta.discover","args":{"category":"test"}})";
    auto first = d.handle(req);
    auto second = d.handle(req);
    EXPECT_EQ(first.body, second.body);
    EXPECT_EQ(first.response.result->at("count"), 4);
}

TEST_F(DispatcherTest, MetaInvalidArguments) {
    Dispatcher d(options());
    auto env = run(d, R"({"tool":"meta.describe","args":{}})");
    EXPECT_EQ(env["status"]["code"], 400);
    EXPECT_EQ(env["error"]["code"], "INVALID_ARGUMENTS");

    env = run(d, R"({"tool":"meta.describe","args":{"tool":"no.such.tool"}})");
    EXPECT_EQ(env["status"]["code"], 404);
}

TEST_F(DispatcherTest, NewToolVisibleWithoutRestart) {
    Dispatcher d(options());
    EXPECT_EQ(run(d, R"({"tool":"test.late"})")["status"]["code"], 404);
    write_tool(tools_.path(), "test.late", R"(echo '{"late":true}')");
    EXPECT_EQ(run(d, R"({"tool":"test.late"})")["result"]["late"], true);
}

TEST_F(DispatcherTest, RequestLogRecordsBothDirections) {
    Dispatcher d(options());
    (void)d.handle("{\"tool\":\"test.echo\",\n\"conversation_id\":\"log-1\"}\n");
    (void)d.handle("not json");

    auto lines = read_lines(state_ / "mcp.log");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_NE(lines[0].find("[log-1] REQUEST: "), std::string::npos);
    EXPECT_NE(lines[1].find("[log-1] RESPONSE: "), std::string::npos);
    EXPECT_NE(lines[2].find("[none] REQUEST: not json"), std::string::npos);
    EXPECT_NE(lines[3].find("[none] RESPONSE: "), std::string::npos);
}

TEST_F(DispatcherTest, DisabledLogWritesNothing) {
    auto opts = options();
    opts.log_file.clear();
    Dispatcher d(opts);
    (void)d.handle(R"({"tool":"meta.discover"})");
    EXPECT_FALSE(std::filesystem::exists(state_ / "mcp.log"));
}

TEST_F(DispatcherTest, OptionsFromConfig) {
    auto cfg = Config::defaults("/opt/x", state_.path());
    cfg.log_enabled = false;
    cfg.timeout = 5s;
    auto opts = Dispatcher::options_from(cfg);
    EXPECT_EQ(opts.policy.directories(), cfg.tool_dirs);
    EXPECT_EQ(opts.sandbox.timeout, 5s);
    EXPECT_TRUE(opts.log_file.empty());
}
