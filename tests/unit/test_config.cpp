#include <gtest/gtest.h>
#include "sshmcp/config.hpp"
#include "sshmcp/error.hpp"
#include "test_util.hpp"
#include <limits>
#include <map>

using namespace sshmcp;
using sshmcp::testing::TempDir;
using sshmcp::testing::write_file;
using namespace std::chrono_literals;

namespace {

/// getenv replacement backed by a map.
struct FakeEnv {
    std::map<std::string, std::string> vars;

    std::function<const char*(const char*)> fn() const {
        return [this](const char* name) -> const char* {
            auto it = vars.find(name);
            return it == vars.end() ? nullptr : it->second.c_str();
        };
    }
};

} // namespace

TEST(Config, Defaults) {
    auto cfg = Config::defaults("/opt/ssh-mcp", "/home/u/.ssh-mcp");
    ASSERT_EQ(cfg.tool_dirs.size(), 3u);
    EXPECT_EQ(cfg.tool_dirs[0], std::filesystem::path("/opt/ssh-mcp/install/tools"));
    EXPECT_EQ(cfg.tool_dirs[1], std::filesystem::path("/opt/share/ssh-mcp/tools"));
    EXPECT_EQ(cfg.tool_dirs[2], std::filesystem::path("/home/u/.ssh-mcp/tools"));
    EXPECT_EQ(cfg.log_file, std::filesystem::path("/home/u/.ssh-mcp/mcp.log"));
    EXPECT_TRUE(cfg.log_enabled);
    EXPECT_EQ(cfg.interpreter, "/bin/bash");
    EXPECT_EQ(cfg.timeout, 60s);
}

TEST(Config, DefaultsFindInstalledTools) {
    // `make install` puts the binary in bin/ and the tools in share/ssh-mcp/tools
    TempDir prefix;
    write_file(prefix / "share" / "ssh-mcp" / "tools" / "system.info.sh", "echo '{}'");
    auto cfg = Config::defaults(prefix / "bin", "/home/u/.ssh-mcp");
    bool found = false;
    for (const auto& dir : cfg.tool_dirs) {
        if (std::filesystem::exists(dir / "system.info.sh")) found = true;
    }
    EXPECT_TRUE(found);
}

TEST(Config, LoadUsesSshmcpHome) {
    TempDir home;
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();

    auto cfg = Config::load("/opt/bin", std::nullopt, env.fn());
    EXPECT_EQ(cfg.home, home.path());
    EXPECT_EQ(cfg.tool_dirs.back(), home / "tools");
    EXPECT_EQ(cfg.log_file, home / "mcp.log");
}

TEST(Config, LoadReadsConfigFile) {
    TempDir home;
    write_file(home / "config.json", R"({
        "tool_dirs": ["custom", "/abs/tools"],
        "log_level": "info",
        "interpreter": "/usr/bin/env",
        "timeout_seconds": 2.5
    })");
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();

    auto cfg = Config::load("/opt/bin", std::nullopt, env.fn());
    ASSERT_EQ(cfg.tool_dirs.size(), 2u);
    EXPECT_EQ(cfg.tool_dirs[0], home / "custom");
    EXPECT_EQ(cfg.tool_dirs[1], std::filesystem::path("/abs/tools"));
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_EQ(cfg.interpreter, "/usr/bin/env");
    EXPECT_EQ(cfg.timeout, 2500ms);
}

TEST(Config, EnvironmentOverridesFile) {
    TempDir home;
    write_file(home / "config.json", R"({"timeout_seconds": 10})");
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();
    env.vars["SSHMCP_TIMEOUT"] = "3";
    env.vars["SSHMCP_TOOL_PATH"] = "/a:/b";
    env.vars["SSHMCP_LOG_FILE"] = "";

    auto cfg = Config::load("/opt/bin", std::nullopt, env.fn());
    EXPECT_EQ(cfg.timeout, 3s);
    ASSERT_GE(cfg.tool_dirs.size(), 4u);
    EXPECT_EQ(cfg.tool_dirs[0], std::filesystem::path("/a"));
    EXPECT_EQ(cfg.tool_dirs[1], std::filesystem::path("/b"));
    EXPECT_FALSE(cfg.log_enabled);
}

TEST(Config, MalformedFileThrows) {
    TempDir home;
    write_file(home / "config.json", "{not json");
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();
    EXPECT_THROW(Config::load("/opt/bin", std::nullopt, env.fn()), ConfigError);
}

TEST(Config, WrongValueTypeThrows) {
    Config cfg;
    EXPECT_THROW(cfg.apply_json({{"timeout_seconds", "soon"}}), ConfigError);
    EXPECT_THROW(cfg.apply_json({{"timeout_seconds", -1}}), ConfigError);
    EXPECT_THROW(cfg.apply_json({{"timeout_seconds", std::numeric_limits<double>::quiet_NaN()}}),
                 ConfigError);
    EXPECT_THROW(cfg.apply_json(nlohmann::json::array()), ConfigError);
}

TEST(Config, ExplicitMissingFileThrows) {
    TempDir home;
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();
    EXPECT_THROW(Config::load("/opt/bin", home / "absent.json", env.fn()), ConfigError);
}

TEST(Config, InvalidTimeoutInEnvironment) {
    TempDir home;
    FakeEnv env;
    env.vars["SSHMCP_HOME"] = home.path().string();
    env.vars["SSHMCP_TIMEOUT"] = "ten";
    EXPECT_THROW(Config::load("/opt/bin", std::nullopt, env.fn()), ConfigError);
}

TEST(Config, PrependToolDirs) {
    auto cfg = Config::defaults("/x", "/h");
    cfg.prepend_tool_dirs({"/first"});
    ASSERT_EQ(cfg.tool_dirs.size(), 4u);
    EXPECT_EQ(cfg.tool_dirs[0], std::filesystem::path("/first"));
    EXPECT_EQ(cfg.tool_dirs[1], std::filesystem::path("/x/install/tools"));
}

TEST(Config, ParseTimeoutSeconds) {
    EXPECT_EQ(parse_timeout_seconds("30"), 30s);
    EXPECT_EQ(parse_timeout_seconds("0.25"), 250ms);
    EXPECT_EQ(parse_timeout_seconds("0"), 0ms);
    EXPECT_THROW(parse_timeout_seconds("-1"), ConfigError);
    EXPECT_THROW(parse_timeout_seconds("5s"), ConfigError);
    EXPECT_THROW(parse_timeout_seconds(""), ConfigError);
}

TEST(Config, TimeoutRejectsNonFinite) {
    EXPECT_THROW(parse_timeout_seconds("inf"), ConfigError);
    EXPECT_THROW(parse_timeout_seconds("nan"), ConfigError);
    EXPECT_THROW(parse_timeout_seconds("-inf"), ConfigError);
}

TEST(Config, HugeTimeoutIsClamped) {
    EXPECT_EQ(parse_timeout_seconds("10000000000"), MAX_TIMEOUT);
    EXPECT_EQ(parse_timeout_seconds("1e300"), MAX_TIMEOUT);
    EXPECT_EQ(parse_timeout_seconds("86400"), MAX_TIMEOUT);
    EXPECT_EQ(parse_timeout_seconds("86399"), 86399s);

    Config cfg;
    cfg.apply_json({{"timeout_seconds", 1e300}});
    EXPECT_EQ(cfg.timeout, MAX_TIMEOUT);
}
