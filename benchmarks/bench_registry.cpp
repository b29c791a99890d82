#include <benchmark/benchmark.h>
#include "sshmcp/registry.hpp"
#include "sshmcp/descriptor.hpp"
#include "sshmcp/meta_tools.hpp"
#include "test_util.hpp"
#include <memory>
#include <string>

using namespace sshmcp;

// Directory with N generated tools (returned via unique_ptr so it is cleaned up once)
static std::unique_ptr<sshmcp::testing::TempDir> make_tools(int n) {
    auto dir = std::make_unique<sshmcp::testing::TempDir>();
    for (int i = 0; i < n; ++i) {
        std::string id = "cat" + std::to_string(i % 10) + ".tool_" + std::to_string(i);
        sshmcp::testing::write_tool(dir->path(), id, "echo '{}'",
            "# Tool: " + id + " - Generated tool\n"
            "# Tags: bench, group" + std::to_string(i % 5) + "\n"
            "#\n"
            "# Schema:\n"
            "# {\"type\": \"object\", \"properties\": {\"n\": {\"type\": \"integer\"}}}\n"
            "# End Schema\n");
    }
    return dir;
}

static void BM_ScanRegistry(benchmark::State& state) {
    auto dir = make_tools(static_cast<int>(state.range(0)));
    SearchPolicy policy({dir->path()});

    for (auto _ : state) {
        auto reg = ToolRegistry::scan(policy, MetaTools::ids());
        benchmark::DoNotOptimize(reg);
    }
}
BENCHMARK(BM_ScanRegistry)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);

static void BM_ResolveKnownTool(benchmark::State& state) {
    auto dir = make_tools(100);
    auto reg = ToolRegistry::scan(SearchPolicy({dir->path()}), MetaTools::ids());

    for (auto _ : state) {
        auto entry = reg.resolve("cat3.tool_53");
        benchmark::DoNotOptimize(entry);
    }
}
BENCHMARK(BM_ResolveKnownTool)->MinTime(1.0);

static void BM_ParseHeader(benchmark::State& state) {
    const std::string source =
        "#!/bin/bash\n"
        "# Tool: system.info - Returns basic system information\n"
        "# Author: ssh-mcp Team\n"
        "# Version: 0.1.0\n"
        "# Tags: system, monitoring, diagnostics\n"
        "#\n"
        "# Args:\n"
        "#   verbose: Set to true for more detailed information (boolean)\n"
        "#\n"
        "# Schema:\n"
        "# {\"type\": \"object\", \"properties\": {\"verbose\": {\"type\": \"boolean\"}}}\n"
        "# End Schema\n"
        "\n"
        "echo '{}'\n";

    for (auto _ : state) {
        auto d = DescriptorParser::parse_header("system.info", source);
        benchmark::DoNotOptimize(d);
    }
}
BENCHMARK(BM_ParseHeader)->MinTime(1.0);

static void BM_DiscoverByTag(benchmark::State& state) {
    auto dir = make_tools(static_cast<int>(state.range(0)));
    auto reg = ToolRegistry::scan(SearchPolicy({dir->path()}), MetaTools::ids());
    MetaTools meta(reg);
    const nlohmann::json args = {{"tags", {"group2"}}};

    for (auto _ : state) {
        auto result = meta.discover(args);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DiscoverByTag)->Arg(10)->Arg(100)->MinTime(1.0);
