#include <benchmark/benchmark.h>
#include "sshmcp/dispatcher.hpp"
#include "test_util.hpp"
#include <filesystem>
#include <memory>
#include <string>

using namespace sshmcp;

// Dispatcher over the sample tools plus one trivial echo tool, request log off
struct DispatchFixture {
    sshmcp::testing::TempDir tools;
    sshmcp::testing::TempDir scratch;
    std::unique_ptr<Dispatcher> dispatcher;

    DispatchFixture() {
        sshmcp::testing::write_tool(tools.path(), "bench.echo", R"(cat "$1")");

        Dispatcher::Options opts;
        opts.policy = SearchPolicy({tools.path(), std::filesystem::path(SSHMCP_SAMPLE_TOOLS_DIR)});
        opts.sandbox.temp_dir = scratch.path();
        dispatcher = std::make_unique<Dispatcher>(opts);
    }
};

static void BM_DispatchInvalidJson(benchmark::State& state) {
    DispatchFixture f;
    for (auto _ : state) {
        auto r = f.dispatcher->handle("not json");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchInvalidJson)->MinTime(1.0);

static void BM_DispatchUnknownTool(benchmark::State& state) {
    DispatchFixture f;
    for (auto _ : state) {
        auto r = f.dispatcher->handle(R"({"tool":"no.such.tool"})");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchUnknownTool)->MinTime(1.0);

static void BM_DispatchMetaDiscover(benchmark::State& state) {
    DispatchFixture f;
    for (auto _ : state) {
        auto r = f.dispatcher->handle(R"({"tool":"meta.discover","args":{}})");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchMetaDiscover)->MinTime(1.0);

// Full fork/exec round trip through the interpreter
static void BM_DispatchScriptTool(benchmark::State& state) {
    DispatchFixture f;
    for (auto _ : state) {
        auto r = f.dispatcher->handle(R"({"tool":"bench.echo","args":{"text":"hello"}})");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchScriptTool)->MinTime(2.0)->Unit(benchmark::kMillisecond);
