#include <benchmark/benchmark.h>
#include "sshmcp/codec.hpp"
#include "sshmcp/response.hpp"
#include <string>

using namespace sshmcp;

// Typical request (~100 bytes)
static const std::string kSmallRequest =
    R"({"tool":"system.info","args":{"verbose":false},"conversation_id":"c-1"})";

// Request carrying context and a larger args object
static std::string make_large_request(int n) {
    nlohmann::json args = nlohmann::json::object();
    for (int i = 0; i < n; ++i) {
        args["path_" + std::to_string(i)] = "/var/log/service-" + std::to_string(i) + ".log";
    }
    nlohmann::json req = {
        {"tool", "file.list"},
        {"args", args},
        {"conversation_id", "bench"},
        {"context", {{"user_intent", "inspect logs"}, {"reasoning", "user asked"}}}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(200);

// Discover-sized result with N tools
static Response make_listing(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "cat.tool_" + std::to_string(i)},
            {"description", "A tool for doing something useful, number " + std::to_string(i)},
            {"version", "1.0.0"},
            {"author", "Unknown"},
            {"tags", {"bench", "generated"}}
        });
    }
    return ResponseBuilder::success("bench", {{"tools", tools}, {"count", n}});
}

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse_request(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_RejectInvalidJson(benchmark::State& state) {
    const std::string bad = R"({"tool":"system.info","args":{"verbose":)";
    for (auto _ : state) {
        try {
            auto doc = Codec::parse(bad);
            benchmark::DoNotOptimize(doc);
        } catch (const ParseError& e) {
            const char* msg = e.what();
            benchmark::DoNotOptimize(msg);
        }
    }
}
BENCHMARK(BM_RejectInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeErrorEnvelope(benchmark::State& state) {
    auto resp = ResponseBuilder::from_error("bench", ToolNotFoundError("no.such.tool"));
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeErrorEnvelope)->MinTime(1.0);

static void BM_SerializeListing(benchmark::State& state) {
    auto resp = make_listing(static_cast<int>(state.range(0)));
    size_t bytes = Codec::serialize(resp).size();
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * bytes);
}
BENCHMARK(BM_SerializeListing)->Arg(10)->Arg(100)->Arg(1000)->MinTime(1.0);
