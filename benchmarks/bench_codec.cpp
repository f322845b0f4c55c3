#include <benchmark/benchmark.h>
#include "mcpkit/codec.hpp"
#include "mcpkit/json_rpc.hpp"
#include <string>

using namespace mcpkit;

static const std::string kPing =
    R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

static const std::string kToolCall =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"calculate","arguments":{"operation":"divide","a":84,"b":2}}})";

// tools/list response with n tools
static std::string make_listing(int n) {
    nlohmann::json tools = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        tools.push_back({
            {"name", "tool_" + std::to_string(i)},
            {"description", "Does something useful, number " + std::to_string(i)},
            {"inputSchema", {
                {"type", "object"},
                {"properties", {
                    {"a", {{"type", "number"}}},
                    {"b", {{"type", "number"}}}
                }},
                {"required", {"a", "b"}}
            }}
        });
    }
    return nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}, {"nextCursor", "50"}}}}.dump();
}

static const std::string kListing = make_listing(50);

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kPing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kPing.size());
}
BENCHMARK(BM_ParsePing);

static void BM_ParseToolCall(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kToolCall);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kToolCall.size());
}
BENCHMARK(BM_ParseToolCall);

static void BM_ParseListing(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kListing);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kListing.size());
}
BENCHMARK(BM_ParseListing);

static void BM_DecodeErrorPath(benchmark::State& state) {
    const std::string bad = "{this is not json";
    for (auto _ : state) {
        try {
            auto msg = Codec::parse(bad);
            benchmark::DoNotOptimize(msg);
        } catch (const McpError& e) {
            auto resp = Codec::decode_error_response(e);
            benchmark::DoNotOptimize(resp);
        }
    }
}
BENCHMARK(BM_DecodeErrorPath);

static void BM_SerializeResponse(benchmark::State& state) {
    auto msg = Codec::parse(kListing);
    for (auto _ : state) {
        auto s = Codec::serialize(msg);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * kListing.size());
}
BENCHMARK(BM_SerializeResponse);

static void BM_SerializeNotification(benchmark::State& state) {
    JsonRpcNotification notif;
    notif.method = "resources/updated";
    notif.params = nlohmann::json{{"uri", "http://server/status"}};
    for (auto _ : state) {
        auto s = Codec::serialize(notif);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeNotification);
