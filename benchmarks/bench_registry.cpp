#include <benchmark/benchmark.h>
#include "mcpkit/registry.hpp"
#include <string>

using namespace mcpkit;

namespace {

class NoopResource : public ResourceHandler {
public:
    std::vector<ResourceContent> read(const std::string& uri, const QueryParams&) override {
        return {ResourceContent{uri, std::nullopt, std::string(), std::nullopt}};
    }
};

void fill(ResourceRegistry& reg, int n) {
    auto handler = std::make_shared<NoopResource>();
    for (int i = 0; i < n; ++i) {
        ResourceInfo info;
        info.uri = "file:///data/" + std::to_string(i) + "/";
        info.name = "r" + std::to_string(i);
        reg.add(info.uri, info, handler);
    }
}

} // namespace

static void BM_RegistryExactLookup(benchmark::State& state) {
    ResourceRegistry reg;
    fill(reg, static_cast<int>(state.range(0)));
    const std::string key = "file:///data/0/";
    for (auto _ : state) {
        auto h = reg.get(key);
        benchmark::DoNotOptimize(h);
    }
}
BENCHMARK(BM_RegistryExactLookup)->Arg(10)->Arg(1000);

static void BM_RegistryPrefixResolve(benchmark::State& state) {
    ResourceRegistry reg;
    fill(reg, static_cast<int>(state.range(0)));
    const std::string uri = "file:///data/7/report.txt?lines=10";
    for (auto _ : state) {
        auto e = reg.resolve(uri);
        benchmark::DoNotOptimize(e);
    }
}
BENCHMARK(BM_RegistryPrefixResolve)->Arg(10)->Arg(1000);

static void BM_RegistryAdd(benchmark::State& state) {
    ResourceRegistry reg;
    fill(reg, static_cast<int>(state.range(0)));
    auto handler = std::make_shared<NoopResource>();
    ResourceInfo info;
    info.uri = "file:///churn/";
    info.name = "churn";
    for (auto _ : state) {
        reg.add(info.uri, info, handler);
    }
}
BENCHMARK(BM_RegistryAdd)->Arg(10)->Arg(1000);

static void BM_RegistryListPage(benchmark::State& state) {
    ResourceRegistry reg;
    fill(reg, 1000);
    const std::optional<std::string> cursor = std::string("500");
    for (auto _ : state) {
        auto page = reg.list(50, cursor);
        benchmark::DoNotOptimize(page);
    }
}
BENCHMARK(BM_RegistryListPage);
