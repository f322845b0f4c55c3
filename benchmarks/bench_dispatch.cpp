#include <benchmark/benchmark.h>
#include "mcpkit/connection.hpp"
#include "mcpkit/dispatcher.hpp"
#include "mcpkit/server_context.hpp"
#include "mcpkit/version.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace mcpkit;

namespace {

class NullChannel : public IChannel {
public:
    const std::string& id() const override { return id_; }
    TransportKind kind() const override { return TransportKind::LineStream; }
    void send(const JsonRpcResponse&) override {}
    bool push(const JsonRpcNotification&) override { return true; }
    void close() override {}
    bool is_open() const override { return true; }

private:
    std::string id_ = "bench";
};

ServerContext::Settings bench_settings() {
    ServerContext::Settings s;
    s.server_info = {"bench-server", "1.0"};
    s.page_size = 50;
    s.supported_versions = {std::string(PROTOCOL_VERSION)};
    return s;
}

JsonRpcRequest request(int64_t id, std::string method, nlohmann::json params = nlohmann::json::object()) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

/// Context with n tools and a ready connection.
struct DispatchFixture {
    explicit DispatchFixture(int n_tools)
        : ctx(bench_settings()), dispatcher(ctx),
          conn(std::make_shared<Connection>(std::make_shared<NullChannel>())) {
        for (int i = 0; i < n_tools; ++i) {
            ToolInfo info;
            info.name = "tool_" + std::to_string(i);
            info.input_schema = {{"type", "object"}};
            ctx.tools.add(info.name, info, make_tool([](const nlohmann::json& args) {
                return text_result(args.dump());
            }));
        }
        nlohmann::json init = {
            {"protocolVersion", PROTOCOL_VERSION},
            {"capabilities", nlohmann::json::object()},
            {"clientInfo", {{"name", "bench"}, {"version", "1"}}}};
        auto resp = dispatcher.handle_request(*conn, request(0, "initialize", init));
        if (resp.error) throw McpError("initialize failed: " + resp.error->message);
    }

    ServerContext ctx;
    Dispatcher dispatcher;
    ConnectionPtr conn;
};

} // namespace

static void BM_DispatchPing(benchmark::State& state) {
    DispatchFixture f(1);
    auto req = request(1, "ping");
    for (auto _ : state) {
        auto resp = f.dispatcher.handle_request(*f.conn, req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchPing);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    DispatchFixture f(1);
    auto req = request(1, "no/such/method");
    for (auto _ : state) {
        auto resp = f.dispatcher.handle_request(*f.conn, req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod);

static void BM_DispatchToolCall(benchmark::State& state) {
    DispatchFixture f(static_cast<int>(state.range(0)));
    auto req = request(1, "tools/call", {{"name", "tool_0"}, {"arguments", {{"x", 1}}}});
    for (auto _ : state) {
        auto resp = f.dispatcher.handle_request(*f.conn, req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolCall)->Arg(1)->Arg(100)->Arg(1000);

static void BM_DispatchToolsListPage(benchmark::State& state) {
    DispatchFixture f(static_cast<int>(state.range(0)));
    auto req = request(1, "tools/list");
    for (auto _ : state) {
        auto resp = f.dispatcher.handle_request(*f.conn, req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchToolsListPage)->Arg(10)->Arg(500);

static void BM_DispatchProgressNotification(benchmark::State& state) {
    DispatchFixture f(1);
    f.ctx.set_progress_handler([](const std::string&, const ProgressParams&) {});
    JsonRpcNotification notif;
    notif.method = "progress";
    notif.params = nlohmann::json{{"progressToken", "job-1"}, {"progress", 0.5}, {"total", 1.0}};
    for (auto _ : state) {
        f.dispatcher.handle_notification(*f.conn, notif);
    }
}
BENCHMARK(BM_DispatchProgressNotification);
