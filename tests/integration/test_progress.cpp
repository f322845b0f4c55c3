#include <gtest/gtest.h>
#include "mcpkit/server.hpp"
#include "../support/test_support.hpp"
#include <future>

using namespace mcpkit;
using namespace mcpkit::test;

namespace {

McpServer::Options notify_options() {
    McpServer::Options opts;
    opts.server_info = {"notify-server", "1.0"};
    opts.worker_threads = 2;
    return opts;
}

} // namespace

TEST(ProgressE2E, ToolReportsProgressToItsCaller) {
    McpServer server(notify_options());
    server.add_tool(tool_info("long_task"), [&server](const nlohmann::json& args) {
        ProgressParams p;
        p.progress_token = args.at("token").get<std::string>();
        p.total = 1.0;
        for (double step : {0.25, 0.5, 1.0}) {
            p.progress = step;
            server.send_progress("stdio", p);
        }
        return text_result("done");
    });
    StdioSession session(server);
    session.initialize();

    auto resp = session.peer.call(1, "tools/call",
        nlohmann::json{{"name", "long_task"}, {"arguments", {{"token", "job-7"}}}});
    ASSERT_TRUE(resp.result.has_value());

    ASSERT_EQ(session.peer.notifications.size(), 3u);
    for (const auto& n : session.peer.notifications) {
        EXPECT_EQ(n.method, methods::Progress);
        EXPECT_EQ((*n.params)["progressToken"], "job-7");
    }
    EXPECT_EQ((*session.peer.notifications.back().params)["progress"], 1.0);
}

TEST(ProgressE2E, PeerProgressReachesHook) {
    McpServer server(notify_options());
    std::promise<ProgressParams> seen;
    auto future = seen.get_future();
    std::atomic<bool> delivered{false};
    server.set_progress_handler([&](const std::string&, const ProgressParams& p) {
        if (!delivered.exchange(true)) seen.set_value(p);
    });
    StdioSession session(server);
    session.initialize();

    session.peer.send(make_notification("progress", nlohmann::json{{"progressToken", 42}, {"progress", 0.75}}));
    ASSERT_EQ(future.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    auto p = future.get();
    EXPECT_EQ(std::get<int64_t>(p.progress_token), 42);
    EXPECT_DOUBLE_EQ(p.progress, 0.75);
}

TEST(ProgressE2E, InvalidProgressIsDropped) {
    McpServer server(notify_options());
    std::atomic<int> hook_calls{0};
    server.set_progress_handler([&](const std::string&, const ProgressParams&) { ++hook_calls; });
    StdioSession session(server);
    session.initialize();

    session.peer.send(make_notification("progress", nlohmann::json{{"progressToken", ""}, {"progress", 0.5}}));
    session.peer.send(make_notification("progress", nlohmann::json{{"progress", 0.5}}));
    // A round trip after the notifications; the connection is unaffected.
    ASSERT_TRUE(session.peer.call(1, "ping").result.has_value());
    session.stop();
    EXPECT_EQ(hook_calls.load(), 0);
}

TEST(LoggingE2E, SetLevelFiltersServerLogMessages) {
    McpServer server(notify_options());
    StdioSession session(server);
    session.initialize();

    ASSERT_TRUE(session.peer.call(1, "logging/setLevel", nlohmann::json{{"level", "warning"}}).result);
    EXPECT_EQ(server.log_message(LogLevel::Info, "app", "quiet"), 0u);
    EXPECT_EQ(server.log_message(LogLevel::Error, "app", "loud"), 1u);

    auto msg = session.peer.read_message();
    ASSERT_TRUE(msg.has_value());
    auto* notif = std::get_if<JsonRpcNotification>(&*msg);
    ASSERT_NE(notif, nullptr);
    EXPECT_EQ(notif->method, methods::LoggingMessage);
    EXPECT_EQ((*notif->params)["level"], "error");
    EXPECT_EQ((*notif->params)["data"], "loud");
}

TEST(SamplingE2E, ForwardedToHandler) {
    McpServer server(notify_options());
    server.set_sampling_handler([](const CreateMessageParams& p) {
        CreateMessageResult r;
        r.role = "assistant";
        r.model = "stub";
        r.content = TextContent{std::to_string(p.messages.size()) + " message(s)"};
        r.stop_reason = "endTurn";
        return r;
    });
    StdioSession session(server);
    EXPECT_TRUE(session.initialize()["capabilities"].contains("sampling"));

    nlohmann::json params = {
        {"messages", {{{"role", "user"}, {"content", {{"type", "text"}, {"text", "hi"}}}}}},
        {"maxTokens", 32}
    };
    auto resp = session.peer.call(1, "sampling/createMessage", params);
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ((*resp.result)["content"]["text"], "1 message(s)");
    EXPECT_EQ((*resp.result)["stopReason"], "endTurn");
}
