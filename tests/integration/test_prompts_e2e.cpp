#include <gtest/gtest.h>
#include "mcpkit/server.hpp"
#include "../support/test_support.hpp"

using namespace mcpkit;
using namespace mcpkit::test;

namespace {

McpServer::Options prompts_options() {
    McpServer::Options opts;
    opts.server_info = {"prompts-server", "1.0"};
    opts.worker_threads = 2;
    return opts;
}

PromptInfo review_info() {
    PromptInfo info;
    info.name = "code_review";
    info.description = "Review a piece of code";
    info.arguments = {{"code", std::string("The code to review"), true},
                      {"language", std::string("Programming language"), false}};
    return info;
}

GetPromptResult review(const nlohmann::json& args) {
    std::string language = args.value("language", std::string("unknown"));
    GetPromptResult r;
    r.description = "Code review";
    r.messages.push_back({"user", TextContent{"Review this " + language + " code:\n" +
                                              args.at("code").get<std::string>()}});
    return r;
}

/// One registration exposing several greetings in its listing.
class Greetings : public PromptHandler {
public:
    GetPromptResult get(const nlohmann::json&) override {
        GetPromptResult r;
        r.messages.push_back({"assistant", TextContent{"Hello!"}});
        return r;
    }
    std::vector<PromptInfo> list() override {
        return {PromptInfo{"greet_formal", std::nullopt, {}}, PromptInfo{"greet_casual", std::nullopt, {}}};
    }
};

} // namespace

TEST(PromptsE2E, ListAndGet) {
    McpServer server(prompts_options());
    server.add_prompt(review_info(), review);
    StdioSession session(server);
    session.initialize();

    auto list = session.peer.call(1, "prompts/list", nlohmann::json::object());
    ASSERT_TRUE(list.result.has_value());
    auto& prompts = (*list.result)["prompts"];
    ASSERT_EQ(prompts.size(), 1u);
    EXPECT_EQ(prompts[0]["name"], "code_review");
    EXPECT_EQ(prompts[0]["arguments"].size(), 2u);

    auto got = session.peer.call(2, "prompts/get",
        nlohmann::json{{"name", "code_review"}, {"arguments", {{"code", "int x;"}, {"language", "C++"}}}});
    ASSERT_TRUE(got.result.has_value());
    auto& msg = (*got.result)["messages"][0];
    EXPECT_EQ(msg["role"], "user");
    EXPECT_EQ(msg["content"]["text"], "Review this C++ code:\nint x;");
}

TEST(PromptsE2E, OptionalArgumentMayBeOmitted) {
    McpServer server(prompts_options());
    server.add_prompt(review_info(), review);
    StdioSession session(server);
    session.initialize();

    auto got = session.peer.call(1, "prompts/get",
        nlohmann::json{{"name", "code_review"}, {"arguments", {{"code", "x = 1"}}}});
    ASSERT_TRUE(got.result.has_value());
    EXPECT_EQ((*got.result)["messages"][0]["content"]["text"], "Review this unknown code:\nx = 1");
}

TEST(PromptsE2E, MissingRequiredArgument) {
    McpServer server(prompts_options());
    server.add_prompt(review_info(), review);
    StdioSession session(server);
    session.initialize();

    auto resp = session.peer.call(1, "prompts/get", nlohmann::json{{"name", "code_review"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
}

TEST(PromptsE2E, UnknownPrompt) {
    McpServer server(prompts_options());
    StdioSession session(server);
    session.initialize();

    auto resp = session.peer.call(1, "prompts/get", nlohmann::json{{"name", "nope"}});
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::PromptNotFound);
}

TEST(PromptsE2E, HandlerListingReplacesRegistration) {
    McpServer server(prompts_options());
    server.add_prompt(PromptInfo{"greetings", std::nullopt, {}}, std::make_shared<Greetings>());
    StdioSession session(server);
    session.initialize();

    auto list = session.peer.call(1, "prompts/list", nlohmann::json::object());
    ASSERT_TRUE(list.result.has_value());
    auto& prompts = (*list.result)["prompts"];
    ASSERT_EQ(prompts.size(), 2u);
    EXPECT_EQ(prompts[0]["name"], "greet_formal");
    EXPECT_EQ(prompts[1]["name"], "greet_casual");
}
