#include <gtest/gtest.h>
#include "mcpkit/error.hpp"
#include "mcpkit/validation.hpp"

using namespace mcpkit;

namespace {

InitializeParams valid_initialize() {
    InitializeParams p;
    p.protocol_version = "2024-11-05";
    p.client_info = {"client", "1.0"};
    return p;
}

CreateMessageParams valid_create_message() {
    CreateMessageParams p;
    p.messages.push_back({"user", TextContent{"hello"}});
    return p;
}

} // namespace

TEST(ValidateUri, AcceptedForms) {
    EXPECT_NO_THROW(validation::validate_uri("res://a"));
    EXPECT_NO_THROW(validation::validate_uri("http://server/status"));
    EXPECT_NO_THROW(validation::validate_uri("/var/log/app.log"));
    EXPECT_NO_THROW(validation::validate_uri("file:notes.txt"));
}

TEST(ValidateUri, RejectedForms) {
    EXPECT_THROW(validation::validate_uri(""), McpValidationError);
    EXPECT_THROW(validation::validate_uri("relative/path"), McpValidationError);
    EXPECT_THROW(validation::validate_uri("status"), McpValidationError);
}

TEST(ValidateInitialize, RequiresNamesAndVersion) {
    EXPECT_NO_THROW(validation::validate_initialize(valid_initialize()));

    auto p = valid_initialize();
    p.client_info.name.clear();
    EXPECT_THROW(validation::validate_initialize(p), McpValidationError);

    p = valid_initialize();
    p.client_info.version.clear();
    EXPECT_THROW(validation::validate_initialize(p), McpValidationError);

    p = valid_initialize();
    p.protocol_version.clear();
    EXPECT_THROW(validation::validate_initialize(p), McpValidationError);
}

TEST(ValidateCallTool, NameAndArguments) {
    CallToolParams p;
    p.name = "echo";
    EXPECT_NO_THROW(validation::validate_call_tool(p));

    p.arguments = nlohmann::json::array();
    EXPECT_THROW(validation::validate_call_tool(p), McpValidationError);

    p.name.clear();
    p.arguments = nlohmann::json::object();
    EXPECT_THROW(validation::validate_call_tool(p), McpValidationError);
}

TEST(ValidateGetPrompt, NameAndArguments) {
    GetPromptParams p;
    p.name = "greet";
    EXPECT_NO_THROW(validation::validate_get_prompt(p));
    p.arguments = "x";
    EXPECT_THROW(validation::validate_get_prompt(p), McpValidationError);
}

TEST(ValidateCreateMessage, Ranges) {
    EXPECT_NO_THROW(validation::validate_create_message(valid_create_message()));

    auto p = valid_create_message();
    p.messages.clear();
    EXPECT_THROW(validation::validate_create_message(p), McpValidationError);

    p = valid_create_message();
    p.messages[0].role.clear();
    EXPECT_THROW(validation::validate_create_message(p), McpValidationError);

    p = valid_create_message();
    p.temperature = 2.0;
    EXPECT_NO_THROW(validation::validate_create_message(p));
    p.temperature = 2.5;
    EXPECT_THROW(validation::validate_create_message(p), McpValidationError);

    p = valid_create_message();
    p.top_p = -0.1;
    EXPECT_THROW(validation::validate_create_message(p), McpValidationError);

    p = valid_create_message();
    p.max_tokens = 0;
    EXPECT_THROW(validation::validate_create_message(p), McpValidationError);
}

TEST(ValidateProgress, TokenAndRange) {
    ProgressParams p;
    p.progress_token = std::string("job");
    p.progress = 0.5;
    EXPECT_NO_THROW(validation::validate_progress(p));

    p.progress = 1.5;
    EXPECT_THROW(validation::validate_progress(p), McpValidationError);

    p.progress = 0.5;
    p.progress_token = std::string();
    EXPECT_THROW(validation::validate_progress(p), McpValidationError);

    p.progress_token = int64_t{3};
    EXPECT_NO_THROW(validation::validate_progress(p));
}

TEST(ValidateLoggingMessage, DataRequired) {
    LoggingMessageParams p;
    EXPECT_THROW(validation::validate_logging_message(p), McpValidationError);
    p.data = "started";
    EXPECT_NO_THROW(validation::validate_logging_message(p));
}

TEST(ValidateRegistration, Tool) {
    ToolInfo info;
    info.name = "echo";
    EXPECT_NO_THROW(validation::validate_tool_info(info));
    info.input_schema = nlohmann::json::array();
    EXPECT_THROW(validation::validate_tool_info(info), McpValidationError);
    info.input_schema = nlohmann::json::object();
    info.name.clear();
    EXPECT_THROW(validation::validate_tool_info(info), McpValidationError);
}

TEST(ValidateRegistration, Resource) {
    ResourceInfo info{"res://a", "A", std::nullopt, std::nullopt};
    EXPECT_NO_THROW(validation::validate_resource_info(info));
    info.name.clear();
    EXPECT_THROW(validation::validate_resource_info(info), McpValidationError);
    info.name = "A";
    info.uri = "nope";
    EXPECT_THROW(validation::validate_resource_info(info), McpValidationError);
}

TEST(ValidateRegistration, Prompt) {
    PromptInfo info;
    info.name = "greet";
    info.arguments.push_back({"name", std::nullopt, true});
    EXPECT_NO_THROW(validation::validate_prompt_info(info));
    info.arguments.push_back({"", std::nullopt, false});
    EXPECT_THROW(validation::validate_prompt_info(info), McpValidationError);
}
