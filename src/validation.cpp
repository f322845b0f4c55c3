#include "mcpkit/validation.hpp"
#include "mcpkit/error.hpp"
#include <string>

namespace mcpkit::validation {

namespace {

void require(bool ok, const char* what) {
    if (!ok) throw McpValidationError(what);
}

void require_arguments_object(const nlohmann::json& arguments) {
    require(arguments.is_object(), "'arguments' must be an object");
}

} // anonymous namespace

void validate_uri(std::string_view uri) {
    require(!uri.empty(), "URI cannot be empty");
    bool has_scheme = uri.find("://") != std::string_view::npos;
    bool absolute = uri.front() == '/';
    bool file = uri.substr(0, 5) == "file:";
    require(has_scheme || absolute || file, "URI must have a scheme or be an absolute path");
}

void validate_initialize(const InitializeParams& params) {
    require(!params.client_info.name.empty(), "Client name cannot be empty");
    require(!params.client_info.version.empty(), "Client version cannot be empty");
    require(!params.protocol_version.empty(), "Protocol version cannot be empty");
}

void validate_call_tool(const CallToolParams& params) {
    require(!params.name.empty(), "Tool name cannot be empty");
    require_arguments_object(params.arguments);
}

void validate_resource_uri(const ResourceUriParams& params) {
    validate_uri(params.uri);
}

void validate_get_prompt(const GetPromptParams& params) {
    require(!params.name.empty(), "Prompt name cannot be empty");
    require_arguments_object(params.arguments);
}

void validate_create_message(const CreateMessageParams& params) {
    require(!params.messages.empty(), "Sampling request must have at least one message");
    for (const auto& message : params.messages) {
        require(!message.role.empty(), "Message role cannot be empty");
    }
    if (params.temperature) {
        require(*params.temperature >= 0.0 && *params.temperature <= 2.0,
                "Temperature must be between 0.0 and 2.0");
    }
    if (params.top_p) {
        require(*params.top_p >= 0.0 && *params.top_p <= 1.0,
                "topP must be between 0.0 and 1.0");
    }
    if (params.max_tokens) {
        require(*params.max_tokens > 0, "maxTokens must be greater than 0");
    }
}

void validate_progress(const ProgressParams& params) {
    if (const auto* token = std::get_if<std::string>(&params.progress_token)) {
        require(!token->empty(), "Progress token cannot be empty");
    }
    require(params.progress >= 0.0 && params.progress <= 1.0,
            "Progress must be between 0.0 and 1.0");
}

void validate_logging_message(const LoggingMessageParams& params) {
    require(!params.data.is_null(), "Log message data cannot be null");
}

void validate_tool_info(const ToolInfo& info) {
    require(!info.name.empty(), "Tool name cannot be empty");
    require(info.input_schema.is_object(), "Tool inputSchema must be an object");
}

void validate_resource_info(const ResourceInfo& info) {
    validate_uri(info.uri);
    require(!info.name.empty(), "Resource name cannot be empty");
}

void validate_prompt_info(const PromptInfo& info) {
    require(!info.name.empty(), "Prompt name cannot be empty");
    for (const auto& arg : info.arguments) {
        require(!arg.name.empty(), "Prompt argument name cannot be empty");
    }
}

} // namespace mcpkit::validation
