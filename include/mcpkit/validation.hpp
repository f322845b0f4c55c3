#pragma once
#include "types.hpp"
#include <string_view>

/// Structural checks applied after params decode. Every function throws
/// McpValidationError describing the first violation it finds.
namespace mcpkit::validation {

void validate_uri(std::string_view uri);

void validate_initialize(const InitializeParams& params);
void validate_call_tool(const CallToolParams& params);
void validate_resource_uri(const ResourceUriParams& params);
void validate_get_prompt(const GetPromptParams& params);
void validate_create_message(const CreateMessageParams& params);
void validate_progress(const ProgressParams& params);
void validate_logging_message(const LoggingMessageParams& params);

// Registration-time checks.
void validate_tool_info(const ToolInfo& info);
void validate_resource_info(const ResourceInfo& info);
void validate_prompt_info(const PromptInfo& info);

} // namespace mcpkit::validation
