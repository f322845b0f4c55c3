#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpkit {

// ---------- Method catalog ----------

namespace methods {
    constexpr const char* Initialize           = "initialize";
    constexpr const char* Ping                 = "ping";
    constexpr const char* ToolsList            = "tools/list";
    constexpr const char* ToolsCall            = "tools/call";
    constexpr const char* ToolsListChanged     = "tools/list_changed";
    constexpr const char* ResourcesList        = "resources/list";
    constexpr const char* ResourcesRead        = "resources/read";
    constexpr const char* ResourcesSubscribe   = "resources/subscribe";
    constexpr const char* ResourcesUnsubscribe = "resources/unsubscribe";
    constexpr const char* ResourcesUpdated     = "resources/updated";
    constexpr const char* ResourcesListChanged = "resources/list_changed";
    constexpr const char* PromptsList          = "prompts/list";
    constexpr const char* PromptsGet           = "prompts/get";
    constexpr const char* PromptsListChanged   = "prompts/list_changed";
    constexpr const char* SamplingCreateMessage = "sampling/createMessage";
    constexpr const char* LoggingSetLevel      = "logging/setLevel";
    constexpr const char* LoggingMessage       = "logging/message";
    constexpr const char* Progress             = "progress";
} // namespace methods

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tool ----------

struct ToolInfo {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();

    bool operator==(const ToolInfo& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

struct CallToolParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------- Resource ----------

struct ResourceInfo {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    bool operator==(const ResourceInfo& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type;
    }
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

/// Params of resources/read, resources/subscribe and resources/unsubscribe.
struct ResourceUriParams {
    std::string uri;
};

// ---------- Prompt ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return name == o.name && description == o.description && required == o.required;
    }
};

struct PromptInfo {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptInfo& o) const {
        return name == o.name && description == o.description
               && arguments == o.arguments;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

struct GetPromptParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------- Pagination ----------

struct ListParams {
    std::optional<std::string> cursor;
};

template <typename T>
struct PaginatedResult {
    std::vector<T> items;
    std::optional<std::string> next_cursor;

    bool operator==(const PaginatedResult<T>& o) const {
        return items == o.items && next_cursor == o.next_cursor;
    }
};

// ---------- Sampling ----------

struct ModelPreferences {
    std::optional<double> cost_priority;
    std::optional<double> speed_priority;
    std::optional<double> intelligence_priority;

    bool operator==(const ModelPreferences& o) const {
        return cost_priority == o.cost_priority && speed_priority == o.speed_priority
               && intelligence_priority == o.intelligence_priority;
    }
};

struct SamplingMessage {
    std::string role;
    Content content;

    bool operator==(const SamplingMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct CreateMessageParams {
    std::vector<SamplingMessage> messages;
    std::optional<ModelPreferences> model_preferences;
    std::optional<std::string> system_prompt;
    std::optional<std::string> include_context;
    std::optional<int> max_tokens;
    std::optional<double> temperature;
    std::optional<double> top_p;
    std::optional<std::vector<std::string>> stop_sequences;
    std::optional<nlohmann::json> metadata;
};

struct CreateMessageResult {
    std::string role;
    Content content;
    std::string model;
    std::optional<std::string> stop_reason;

    bool operator==(const CreateMessageResult& o) const {
        return role == o.role && content == o.content && model == o.model
               && stop_reason == o.stop_reason;
    }
};

// ---------- Capabilities ----------

struct ToolsCapability {
    bool list_changed = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool list_changed = false;
};

struct PromptsCapability {
    bool list_changed = false;
};

struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> logging;
};

struct ClientCapabilities {
    std::optional<nlohmann::json> sampling;
    std::optional<nlohmann::json> roots;
    std::optional<nlohmann::json> experimental;
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    Implementation client_info;
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- Logging ----------

enum class LogLevel {
    Debug, Info, Notice, Warning, Error, Critical, Alert, Emergency
};

std::string log_level_to_string(LogLevel level);
LogLevel log_level_from_string(const std::string& s);

struct SetLevelParams {
    LogLevel level = LogLevel::Info;
};

struct LoggingMessageParams {
    LogLevel level = LogLevel::Info;
    std::optional<std::string> logger;
    nlohmann::json data;
};

// ---------- Progress ----------

using ProgressToken = std::variant<int64_t, std::string>;

struct ProgressParams {
    ProgressToken progress_token;
    double progress = 0.0;
    std::optional<double> total;
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void from_json(const nlohmann::json& j, TextContent& t);

void to_json(nlohmann::json& j, const ImageContent& t);
void from_json(const nlohmann::json& j, ImageContent& t);

void to_json(nlohmann::json& j, const EmbeddedResource& t);
void from_json(const nlohmann::json& j, EmbeddedResource& t);

void to_json(nlohmann::json& j, const Content& c);
void from_json(const nlohmann::json& j, Content& c);

void to_json(nlohmann::json& j, const ToolInfo& t);
void from_json(const nlohmann::json& j, ToolInfo& t);

void to_json(nlohmann::json& j, const CallToolResult& t);
void from_json(const nlohmann::json& j, CallToolResult& t);

void from_json(const nlohmann::json& j, CallToolParams& t);

void to_json(nlohmann::json& j, const ResourceInfo& t);
void from_json(const nlohmann::json& j, ResourceInfo& t);

void to_json(nlohmann::json& j, const ResourceContent& t);
void from_json(const nlohmann::json& j, ResourceContent& t);

void from_json(const nlohmann::json& j, ResourceUriParams& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void from_json(const nlohmann::json& j, PromptArgument& t);

void to_json(nlohmann::json& j, const PromptInfo& t);
void from_json(const nlohmann::json& j, PromptInfo& t);

void to_json(nlohmann::json& j, const PromptMessage& t);
void from_json(const nlohmann::json& j, PromptMessage& t);

void to_json(nlohmann::json& j, const GetPromptResult& t);
void from_json(const nlohmann::json& j, GetPromptResult& t);

void from_json(const nlohmann::json& j, GetPromptParams& t);

void from_json(const nlohmann::json& j, ListParams& t);

void to_json(nlohmann::json& j, const ModelPreferences& t);
void from_json(const nlohmann::json& j, ModelPreferences& t);

void to_json(nlohmann::json& j, const SamplingMessage& t);
void from_json(const nlohmann::json& j, SamplingMessage& t);

void to_json(nlohmann::json& j, const CreateMessageParams& t);
void from_json(const nlohmann::json& j, CreateMessageParams& t);

void to_json(nlohmann::json& j, const CreateMessageResult& t);
void from_json(const nlohmann::json& j, CreateMessageResult& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const ClientCapabilities& t);
void from_json(const nlohmann::json& j, ClientCapabilities& t);

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeParams& t);
void from_json(const nlohmann::json& j, InitializeParams& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

void to_json(nlohmann::json& j, LogLevel level);
void from_json(const nlohmann::json& j, LogLevel& level);

void from_json(const nlohmann::json& j, SetLevelParams& t);

void to_json(nlohmann::json& j, const LoggingMessageParams& t);
void from_json(const nlohmann::json& j, LoggingMessageParams& t);

void to_json(nlohmann::json& j, const ProgressParams& t);
void from_json(const nlohmann::json& j, ProgressParams& t);

} // namespace mcpkit
