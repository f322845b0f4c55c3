#include "mcpkit/types.hpp"
#include <optional>
#include <stdexcept>

namespace mcpkit {

namespace {

// Optional members map to keys that are left out when empty. A null value
// on input counts as absent.
template <typename T>
void put(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

template <typename T>
void take(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) out = it->template get<T>();
}

template <typename T>
T field(const nlohmann::json& j, const char* key) {
    return j.at(key).template get<T>();
}

nlohmann::json object_or_empty(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nlohmann::json::object();
    return *it;
}

nlohmann::json encode_content(const Content& content) {
    nlohmann::json out;
    to_json(out, content);
    return out;
}

/// {"role": ..., "content": {...}} as used by prompt and sampling messages.
nlohmann::json role_and_content(const std::string& role, const Content& content) {
    return {{"role", role}, {"content", encode_content(content)}};
}

} // anonymous namespace

// ---------- Content ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    t.text = field<std::string>(j, "text");
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    t.data = field<std::string>(j, "data");
    t.mime_type = field<std::string>(j, "mimeType");
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json body = {{"uri", t.uri}};
    put(body, "mimeType", t.mime_type);
    put(body, "text", t.text);
    put(body, "blob", t.blob);
    j = {{"type", "resource"}, {"resource", std::move(body)}};
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& body = j.at("resource");
    t.uri = field<std::string>(body, "uri");
    take(body, "mimeType", t.mime_type);
    take(body, "text", t.text);
    take(body, "blob", t.blob);
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    auto kind = field<std::string>(j, "type");
    if (kind == "text") {
        c = j.get<TextContent>();
    } else if (kind == "image") {
        c = j.get<ImageContent>();
    } else if (kind == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("Unknown content type: " + kind);
    }
}

// ---------- Tools ----------

void to_json(nlohmann::json& j, const ToolInfo& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    put(j, "description", t.description);
}

void from_json(const nlohmann::json& j, ToolInfo& t) {
    t.name = field<std::string>(j, "name");
    take(j, "description", t.description);
    t.input_schema = object_or_empty(j, "inputSchema");
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& c : t.content) items.push_back(encode_content(c));
    j = {{"content", std::move(items)}};
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content.clear();
    auto it = j.find("content");
    if (it != j.end()) {
        for (const auto& item : *it) t.content.push_back(item.get<Content>());
    }
    t.is_error = j.value("isError", false);
}

void from_json(const nlohmann::json& j, CallToolParams& t) {
    t.name = field<std::string>(j, "name");
    t.arguments = object_or_empty(j, "arguments");
}

// ---------- Resources ----------

void to_json(nlohmann::json& j, const ResourceInfo& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    put(j, "description", t.description);
    put(j, "mimeType", t.mime_type);
}

void from_json(const nlohmann::json& j, ResourceInfo& t) {
    t.uri = field<std::string>(j, "uri");
    t.name = field<std::string>(j, "name");
    take(j, "description", t.description);
    take(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    put(j, "mimeType", t.mime_type);
    put(j, "text", t.text);
    put(j, "blob", t.blob);
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    t.uri = field<std::string>(j, "uri");
    take(j, "mimeType", t.mime_type);
    take(j, "text", t.text);
    take(j, "blob", t.blob);
}

void from_json(const nlohmann::json& j, ResourceUriParams& t) {
    t.uri = field<std::string>(j, "uri");
}

// ---------- Prompts ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    put(j, "description", t.description);
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    t.name = field<std::string>(j, "name");
    take(j, "description", t.description);
    t.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptInfo& t) {
    j = {{"name", t.name}};
    put(j, "description", t.description);
    if (!t.arguments.empty()) j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, PromptInfo& t) {
    t.name = field<std::string>(j, "name");
    take(j, "description", t.description);
    std::optional<std::vector<PromptArgument>> args;
    take(j, "arguments", args);
    t.arguments = args.value_or(std::vector<PromptArgument>{});
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = role_and_content(t.role, t.content);
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    t.role = field<std::string>(j, "role");
    t.content = j.at("content").get<Content>();
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    put(j, "description", t.description);
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    take(j, "description", t.description);
    t.messages = field<std::vector<PromptMessage>>(j, "messages");
}

void from_json(const nlohmann::json& j, GetPromptParams& t) {
    t.name = field<std::string>(j, "name");
    t.arguments = object_or_empty(j, "arguments");
}

void from_json(const nlohmann::json& j, ListParams& t) {
    take(j, "cursor", t.cursor);
}

// ---------- Sampling ----------

void to_json(nlohmann::json& j, const ModelPreferences& t) {
    j = nlohmann::json::object();
    put(j, "costPriority", t.cost_priority);
    put(j, "speedPriority", t.speed_priority);
    put(j, "intelligencePriority", t.intelligence_priority);
}

void from_json(const nlohmann::json& j, ModelPreferences& t) {
    take(j, "costPriority", t.cost_priority);
    take(j, "speedPriority", t.speed_priority);
    take(j, "intelligencePriority", t.intelligence_priority);
}

void to_json(nlohmann::json& j, const SamplingMessage& t) {
    j = role_and_content(t.role, t.content);
}

void from_json(const nlohmann::json& j, SamplingMessage& t) {
    t.role = field<std::string>(j, "role");
    const auto& content = j.at("content");
    // bare string: text shorthand
    if (content.is_string()) {
        t.content = TextContent{content.get<std::string>()};
    } else {
        t.content = content.get<Content>();
    }
}

void to_json(nlohmann::json& j, const CreateMessageParams& t) {
    j = {{"messages", t.messages}};
    put(j, "modelPreferences", t.model_preferences);
    put(j, "systemPrompt", t.system_prompt);
    put(j, "includeContext", t.include_context);
    put(j, "maxTokens", t.max_tokens);
    put(j, "temperature", t.temperature);
    put(j, "topP", t.top_p);
    put(j, "stopSequences", t.stop_sequences);
    put(j, "metadata", t.metadata);
}

void from_json(const nlohmann::json& j, CreateMessageParams& t) {
    t.messages = field<std::vector<SamplingMessage>>(j, "messages");
    take(j, "modelPreferences", t.model_preferences);
    take(j, "systemPrompt", t.system_prompt);
    take(j, "includeContext", t.include_context);
    take(j, "maxTokens", t.max_tokens);
    take(j, "temperature", t.temperature);
    take(j, "topP", t.top_p);
    take(j, "stopSequences", t.stop_sequences);
    take(j, "metadata", t.metadata);
}

void to_json(nlohmann::json& j, const CreateMessageResult& t) {
    j = role_and_content(t.role, t.content);
    j["model"] = t.model;
    put(j, "stopReason", t.stop_reason);
}

void from_json(const nlohmann::json& j, CreateMessageResult& t) {
    t.role = field<std::string>(j, "role");
    t.content = j.at("content").get<Content>();
    t.model = field<std::string>(j, "model");
    take(j, "stopReason", t.stop_reason);
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = {{"listChanged", t.tools->list_changed}};
    if (t.resources) {
        j["resources"] = {{"subscribe", t.resources->subscribe},
                          {"listChanged", t.resources->list_changed}};
    }
    if (t.prompts) j["prompts"] = {{"listChanged", t.prompts->list_changed}};
    put(j, "sampling", t.sampling);
    put(j, "logging", t.logging);
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    auto it = j.find("tools");
    if (it != j.end()) t.tools = ToolsCapability{it->value("listChanged", false)};
    it = j.find("resources");
    if (it != j.end()) {
        t.resources = ResourcesCapability{it->value("subscribe", false), it->value("listChanged", false)};
    }
    it = j.find("prompts");
    if (it != j.end()) t.prompts = PromptsCapability{it->value("listChanged", false)};
    take(j, "sampling", t.sampling);
    take(j, "logging", t.logging);
}

void to_json(nlohmann::json& j, const ClientCapabilities& t) {
    j = nlohmann::json::object();
    put(j, "sampling", t.sampling);
    put(j, "roots", t.roots);
    put(j, "experimental", t.experimental);
}

void from_json(const nlohmann::json& j, ClientCapabilities& t) {
    take(j, "sampling", t.sampling);
    take(j, "roots", t.roots);
    take(j, "experimental", t.experimental);
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = field<std::string>(j, "name");
    t.version = field<std::string>(j, "version");
}

void to_json(nlohmann::json& j, const InitializeParams& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"clientInfo", t.client_info}
    };
}

void from_json(const nlohmann::json& j, InitializeParams& t) {
    t.protocol_version = field<std::string>(j, "protocolVersion");
    auto caps = j.find("capabilities");
    if (caps != j.end()) {
        if (!caps->is_object()) throw std::invalid_argument("'capabilities' must be an object");
        t.capabilities = caps->get<ClientCapabilities>();
    }
    t.client_info = field<Implementation>(j, "clientInfo");
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    put(j, "instructions", t.instructions);
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = field<std::string>(j, "protocolVersion");
    t.capabilities = field<ServerCapabilities>(j, "capabilities");
    t.server_info = field<Implementation>(j, "serverInfo");
    take(j, "instructions", t.instructions);
}

// ---------- Logging ----------

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:     return "debug";
        case LogLevel::Info:      return "info";
        case LogLevel::Notice:    return "notice";
        case LogLevel::Warning:   return "warning";
        case LogLevel::Error:     return "error";
        case LogLevel::Critical:  return "critical";
        case LogLevel::Alert:     return "alert";
        case LogLevel::Emergency: return "emergency";
    }
    return "info";
}

LogLevel log_level_from_string(const std::string& s) {
    static const std::pair<const char*, LogLevel> table[] = {
        {"debug", LogLevel::Debug},       {"info", LogLevel::Info},
        {"notice", LogLevel::Notice},     {"warning", LogLevel::Warning},
        {"error", LogLevel::Error},       {"critical", LogLevel::Critical},
        {"alert", LogLevel::Alert},       {"emergency", LogLevel::Emergency},
    };
    for (const auto& [name, level] : table) {
        if (s == name) return level;
    }
    throw std::invalid_argument("Unknown log level: " + s);
}

void to_json(nlohmann::json& j, LogLevel level) {
    j = log_level_to_string(level);
}

void from_json(const nlohmann::json& j, LogLevel& level) {
    level = log_level_from_string(j.get<std::string>());
}

void from_json(const nlohmann::json& j, SetLevelParams& t) {
    from_json(j.at("level"), t.level);
}

void to_json(nlohmann::json& j, const LoggingMessageParams& t) {
    j = {{"level", log_level_to_string(t.level)}, {"data", t.data}};
    put(j, "logger", t.logger);
}

void from_json(const nlohmann::json& j, LoggingMessageParams& t) {
    from_json(j.at("level"), t.level);
    t.data = j.at("data");
    take(j, "logger", t.logger);
}

// ---------- Progress ----------

void to_json(nlohmann::json& j, const ProgressParams& t) {
    j = nlohmann::json::object();
    std::visit([&j](const auto& v) { j["progressToken"] = v; }, t.progress_token);
    j["progress"] = t.progress;
    if (t.total) j["total"] = *t.total;
}

void from_json(const nlohmann::json& j, ProgressParams& t) {
    const auto& token = j.at("progressToken");
    if (token.is_number_integer()) {
        t.progress_token = token.get<int64_t>();
    } else {
        t.progress_token = token.get<std::string>();
    }
    t.progress = field<double>(j, "progress");
    take(j, "total", t.total);
}

} // namespace mcpkit
