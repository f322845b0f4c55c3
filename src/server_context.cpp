#include "mcpkit/server_context.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/validation.hpp"
#include <algorithm>

namespace mcpkit {

namespace {

void require_key(const std::string& key, const std::string& expected, const char* what) {
    if (key != expected) {
        throw McpValidationError(std::string(what) + " must be registered under its own name: '" +
                                 key + "' != '" + expected + "'");
    }
}

} // anonymous namespace

VersionPolicy exact_match_policy(std::vector<std::string> supported) {
    return [supported = std::move(supported)](const std::string& requested) -> std::optional<std::string> {
        if (std::find(supported.begin(), supported.end(), requested) == supported.end()) {
            return std::nullopt;
        }
        return requested;
    };
}

ServerContext::ServerContext(Settings settings) : settings_(std::move(settings)) {
    if (!settings_.version_policy) {
        settings_.version_policy = exact_match_policy(settings_.supported_versions);
    }
    tools.set_validator([](const std::string& key, const ToolInfo& info) {
        validation::validate_tool_info(info);
        require_key(key, info.name, "Tool");
    });
    resources.set_validator([](const std::string& key, const ResourceInfo& info) {
        validation::validate_resource_info(info);
        require_key(key, info.uri, "Resource");
    });
    prompts.set_validator([](const std::string& key, const PromptInfo& info) {
        validation::validate_prompt_info(info);
        require_key(key, info.name, "Prompt");
    });
    tools.set_change_listener([this] { subscriptions.emit_list_changed(ListKind::Tools); });
    resources.set_change_listener([this] { subscriptions.emit_list_changed(ListKind::Resources); });
    prompts.set_change_listener([this] { subscriptions.emit_list_changed(ListKind::Prompts); });
}

std::optional<std::string> ServerContext::negotiate_version(const std::string& requested) const {
    return settings_.version_policy(requested);
}

ServerCapabilities ServerContext::capabilities() const {
    ServerCapabilities caps;
    caps.tools = ToolsCapability{true};
    caps.resources = ResourcesCapability{true, true};
    caps.prompts = PromptsCapability{true};
    caps.logging = nlohmann::json::object();
    if (sampling_handler()) caps.sampling = nlohmann::json::object();
    return caps;
}

void ServerContext::set_sampling_handler(SamplingHandler handler) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    sampling_ = std::move(handler);
}

SamplingHandler ServerContext::sampling_handler() const {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    return sampling_;
}

void ServerContext::set_progress_handler(ProgressHandler handler) {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    progress_ = std::move(handler);
}

ProgressHandler ServerContext::progress_handler() const {
    std::lock_guard<std::mutex> lock(hooks_mutex_);
    return progress_;
}

} // namespace mcpkit
