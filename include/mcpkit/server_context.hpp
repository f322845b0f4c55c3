#pragma once
#include "handler.hpp"
#include "registry.hpp"
#include "subscription_manager.hpp"
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpkit {

/// Chooses the protocol version for a connection. Returns the negotiated
/// version, or nullopt to reject the client's request.
using VersionPolicy = std::function<std::optional<std::string>(const std::string& requested)>;

/// Accepts exactly the listed versions and echoes the requested one.
VersionPolicy exact_match_policy(std::vector<std::string> supported);

/// State shared by every connection of one server: the three registries,
/// the subscription manager and the collaborator hooks.
///
/// The registries validate every registration the same way McpServer::add_*
/// does, whichever way it arrives.
class ServerContext {
public:
    struct Settings {
        Implementation server_info;
        std::optional<std::string> instructions;
        size_t page_size = 50;
        std::vector<std::string> supported_versions;
        VersionPolicy version_policy;  // empty: exact_match_policy(supported_versions)
    };

    explicit ServerContext(Settings settings);

    ServerContext(const ServerContext&) = delete;
    ServerContext& operator=(const ServerContext&) = delete;

    [[nodiscard]] const Settings& settings() const { return settings_; }

    /// nullopt when the policy rejects `requested`.
    [[nodiscard]] std::optional<std::string> negotiate_version(const std::string& requested) const;

    [[nodiscard]] ServerCapabilities capabilities() const;

    void set_sampling_handler(SamplingHandler handler);
    [[nodiscard]] SamplingHandler sampling_handler() const;

    void set_progress_handler(ProgressHandler handler);
    [[nodiscard]] ProgressHandler progress_handler() const;

    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
    SubscriptionManager subscriptions{resources};

private:
    Settings settings_;

    mutable std::mutex hooks_mutex_;
    SamplingHandler sampling_;
    ProgressHandler progress_;
};

} // namespace mcpkit
