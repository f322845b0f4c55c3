#pragma once
#include "handler.hpp"
#include "json_rpc.hpp"
#include "server_context.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mcpkit {

class McpServer {
public:
    struct Options {
        Implementation server_info{"mcpkit", std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        size_t page_size = 50;  // 0: no pagination
        size_t worker_threads = 4;
        std::chrono::milliseconds shutdown_grace{5000};
        std::vector<std::string> supported_protocol_versions{
            std::string(PROTOCOL_VERSION), "2025-03-26", "2025-06-18"};
        VersionPolicy version_policy;  // empty: exact match on the list above
    };

    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolInfo info, std::shared_ptr<ToolHandler> handler);
    void add_tool(ToolInfo info, ToolFn fn);
    bool remove_tool(const std::string& name);

    // ---- Resource registration ----
    /// `info.uri` is matched exactly, and also as the prefix of a family
    /// of resources when no exact registration exists.
    void add_resource(ResourceInfo info, std::shared_ptr<ResourceHandler> handler);
    void add_resource(ResourceInfo info, ResourceReadFn fn);
    bool remove_resource(const std::string& uri);

    /// Push `resources/updated` to the connections subscribed to `uri`.
    size_t notify_resource_updated(const std::string& uri);

    // ---- Prompt registration ----
    void add_prompt(PromptInfo info, std::shared_ptr<PromptHandler> handler);
    void add_prompt(PromptInfo info, PromptGetFn fn);
    bool remove_prompt(const std::string& name);

    // ---- Collaborator hooks ----
    void set_sampling_handler(SamplingHandler handler);
    void set_progress_handler(ProgressHandler handler);

    // ---- Logging ----
    /// Push `logging/message` to every Ready connection whose level admits it.
    size_t log_message(LogLevel level, const std::string& logger, const nlohmann::json& data);

    // ---- Progress ----
    bool send_progress(const std::string& connection_id, const ProgressParams& params);

    // ---- Transport ----
    void serve_stdio();
    void serve_http(const std::string& host, uint16_t port);
    void serve_websocket(const std::string& host, uint16_t port);

    /// Blocks until the transport stops, then closes every remaining
    /// connection.
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] std::vector<std::string> connection_ids() const;

    [[nodiscard]] ServerContext& context();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpkit
