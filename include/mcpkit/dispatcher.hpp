#pragma once
#include "connection.hpp"
#include "json_rpc.hpp"
#include "server_context.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpkit {

/// Routes decoded messages of one connection to the shared context and
/// turns every outcome into a JSON-RPC response.
///
/// The dispatcher is the only place where exceptions become error
/// responses. It holds no lock while a handler runs.
class Dispatcher {
public:
    explicit Dispatcher(ServerContext& ctx);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Response for a request; nullopt for notifications and inbound
    /// responses.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(Connection& conn, const JsonRpcMessage& msg);

    [[nodiscard]] JsonRpcResponse handle_request(Connection& conn, const JsonRpcRequest& req);
    void handle_notification(Connection& conn, const JsonRpcNotification& notif);

    [[nodiscard]] bool has_method(const std::string& method) const;

private:
    using RequestFn = nlohmann::json (Dispatcher::*)(Connection&, const nlohmann::json&);
    using NotificationFn = void (Dispatcher::*)(Connection&, const nlohmann::json&);

    struct Route {
        RequestFn request = nullptr;
        NotificationFn notification = nullptr;
        bool requires_ready = true;
    };

    const Route* find_route(const std::string& method) const;

    nlohmann::json on_initialize(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_ping(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_tools_list(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_tools_call(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_resources_list(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_resources_read(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_resources_subscribe(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_resources_unsubscribe(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_prompts_list(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_prompts_get(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_sampling_create_message(Connection& conn, const nlohmann::json& params);
    nlohmann::json on_logging_set_level(Connection& conn, const nlohmann::json& params);

    void on_progress(Connection& conn, const nlohmann::json& params);
    void on_logging_message(Connection& conn, const nlohmann::json& params);

    ServerContext& ctx_;
    std::unordered_map<std::string, Route> routes_;
};

} // namespace mcpkit
