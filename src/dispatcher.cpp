#include "mcpkit/dispatcher.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include "mcpkit/validation.hpp"
#include <stdexcept>

namespace mcpkit {

namespace {

template <typename T>
T decode_params(const nlohmann::json& params, const char* method) {
    try {
        return params.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw McpProtocolError(error::InvalidParams, std::string("Invalid ") + method + " params: " + e.what());
    } catch (const std::invalid_argument& e) {
        throw McpProtocolError(error::InvalidParams, std::string("Invalid ") + method + " params: " + e.what());
    }
}

/// Decode, then run the structural check `check` on the result. Both
/// failures are the peer's fault and surface as InvalidParams.
template <typename T, typename Check>
T checked_params(const nlohmann::json& params, const char* method, Check check) {
    T p = decode_params<T>(params, method);
    try {
        check(p);
    } catch (const McpValidationError& e) {
        throw McpProtocolError(error::InvalidParams, std::string("Invalid ") + method + " params: " + e.what());
    }
    return p;
}

nlohmann::json params_or_empty(const std::optional<nlohmann::json>& params) {
    return params ? *params : nlohmann::json::object();
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return spdlog::level::debug;
        case LogLevel::Info:
        case LogLevel::Notice:  return spdlog::level::info;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Error:   return spdlog::level::err;
        default:                return spdlog::level::critical;
    }
}

/// Expand each registration through its handler's list(), keeping the
/// registration's own metadata when the handler reports nothing.
template <typename Info, typename Registry>
std::vector<Info> expand_listing(const Registry& registry) {
    auto snap = registry.snapshot();
    std::vector<Info> out;
    out.reserve(snap->entries.size());
    for (const auto& entry : snap->entries) {
        auto listed = entry.handler->list();
        if (listed.empty()) {
            out.push_back(entry.info);
        } else {
            out.insert(out.end(), listed.begin(), listed.end());
        }
    }
    return out;
}

template <typename T>
nlohmann::json page_json(const PaginatedResult<T>& page, const char* key) {
    nlohmann::json result = {{key, page.items}};
    if (page.next_cursor) result["nextCursor"] = *page.next_cursor;
    return result;
}

} // anonymous namespace

Dispatcher::Dispatcher(ServerContext& ctx) : ctx_(ctx) {
    routes_ = {
        {methods::Initialize,            {&Dispatcher::on_initialize, nullptr, false}},
        {methods::Ping,                  {&Dispatcher::on_ping, nullptr, false}},
        {methods::ToolsList,             {&Dispatcher::on_tools_list, nullptr, true}},
        {methods::ToolsCall,             {&Dispatcher::on_tools_call, nullptr, true}},
        {methods::ResourcesList,         {&Dispatcher::on_resources_list, nullptr, true}},
        {methods::ResourcesRead,         {&Dispatcher::on_resources_read, nullptr, true}},
        {methods::ResourcesSubscribe,    {&Dispatcher::on_resources_subscribe, nullptr, true}},
        {methods::ResourcesUnsubscribe,  {&Dispatcher::on_resources_unsubscribe, nullptr, true}},
        {methods::PromptsList,           {&Dispatcher::on_prompts_list, nullptr, true}},
        {methods::PromptsGet,            {&Dispatcher::on_prompts_get, nullptr, true}},
        {methods::SamplingCreateMessage, {&Dispatcher::on_sampling_create_message, nullptr, true}},
        {methods::LoggingSetLevel,       {&Dispatcher::on_logging_set_level, nullptr, true}},
        {methods::LoggingMessage,        {nullptr, &Dispatcher::on_logging_message, true}},
        {methods::Progress,              {nullptr, &Dispatcher::on_progress, true}},
    };
}

bool Dispatcher::has_method(const std::string& method) const {
    return find_route(method) != nullptr;
}

const Dispatcher::Route* Dispatcher::find_route(const std::string& method) const {
    auto it = routes_.find(method);
    return it == routes_.end() ? nullptr : &it->second;
}

std::optional<JsonRpcResponse> Dispatcher::dispatch(Connection& conn, const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        return handle_request(conn, *req);
    }
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        handle_notification(conn, *notif);
        return std::nullopt;
    }
    const auto& resp = std::get<JsonRpcResponse>(msg);
    logging::logger()->debug("Dropping inbound response {} on connection {}",
                             request_id_key(resp.id), conn.id());
    return std::nullopt;
}

JsonRpcResponse Dispatcher::handle_request(Connection& conn, const JsonRpcRequest& req) {
    const Route* route = find_route(req.method);
    LifecycleState state = conn.lifecycle().state();

    // Unknown methods count as domain methods: nothing reaches the method
    // table before the handshake.
    bool needs_ready = !route || route->requires_ready;
    if (needs_ready && state != LifecycleState::Ready) {
        return make_error(req.id, error::InvalidRequest,
            "Method '" + req.method + "' not allowed while connection is " + to_string(state));
    }
    if (state == LifecycleState::Closed) {
        return make_error(req.id, error::InvalidRequest, "Connection is closed");
    }
    if (!route || !route->request) {
        return make_error(req.id, error::MethodNotFound, "Method not found: " + req.method);
    }

    try {
        return make_result(req.id, (this->*(route->request))(conn, params_or_empty(req.params)));
    } catch (const McpProtocolError& e) {
        return make_error(req.id, e.code, e.what(), e.data);
    } catch (const std::exception& e) {
        logging::logger()->error("Handler for '{}' (request {}) failed: {}",
                                 req.method, request_id_key(req.id), e.what());
        return make_error(req.id, error::InternalError, "Internal error");
    } catch (...) {
        logging::logger()->error("Handler for '{}' (request {}) threw a non-standard exception",
                                 req.method, request_id_key(req.id));
        return make_error(req.id, error::InternalError, "Internal error");
    }
}

void Dispatcher::handle_notification(Connection& conn, const JsonRpcNotification& notif) {
    const Route* route = find_route(notif.method);
    if (!route || !route->notification) {
        logging::logger()->debug("Dropping notification '{}' on connection {}", notif.method, conn.id());
        return;
    }
    if (route->requires_ready && !conn.lifecycle().is_ready()) {
        logging::logger()->debug("Dropping notification '{}' before connection {} is ready",
                                 notif.method, conn.id());
        return;
    }

    try {
        (this->*(route->notification))(conn, params_or_empty(notif.params));
    } catch (const McpError& e) {
        logging::logger()->warn("Dropping invalid '{}' notification: {}", notif.method, e.what());
    } catch (const std::exception& e) {
        logging::logger()->error("Notification handler for '{}' failed: {}", notif.method, e.what());
    } catch (...) {
        logging::logger()->error("Notification handler for '{}' threw a non-standard exception", notif.method);
    }
}

// ---------- Lifecycle ----------

nlohmann::json Dispatcher::on_initialize(Connection& conn, const nlohmann::json& params) {
    if (conn.lifecycle().state() != LifecycleState::Uninitialized) {
        throw McpProtocolError(error::InvalidRequest, "Connection already initialized");
    }

    auto p = checked_params<InitializeParams>(params, methods::Initialize, validation::validate_initialize);

    auto negotiated = ctx_.negotiate_version(p.protocol_version);
    if (!negotiated) {
        throw McpProtocolError(error::InvalidParams,
            "Unsupported protocol version: " + p.protocol_version,
            nlohmann::json{{"supported", ctx_.settings().supported_versions},
                           {"requested", p.protocol_version}});
    }

    conn.lifecycle().initialize(*negotiated, p.capabilities, p.client_info);
    logging::logger()->info("Connection {} initialized by {} {} (protocol {})",
                            conn.id(), p.client_info.name, p.client_info.version, *negotiated);

    InitializeResult result;
    result.protocol_version = *negotiated;
    result.capabilities = ctx_.capabilities();
    result.server_info = ctx_.settings().server_info;
    result.instructions = ctx_.settings().instructions;
    return result;
}

nlohmann::json Dispatcher::on_ping(Connection&, const nlohmann::json&) {
    return nlohmann::json::object();
}

// ---------- Tools ----------

nlohmann::json Dispatcher::on_tools_list(Connection&, const nlohmann::json& params) {
    auto p = decode_params<ListParams>(params, methods::ToolsList);
    return page_json(ctx_.tools.list(ctx_.settings().page_size, p.cursor), "tools");
}

nlohmann::json Dispatcher::on_tools_call(Connection&, const nlohmann::json& params) {
    auto p = checked_params<CallToolParams>(params, methods::ToolsCall, validation::validate_call_tool);

    auto handler = ctx_.tools.get(p.name);
    if (!handler) {
        throw McpProtocolError(error::ToolNotFound, "Tool not found: " + p.name);
    }

    CallToolResult result;
    try {
        result = handler->call(p.arguments);
    } catch (const McpToolError& e) {
        result = text_result(e.what(), true);
    }
    return result;
}

// ---------- Resources ----------

nlohmann::json Dispatcher::on_resources_list(Connection&, const nlohmann::json& params) {
    auto p = decode_params<ListParams>(params, methods::ResourcesList);
    auto all = expand_listing<ResourceInfo>(ctx_.resources);
    return page_json(paginate(all, ctx_.settings().page_size, p.cursor), "resources");
}

nlohmann::json Dispatcher::on_resources_read(Connection&, const nlohmann::json& params) {
    auto p = checked_params<ResourceUriParams>(params, methods::ResourcesRead,
                                               validation::validate_resource_uri);

    auto entry = ctx_.resources.resolve(p.uri);
    if (!entry) {
        throw McpProtocolError(error::ResourceNotFound, "Resource not found: " + p.uri);
    }
    auto contents = entry->handler->read(p.uri, parse_query(p.uri));
    return {{"contents", contents}};
}

nlohmann::json Dispatcher::on_resources_subscribe(Connection& conn, const nlohmann::json& params) {
    auto p = checked_params<ResourceUriParams>(params, methods::ResourcesSubscribe,
                                               validation::validate_resource_uri);
    ctx_.subscriptions.subscribe(conn.id(), p.uri);
    return nlohmann::json::object();
}

nlohmann::json Dispatcher::on_resources_unsubscribe(Connection& conn, const nlohmann::json& params) {
    auto p = checked_params<ResourceUriParams>(params, methods::ResourcesUnsubscribe,
                                               validation::validate_resource_uri);
    ctx_.subscriptions.unsubscribe(conn.id(), p.uri);
    return nlohmann::json::object();
}

// ---------- Prompts ----------

nlohmann::json Dispatcher::on_prompts_list(Connection&, const nlohmann::json& params) {
    auto p = decode_params<ListParams>(params, methods::PromptsList);
    auto all = expand_listing<PromptInfo>(ctx_.prompts);
    return page_json(paginate(all, ctx_.settings().page_size, p.cursor), "prompts");
}

nlohmann::json Dispatcher::on_prompts_get(Connection&, const nlohmann::json& params) {
    auto p = checked_params<GetPromptParams>(params, methods::PromptsGet, validation::validate_get_prompt);

    auto snap = ctx_.prompts.snapshot();
    const auto* entry = snap->find(p.name);
    if (!entry) {
        throw McpProtocolError(error::PromptNotFound, "Prompt not found: " + p.name);
    }
    for (const auto& arg : entry->info.arguments) {
        if (arg.required && !p.arguments.contains(arg.name)) {
            throw McpProtocolError(error::InvalidParams, "Missing required argument: " + arg.name);
        }
    }

    auto handler = entry->handler;
    snap.reset();
    return handler->get(p.arguments);
}

// ---------- Sampling, logging, progress ----------

nlohmann::json Dispatcher::on_sampling_create_message(Connection&, const nlohmann::json& params) {
    auto p = checked_params<CreateMessageParams>(params, methods::SamplingCreateMessage,
                                                 validation::validate_create_message);

    auto handler = ctx_.sampling_handler();
    if (!handler) {
        throw McpProtocolError(error::MethodNotFound, "Sampling is not supported by this server");
    }
    return handler(p);
}

nlohmann::json Dispatcher::on_logging_set_level(Connection& conn, const nlohmann::json& params) {
    auto p = decode_params<SetLevelParams>(params, methods::LoggingSetLevel);
    conn.set_log_level(p.level);
    return nlohmann::json::object();
}

void Dispatcher::on_logging_message(Connection& conn, const nlohmann::json& params) {
    auto p = checked_params<LoggingMessageParams>(params, methods::LoggingMessage,
                                                  validation::validate_logging_message);
    logging::logger()->log(to_spdlog(p.level), "[peer {}{}] {}", conn.id(),
                           p.logger ? "/" + *p.logger : std::string(), p.data.dump());
}

void Dispatcher::on_progress(Connection& conn, const nlohmann::json& params) {
    auto p = checked_params<ProgressParams>(params, methods::Progress, validation::validate_progress);
    if (auto handler = ctx_.progress_handler()) {
        handler(conn.id(), p);
    }
}

} // namespace mcpkit
