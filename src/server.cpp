#include "mcpkit/server.hpp"
#include "mcpkit/connection.hpp"
#include "mcpkit/dispatcher.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include "mcpkit/worker_pool.hpp"
#include "mcpkit/transport/http_transport.hpp"
#include "mcpkit/transport/stdio_transport.hpp"
#include "mcpkit/transport/websocket_transport.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace mcpkit {

namespace {

ServerContext::Settings make_settings(const McpServer::Options& opts) {
    ServerContext::Settings s;
    s.server_info = opts.server_info;
    s.instructions = opts.instructions;
    s.page_size = opts.page_size;
    s.supported_versions = opts.supported_protocol_versions;
    s.version_policy = opts.version_policy;
    return s;
}

std::chrono::milliseconds time_left(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

/// Registries and routing. Queued calls share ownership, so a call left
/// running after shutdown keeps them alive until it returns.
struct Engine {
    explicit Engine(ServerContext::Settings settings)
        : ctx(std::move(settings)), dispatcher(ctx) {}

    ServerContext ctx;
    Dispatcher dispatcher;
};

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    std::shared_ptr<Engine> engine;
    WorkerPool pool;

    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    std::atomic<bool> running{false};

    mutable std::mutex connections_mutex;
    std::unordered_map<std::string, ConnectionPtr> connections;

    explicit Impl(Options o)
        : opts(std::move(o)), engine(std::make_shared<Engine>(make_settings(opts))),
          pool(opts.worker_threads) {}

    ConnectionPtr find_connection(const std::string& id) const {
        std::lock_guard<std::mutex> lock(connections_mutex);
        auto it = connections.find(id);
        return it == connections.end() ? nullptr : it->second;
    }

    void on_open(const ChannelPtr& channel) {
        auto conn = std::make_shared<Connection>(channel);
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            connections[conn->id()] = conn;
        }
        engine->ctx.subscriptions.attach(conn);
        logging::logger()->info("Connection {} opened ({})", conn->id(), to_string(conn->kind()));
    }

    void on_message(const ChannelPtr& channel, JsonRpcMessage msg) {
        auto conn = find_connection(channel->id());
        if (!conn) {
            logging::logger()->warn("Message for unknown connection {}", channel->id());
            return;
        }

        const auto* req = std::get_if<JsonRpcRequest>(&msg);

        // The handshake runs on the receiving thread so that anything the
        // peer pipelines after it already sees Ready.
        if (req && req->method == methods::Initialize) {
            conn->send(engine->dispatcher.handle_request(*conn, *req));
            return;
        }

        auto token = conn->lifecycle().track(conn);
        if (!token) {
            logging::logger()->debug("Ignoring message on closed connection {}", conn->id());
            return;
        }
        auto in_flight = std::make_shared<Lifecycle::InFlightToken>(std::move(*token));

        if (!req) {
            bool queued = pool.submit([engine = engine, conn, msg = std::move(msg), in_flight]() {
                (void)engine->dispatcher.dispatch(*conn, msg);
            });
            if (!queued) {
                logging::logger()->debug("Dropping notification on {}: server is stopping", conn->id());
            }
            return;
        }

        RequestId id = req->id;
        if (!conn->begin_request(id)) {
            // Answer on the channel directly: the first request with this id keeps
            // its correlation entry.
            conn->channel()->send(make_error(id, error::InvalidRequest,
                "Duplicate request id: " + request_id_key(id)));
            return;
        }

        bool queued = pool.submit([engine = engine, conn, request = *req, in_flight]() {
            conn->send(engine->dispatcher.handle_request(*conn, request));
        });
        if (!queued) {
            conn->send(make_error(id, error::InternalError, "Server is shutting down"));
        }
    }

    void on_close(const ChannelPtr& channel) {
        ConnectionPtr conn;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            auto it = connections.find(channel->id());
            if (it == connections.end()) return;
            conn = it->second;
            connections.erase(it);
        }
        close_connection(conn, opts.shutdown_grace);
    }

    void on_error(const ChannelPtr& channel, std::exception_ptr error) {
        std::string id = channel ? channel->id() : std::string("-");
        try {
            if (error) std::rethrow_exception(error);
        } catch (const McpParseError& e) {
            logging::logger()->warn("Connection {}: {}", id, e.what());
        } catch (const McpProtocolError& e) {
            logging::logger()->warn("Connection {}: {}", id, e.what());
        } catch (const std::exception& e) {
            logging::logger()->error("Connection {}: transport failure: {}", id, e.what());
        }
    }

    void close_connection(const ConnectionPtr& conn, std::chrono::milliseconds grace) {
        bool drained = conn->lifecycle().shutdown(grace);
        engine->ctx.subscriptions.detach(conn->id());
        if (drained) {
            logging::logger()->info("Connection {} closed", conn->id());
        } else {
            logging::logger()->warn("Connection {} closed with {} call(s) still running",
                                    conn->id(), conn->lifecycle().in_flight());
        }
    }

    void finish_serving() {
        std::unordered_map<std::string, ConnectionPtr> remaining;
        {
            std::lock_guard<std::mutex> lock(connections_mutex);
            remaining.swap(connections);
        }
        // One grace period covers every connection and the pool together.
        auto deadline = std::chrono::steady_clock::now() + opts.shutdown_grace;
        for (auto& [id, conn] : remaining) {
            close_connection(conn, time_left(deadline));
        }
        pool.stop(time_left(deadline));
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            transport = nullptr;
        }
        running = false;
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
}

McpServer::~McpServer() {
    if (impl_) {
        shutdown();
        impl_->pool.stop(impl_->opts.shutdown_grace);
    }
}

void McpServer::add_tool(ToolInfo info, std::shared_ptr<ToolHandler> handler) {
    std::string key = info.name;
    impl_->engine->ctx.tools.add(std::move(key), std::move(info), std::move(handler));
}

void McpServer::add_tool(ToolInfo info, ToolFn fn) {
    add_tool(std::move(info), make_tool(std::move(fn)));
}

bool McpServer::remove_tool(const std::string& name) {
    return impl_->engine->ctx.tools.remove(name);
}

void McpServer::add_resource(ResourceInfo info, std::shared_ptr<ResourceHandler> handler) {
    std::string key = info.uri;
    impl_->engine->ctx.resources.add(std::move(key), std::move(info), std::move(handler));
}

void McpServer::add_resource(ResourceInfo info, ResourceReadFn fn) {
    add_resource(std::move(info), make_resource(std::move(fn)));
}

bool McpServer::remove_resource(const std::string& uri) {
    return impl_->engine->ctx.resources.remove(uri);
}

size_t McpServer::notify_resource_updated(const std::string& uri) {
    return impl_->engine->ctx.subscriptions.emit_updated(uri);
}

void McpServer::add_prompt(PromptInfo info, std::shared_ptr<PromptHandler> handler) {
    std::string key = info.name;
    impl_->engine->ctx.prompts.add(std::move(key), std::move(info), std::move(handler));
}

void McpServer::add_prompt(PromptInfo info, PromptGetFn fn) {
    add_prompt(std::move(info), make_prompt(std::move(fn)));
}

bool McpServer::remove_prompt(const std::string& name) {
    return impl_->engine->ctx.prompts.remove(name);
}

void McpServer::set_sampling_handler(SamplingHandler handler) {
    impl_->engine->ctx.set_sampling_handler(std::move(handler));
}

void McpServer::set_progress_handler(ProgressHandler handler) {
    impl_->engine->ctx.set_progress_handler(std::move(handler));
}

size_t McpServer::log_message(LogLevel level, const std::string& logger, const nlohmann::json& data) {
    LoggingMessageParams params;
    params.level = level;
    params.logger = logger;
    params.data = data;

    JsonRpcNotification notif;
    notif.method = methods::LoggingMessage;
    notif.params = nlohmann::json(params);
    return impl_->engine->ctx.subscriptions.broadcast(notif, [level](const Connection& conn) {
        return level >= conn.log_level();
    });
}

bool McpServer::send_progress(const std::string& connection_id, const ProgressParams& params) {
    auto conn = impl_->find_connection(connection_id);
    if (!conn || !conn->lifecycle().is_ready()) return false;

    JsonRpcNotification notif;
    notif.method = methods::Progress;
    notif.params = nlohmann::json(params);
    return conn->push(notif);
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) throw std::invalid_argument("transport must not be null");
    if (impl_->running.exchange(true)) {
        throw McpError("Server is already serving");
    }
    impl_->pool.start();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = transport.get();
    }

    TransportCallbacks callbacks;
    callbacks.on_open = [this](const ChannelPtr& ch) { impl_->on_open(ch); };
    callbacks.on_message = [this](const ChannelPtr& ch, JsonRpcMessage msg) {
        impl_->on_message(ch, std::move(msg));
    };
    callbacks.on_close = [this](const ChannelPtr& ch) { impl_->on_close(ch); };
    callbacks.on_error = [this](const ChannelPtr& ch, std::exception_ptr e) {
        impl_->on_error(ch, std::move(e));
    };

    logging::logger()->info("{} {} serving", impl_->opts.server_info.name, impl_->opts.server_info.version);
    try {
        transport->start(std::move(callbacks));
    } catch (const std::exception& e) {
        logging::logger()->error("Transport stopped with an error: {}", e.what());
        impl_->finish_serving();
        throw;
    }
    impl_->finish_serving();
    logging::logger()->info("{} stopped", impl_->opts.server_info.name);
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_http(const std::string& host, uint16_t port) {
    HttpServerTransport::Options opts;
    opts.host = host;
    opts.port = port;
    serve(std::make_unique<HttpServerTransport>(opts));
}

void McpServer::serve_websocket(const std::string& host, uint16_t port) {
    WebSocketServerTransport::Options opts;
    opts.host = host;
    opts.port = port;
    serve(std::make_unique<WebSocketServerTransport>(opts));
}

void McpServer::shutdown() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

std::vector<std::string> McpServer::connection_ids() const {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    std::vector<std::string> ids;
    ids.reserve(impl_->connections.size());
    for (const auto& [id, conn] : impl_->connections) ids.push_back(id);
    return ids;
}

ServerContext& McpServer::context() {
    return impl_->engine->ctx;
}

} // namespace mcpkit
