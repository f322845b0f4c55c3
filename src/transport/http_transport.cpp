#include "mcpkit/transport/http_transport.hpp"
#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include "mcpkit/transport/frame_queue.hpp"
#include "mcpkit/types.hpp"

#include <httplib.h>

#include <future>
#include <iomanip>
#include <optional>
#include <random>
#include <sstream>

namespace mcpkit {

namespace {

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

void write_status(httplib::Response& res, int status, const std::string& message) {
    res.status = status;
    nlohmann::json body = {{"error", message}};
    res.set_content(body.dump(), "application/json");
}

void write_message(httplib::Response& res, int status, const JsonRpcMessage& msg) {
    res.status = status;
    res.set_content(Codec::serialize(msg), "application/json");
}

} // anonymous namespace

// ---------- HttpServerTransport::Session ----------

/// One HTTP connection: either a session addressed by Mcp-Session-Id or a
/// one-shot exchange. Responses complete the POST waiting for them; pushes
/// queue for the session's event stream.
class HttpServerTransport::Session : public IChannel {
public:
    Session(std::string id, size_t push_capacity)
        : id_(std::move(id)), events_(std::make_shared<FrameQueue>(push_capacity)) {}

    const std::string& id() const override { return id_; }
    TransportKind kind() const override { return TransportKind::Http; }

    void send(const JsonRpcResponse& response) override {
        std::optional<std::promise<JsonRpcResponse>> slot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(request_id_key(response.id));
            if (it != pending_.end()) {
                slot = std::move(it->second.slot);
                pending_.erase(it);
            }
        }
        if (!slot) {
            logging::logger()->debug("No exchange waiting for response {} on {}",
                                     request_id_key(response.id), id_);
            return;
        }
        slot->set_value(response);
    }

    bool push(const JsonRpcNotification& notification) override {
        if (events_->push(Codec::serialize(notification), true)) return true;
        if (!events_->is_closed()) {
            logging::logger()->warn("Event queue of session {} is full, dropping {}",
                                    id_, notification.method);
        }
        return false;
    }

    void close() override {
        std::map<std::string, Pending> orphaned;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            orphaned.swap(pending_);
        }
        events_->close();
        for (auto& [key, pending] : orphaned) {
            pending.slot.set_value(make_error(pending.id, error::InternalError, "Connection closed"));
        }
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    /// Register the exchange waiting for `id`. nullopt if the id is already
    /// awaited on this session or the session is closed.
    std::optional<std::future<JsonRpcResponse>> expect(const RequestId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) return std::nullopt;
        std::string key = request_id_key(id);
        if (pending_.count(key)) return std::nullopt;
        Pending& p = pending_[key];
        p.id = id;
        return p.slot.get_future();
    }

    bool attach_stream() { return !streaming_.exchange(true); }
    void detach_stream() { streaming_ = false; }

    const std::shared_ptr<FrameQueue>& events() const { return events_; }

    bool addressable{false};

private:
    struct Pending {
        RequestId id;
        std::promise<JsonRpcResponse> slot;
    };

    std::string id_;
    std::shared_ptr<FrameQueue> events_;
    std::atomic<bool> streaming_{false};

    mutable std::mutex mutex_;
    bool open_{true};
    std::map<std::string, Pending> pending_;
};

// ---------- HttpServerTransport ----------

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    server_->set_payload_max_length(opts_.max_frame_bytes);
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const httplib::Request& req, httplib::Response& res) const {
    // DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (origin.empty() || opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    write_status(res, 403, "Invalid origin");
    return false;
}

HttpServerTransport::SessionPtr HttpServerTransport::open_channel(std::string id, bool addressable) {
    auto session = std::make_shared<Session>(std::move(id), opts_.push_queue_capacity);
    session->addressable = addressable;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session->id()] = session;
    }
    if (callbacks_.on_open) callbacks_.on_open(session);
    return session;
}

HttpServerTransport::SessionPtr HttpServerTransport::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second->addressable) return nullptr;
    return it->second;
}

void HttpServerTransport::publish(const SessionPtr& session) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session->addressable = true;
}

void HttpServerTransport::close_channel(const SessionPtr& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session->id());
        if (it == sessions_.end() || it->second != session) return;
        sessions_.erase(it);
    }
    // on_close lets in-flight calls finish while their exchanges still wait.
    if (callbacks_.on_close) callbacks_.on_close(session);
    session->close();
}

size_t HttpServerTransport::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    size_t n = 0;
    for (const auto& [id, session] : sessions_) {
        if (session->addressable) ++n;
    }
    return n;
}

void HttpServerTransport::handle_request(const httplib::Request& req, httplib::Response& res) {
    if (!validate_origin(req, res)) return;

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(req.body);
    } catch (const McpError& e) {
        write_message(res, 400, Codec::decode_error_response(e));
        if (callbacks_.on_error) callbacks_.on_error(nullptr, std::current_exception());
        return;
    }

    const auto* request = std::get_if<JsonRpcRequest>(&msg);
    std::string session_id = req.get_header_value(kSessionHeader);
    SessionPtr session;
    bool one_shot = false;
    bool opening = false;

    if (!session_id.empty()) {
        session = find_session(session_id);
        if (!session) {
            write_status(res, 404, "Session not found");
            return;
        }
    } else if (request && request->method == methods::Initialize) {
        session = open_channel(generate_uuid(), false);
        opening = true;
    } else {
        session = open_channel("http-exchange-" + std::to_string(next_exchange_++), false);
        one_shot = true;
    }

    if (!request) {
        callbacks_.on_message(session, std::move(msg));
        if (one_shot) close_channel(session);
        res.status = 202;
        return;
    }

    RequestId id = request->id;
    auto reply = session->expect(id);
    if (!reply) {
        write_message(res, 200, make_error(id, error::InvalidRequest,
                                           "Duplicate request id: " + request_id_key(id)));
        if (one_shot || opening) close_channel(session);
        return;
    }

    callbacks_.on_message(session, std::move(msg));
    JsonRpcResponse response = reply->get();

    if (opening) {
        if (!response.error && session->is_open()) {
            publish(session);
            res.set_header(kSessionHeader, session->id());
            logging::logger()->info("HTTP session {} opened", session->id());
        } else {
            close_channel(session);
        }
    } else if (one_shot) {
        close_channel(session);
    }
    write_message(res, 200, response);
}

void HttpServerTransport::handle_notify(const httplib::Request& req, httplib::Response& res) {
    if (!validate_origin(req, res)) return;

    std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        write_status(res, 400, "Missing session header");
        return;
    }
    auto session = find_session(session_id);
    if (!session) {
        write_status(res, 404, "Session not found");
        return;
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(req.body);
    } catch (const McpError& e) {
        write_message(res, 400, Codec::decode_error_response(e));
        if (callbacks_.on_error) callbacks_.on_error(session, std::current_exception());
        return;
    }
    if (!std::holds_alternative<JsonRpcNotification>(msg)) {
        write_status(res, 400, "Only notifications are accepted here");
        return;
    }
    callbacks_.on_message(session, std::move(msg));
    res.status = 202;
}

void HttpServerTransport::handle_events(const httplib::Request& req, httplib::Response& res) {
    if (!validate_origin(req, res)) return;

    std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty() && req.has_param("session")) {
        session_id = req.get_param_value("session");
    }
    auto session = find_session(session_id);
    if (!session) {
        write_status(res, 404, "Session not found");
        return;
    }
    if (!session->attach_stream()) {
        write_status(res, 409, "Event stream already open");
        return;
    }

    auto queue = session->events();
    auto keepalive = opts_.keepalive_interval;
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider("text/event-stream",
        [queue, keepalive](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            bool closed = false;
            auto frame = queue->pop_for(keepalive, closed);
            if (frame) {
                std::string event = "data: " + *frame + "\n\n";
                return sink.write(event.data(), event.size());
            }
            if (closed) {
                sink.done();
                return true;
            }
            static const std::string ping = ": keepalive\n\n";
            return sink.write(ping.data(), ping.size());
        },
        [session](bool /*success*/) {
            session->detach_stream();
        });
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    if (!validate_origin(req, res)) return;

    std::string session_id = req.get_header_value(kSessionHeader);
    if (session_id.empty()) {
        write_status(res, 400, "Missing session header");
        return;
    }
    auto session = find_session(session_id);
    if (!session) {
        write_status(res, 404, "Session not found");
        return;
    }
    close_channel(session);
    logging::logger()->info("HTTP session {} ended by client", session_id);
    res.status = 200;
}

void HttpServerTransport::setup_routes() {
    server_->Post(opts_.request_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_request(req, res);
    });
    server_->Delete(opts_.request_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });
    server_->Post(opts_.notify_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_notify(req, res);
    });
    server_->Get(opts_.events_path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_events(req, res);
    });
    server_->Get(opts_.health_path, [](const httplib::Request&, httplib::Response& res) {
        res.set_content("{\"status\":\"ok\"}", "application/json");
    });
}

void HttpServerTransport::start(TransportCallbacks callbacks) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw McpTransportError("HttpServerTransport is already running");
    }
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    callbacks_ = std::move(callbacks);
    setup_routes();

    int port = -1;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (server_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }
    if (port < 0) {
        running_ = false;
        throw McpTransportError("Failed to bind HTTP server on " + opts_.host + ":" +
                                std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    logging::logger()->info("HTTP transport listening on {}:{}", opts_.host, port);

    if (!shutdown_requested_.load()) {
        server_->listen_after_bind();
    }

    std::map<std::string, SessionPtr> remaining;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        remaining.swap(sessions_);
    }
    for (auto& [id, session] : remaining) {
        if (callbacks_.on_close) callbacks_.on_close(session);
        session->close();
    }

    running_ = false;
    logging::logger()->info("HTTP transport stopped");
}

void HttpServerTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.load()) return;

    // Release event streams and waiting exchanges so the listener's worker
    // threads can finish.
    std::vector<SessionPtr> open;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& [id, session] : sessions_) open.push_back(session);
    }
    for (auto& session : open) session->close();
    server_->stop();
}

bool HttpServerTransport::is_running() const {
    return running_;
}

} // namespace mcpkit
