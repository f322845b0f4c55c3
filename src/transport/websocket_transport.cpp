#include "mcpkit/transport/websocket_transport.hpp"
#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <deque>
#include <thread>

namespace mcpkit {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kHandshakeTimeout{10};
constexpr std::chrono::seconds kCloseTimeout{5};

bool is_disconnect(const beast::error_code& ec) {
    return ec == websocket::error::closed || ec == net::error::operation_aborted ||
           ec == net::error::eof || ec == net::error::connection_reset ||
           ec == beast::error::timeout;
}

} // anonymous namespace

struct WebSocketServerTransport::Acceptor {
    net::io_context ioc;
    tcp::acceptor acceptor{ioc};
};

// ---------- WebSocketServerTransport::Channel ----------

/// One WebSocket connection. All socket operations run on the channel's own
/// io_context thread; send/push/close may be called from any thread.
class WebSocketServerTransport::Channel
    : public IChannel, public std::enable_shared_from_this<WebSocketServerTransport::Channel> {
public:
    Channel(std::string id, const Options& opts, WebSocketServerTransport& owner)
        : id_(std::move(id)), path_(opts.path), capacity_(opts.push_queue_capacity),
          max_frame_bytes_(opts.max_frame_bytes), owner_(owner), ws_(ioc_) {}

    ~Channel() override {
        // The last reference can be released on the channel's own thread.
        if (thread_.joinable()) thread_.detach();
    }

    const std::string& id() const override { return id_; }
    TransportKind kind() const override { return TransportKind::WebSocket; }

    void send(const JsonRpcResponse& response) override {
        if (!enqueue(Codec::serialize(response), false)) {
            logging::logger()->debug("Dropping response on closed channel {}", id_);
        }
    }

    bool push(const JsonRpcNotification& notification) override {
        if (enqueue(Codec::serialize(notification), true)) return true;
        if (is_open()) {
            logging::logger()->warn("Push queue of {} is full, dropping {}", id_, notification.method);
        }
        return false;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            open_ = false;
        }
        net::post(ioc_, [weak = weak_from_this()]() {
            if (auto self = weak.lock()) self->begin_close();
        });
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    tcp::socket& socket() { return beast::get_lowest_layer(ws_).socket(); }

    void run() {
        auto self = shared_from_this();
        net::post(ioc_, [self]() { self->read_upgrade(); });
        thread_ = std::thread([self]() { self->serve(); });
    }

    void join() {
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
    }

private:
    void serve() {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            logging::logger()->error("WebSocket connection {} failed: {}", id_, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = false;
            outbox_.clear();
        }
        if (opened_ && owner_.callbacks_.on_close) owner_.callbacks_.on_close(shared_from_this());
        owner_.retire(id_);
    }

    void read_upgrade() {
        beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
        http::async_read(ws_.next_layer(), read_buffer_, upgrade_,
            [self = shared_from_this()](beast::error_code ec, size_t) {
                self->on_upgrade_request(ec);
            });
    }

    void on_upgrade_request(beast::error_code ec) {
        if (ec) {
            logging::logger()->debug("WebSocket handshake on {} failed: {}", id_, ec.message());
            return;
        }

        std::string target(upgrade_.target());
        target = target.substr(0, target.find('?'));
        if (!websocket::is_upgrade(upgrade_) || target != path_) {
            auto res = std::make_shared<http::response<http::string_body>>(
                http::status::not_found, upgrade_.version());
            res->set(http::field::content_type, "application/json");
            res->body() = "{\"error\":\"Not found\"}";
            res->keep_alive(false);
            res->prepare_payload();
            http::async_write(ws_.next_layer(), *res,
                [self = shared_from_this(), res](beast::error_code, size_t) {
                    beast::error_code ignored;
                    self->socket().shutdown(tcp::socket::shutdown_send, ignored);
                });
            return;
        }

        beast::get_lowest_layer(ws_).expires_never();
        auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::server);
        timeouts.handshake_timeout = kCloseTimeout;
        ws_.set_option(timeouts);
        ws_.read_message_max(max_frame_bytes_);
        ws_.text(true);
        ws_.async_accept(upgrade_, [self = shared_from_this()](beast::error_code ec) {
            self->on_accept(ec);
        });
    }

    void on_accept(beast::error_code ec) {
        if (ec) {
            logging::logger()->warn("WebSocket upgrade on {} failed: {}", id_, ec.message());
            return;
        }
        accepted_ = true;
        if (!is_open()) {
            begin_close();
            return;
        }
        opened_ = true;
        if (owner_.callbacks_.on_open) owner_.callbacks_.on_open(shared_from_this());
        read_buffer_.consume(read_buffer_.size());
        do_read();
    }

    void do_read() {
        ws_.async_read(read_buffer_, [self = shared_from_this()](beast::error_code ec, size_t) {
            self->on_read(ec);
        });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                open_ = false;
            }
            if (is_disconnect(ec)) {
                logging::logger()->debug("WebSocket connection {} ended: {}", id_, ec.message());
            } else if (owner_.callbacks_.on_error) {
                owner_.callbacks_.on_error(shared_from_this(), std::make_exception_ptr(
                    McpTransportError("WebSocket read failed: " + ec.message())));
            }
            return;
        }

        std::string text = beast::buffers_to_string(read_buffer_.data());
        read_buffer_.consume(read_buffer_.size());

        JsonRpcMessage msg;
        bool decoded = false;
        try {
            msg = Codec::parse(text);
            decoded = true;
        } catch (const McpError& e) {
            send(Codec::decode_error_response(e));
            if (owner_.callbacks_.on_error) {
                owner_.callbacks_.on_error(shared_from_this(), std::current_exception());
            }
        }
        if (decoded) owner_.callbacks_.on_message(shared_from_this(), std::move(msg));
        do_read();
    }

    bool enqueue(std::string frame, bool bounded) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return false;
            if (bounded && outbox_.size() >= capacity_) return false;
            outbox_.push_back(std::move(frame));
            if (writing_) return true;
            writing_ = true;
        }
        net::post(ioc_, [weak = weak_from_this()]() {
            if (auto self = weak.lock()) self->do_write();
        });
        return true;
    }

    void do_write() {
        bool close_now = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (outbox_.empty()) {
                writing_ = false;
                close_now = close_pending_;
                close_pending_ = false;
                if (!close_now) return;
            } else {
                current_ = std::move(outbox_.front());
                outbox_.pop_front();
            }
        }
        if (close_now) {
            begin_close();
            return;
        }
        ws_.async_write(net::buffer(current_), [self = shared_from_this()](beast::error_code ec, size_t) {
            if (ec) {
                if (!is_disconnect(ec)) {
                    logging::logger()->error("WebSocket write on {} failed: {}", self->id_, ec.message());
                }
                std::lock_guard<std::mutex> lock(self->mutex_);
                self->open_ = false;
                self->outbox_.clear();
                self->writing_ = false;
                return;
            }
            self->do_write();
        });
    }

    // Runs on the I/O thread. Queued frames are flushed first.
    void begin_close() {
        if (!accepted_) {
            beast::error_code ignored;
            socket().close(ignored);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (writing_) {
                close_pending_ = true;
                return;
            }
        }
        if (closing_) return;
        closing_ = true;
        ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
            if (ec && !is_disconnect(ec)) {
                logging::logger()->debug("WebSocket close on {}: {}", self->id_, ec.message());
            }
        });
    }

    const std::string id_;
    const std::string path_;
    const size_t capacity_;
    const size_t max_frame_bytes_;
    WebSocketServerTransport& owner_;

    net::io_context ioc_;
    websocket::stream<beast::tcp_stream> ws_;
    std::thread thread_;

    // I/O thread only
    beast::flat_buffer read_buffer_;
    http::request<http::string_body> upgrade_;
    std::string current_;
    bool accepted_{false};
    bool opened_{false};
    bool closing_{false};

    mutable std::mutex mutex_;
    bool open_{true};
    bool writing_{false};
    bool close_pending_{false};
    std::deque<std::string> outbox_;
};

// ---------- WebSocketServerTransport ----------

WebSocketServerTransport::WebSocketServerTransport(Options opts)
    : opts_(std::move(opts)), acceptor_(std::make_unique<Acceptor>()) {
}

WebSocketServerTransport::~WebSocketServerTransport() {
    shutdown();
}

void WebSocketServerTransport::start(TransportCallbacks callbacks) {
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw McpTransportError("WebSocketServerTransport is already running");
    }
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }
    callbacks_ = std::move(callbacks);

    auto fail = [this](const std::string& what, const beast::error_code& ec) {
        running_ = false;
        throw McpTransportError("Failed to " + what + " WebSocket server on " + opts_.host + ":" +
                                std::to_string(opts_.port) + ": " + ec.message());
    };

    beast::error_code ec;
    auto address = net::ip::make_address(opts_.host, ec);
    if (ec) fail("resolve", ec);
    tcp::endpoint endpoint(address, opts_.port);

    auto& acceptor = acceptor_->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (ec) fail("open", ec);
    acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) fail("configure", ec);
    acceptor.bind(endpoint, ec);
    if (ec) fail("bind", ec);
    acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) fail("listen on", ec);

    bound_port_ = acceptor.local_endpoint().port();
    logging::logger()->info("WebSocket transport listening on {}:{}{}", opts_.host, bound_port_.load(), opts_.path);

    do_accept();
    acceptor_->ioc.run();

    std::vector<std::shared_ptr<Channel>> remaining;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        for (auto& [id, channel] : live_) remaining.push_back(channel);
    }
    for (auto& channel : remaining) channel->close();
    for (auto& channel : remaining) channel->join();
    join_retired();
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        live_.clear();
    }

    running_ = false;
    logging::logger()->info("WebSocket transport stopped");
}

void WebSocketServerTransport::do_accept() {
    auto channel = std::make_shared<Channel>("ws-" + std::to_string(next_id_++), opts_, *this);
    acceptor_->acceptor.async_accept(channel->socket(), [this, channel](beast::error_code ec) {
        if (ec) {
            if (ec == net::error::operation_aborted || shutdown_requested_) return;
            logging::logger()->error("WebSocket accept failed: {}", ec.message());
        } else {
            join_retired();
            {
                std::lock_guard<std::mutex> lock(channels_mutex_);
                live_[channel->id()] = channel;
            }
            channel->run();
        }
        if (!shutdown_requested_) do_accept();
    });
}

void WebSocketServerTransport::retire(const std::string& id) {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    auto it = live_.find(id);
    if (it == live_.end()) return;
    retired_.push_back(it->second);
    live_.erase(it);
}

void WebSocketServerTransport::join_retired() {
    std::vector<std::shared_ptr<Channel>> done;
    {
        std::lock_guard<std::mutex> lock(channels_mutex_);
        done.swap(retired_);
    }
    for (auto& channel : done) channel->join();
}

void WebSocketServerTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.load()) return;
    net::post(acceptor_->ioc, [this]() {
        beast::error_code ignored;
        acceptor_->acceptor.close(ignored);
    });
}

bool WebSocketServerTransport::is_running() const {
    return running_;
}

size_t WebSocketServerTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(channels_mutex_);
    return live_.size();
}

} // namespace mcpkit
