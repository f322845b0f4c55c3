#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace mcpkit {

/// HTTP server transport.
///
/// `POST request_path` carries one message and is answered on the same
/// exchange. A session (one connection) is created by an `initialize` POST
/// without an `Mcp-Session-Id` header; later exchanges name it in that
/// header. Server pushes for a session are delivered on its
/// `GET events_path` Server-Sent Events stream.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;  // 0: pick a free port, see port()
        std::string request_path = "/mcp";
        std::string notify_path = "/mcp/notify";
        std::string events_path = "/mcp/events";
        std::string health_path = "/health";
        std::vector<std::string> allowed_origins;  // empty: any origin
        size_t push_queue_capacity = 256;
        size_t max_frame_bytes = 4 * 1024 * 1024;
        std::chrono::milliseconds keepalive_interval{15000};
    };

    static constexpr const char* kSessionHeader = "Mcp-Session-Id";

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    void start(TransportCallbacks callbacks) override;
    void shutdown() override;
    bool is_running() const override;

    /// Bound port; 0 until start() has bound the listening socket.
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] size_t session_count() const;

private:
    class Session;
    using SessionPtr = std::shared_ptr<Session>;

    void setup_routes();
    bool validate_origin(const httplib::Request& req, httplib::Response& res) const;

    void handle_request(const httplib::Request& req, httplib::Response& res);
    void handle_notify(const httplib::Request& req, httplib::Response& res);
    void handle_events(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);

    SessionPtr open_channel(std::string id, bool addressable);
    SessionPtr find_session(const std::string& id) const;
    void publish(const SessionPtr& session);
    void close_channel(const SessionPtr& session);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    TransportCallbacks callbacks_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> next_exchange_{1};

    mutable std::mutex sessions_mutex_;
    std::map<std::string, SessionPtr> sessions_;  // every open channel
};

} // namespace mcpkit
