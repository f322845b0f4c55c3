#pragma once
#include "transport.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpkit {

/// WebSocket server transport (Boost.Beast). Each accepted socket is one
/// connection carrying requests, responses and pushes as text frames; each
/// connection runs on its own I/O thread.
class WebSocketServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;  // 0: pick a free port, see port()
        std::string path = "/mcp";
        size_t push_queue_capacity = 256;
        size_t max_frame_bytes = 4 * 1024 * 1024;
    };

    explicit WebSocketServerTransport(Options opts);
    ~WebSocketServerTransport() override;

    void start(TransportCallbacks callbacks) override;
    void shutdown() override;
    bool is_running() const override;

    /// Bound port; 0 until start() has bound the listening socket.
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] size_t connection_count() const;

private:
    class Channel;
    struct Acceptor;

    void do_accept();
    void retire(const std::string& id);
    void join_retired();

    Options opts_;
    std::unique_ptr<Acceptor> acceptor_;
    TransportCallbacks callbacks_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> next_id_{1};

    mutable std::mutex channels_mutex_;
    std::map<std::string, std::shared_ptr<Channel>> live_;
    std::vector<std::shared_ptr<Channel>> retired_;
};

} // namespace mcpkit
