#pragma once
#include "mcpkit/codec.hpp"
#include "mcpkit/connection.hpp"
#include "mcpkit/dispatcher.hpp"
#include "mcpkit/server.hpp"
#include "mcpkit/transport/stdio_transport.hpp"
#include "mcpkit/transport/transport.hpp"
#include "mcpkit/types.hpp"
#include "mcpkit/version.hpp"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace mcpkit::test {

/// In-memory channel that records everything the server sends.
class FakeChannel : public IChannel {
public:
    explicit FakeChannel(std::string id = "fake-1", size_t push_capacity = 1024,
                         TransportKind kind = TransportKind::LineStream)
        : id_(std::move(id)), kind_(kind), push_capacity_(push_capacity) {}

    const std::string& id() const override { return id_; }
    TransportKind kind() const override { return kind_; }

    void send(const JsonRpcResponse& response) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_) return;
            responses_.push_back(response);
        }
        cv_.notify_all();
    }

    bool push(const JsonRpcNotification& notification) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!open_ || pushes_.size() >= push_capacity_) return false;
            pushes_.push_back(notification);
        }
        cv_.notify_all();
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }

    std::vector<JsonRpcResponse> responses() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return responses_;
    }

    std::vector<JsonRpcNotification> pushes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pushes_;
    }

    size_t count_pushes(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& p : pushes_) {
            if (p.method == method) ++n;
        }
        return n;
    }

    /// Wait until a response with `id` has been sent.
    std::optional<JsonRpcResponse> wait_response(const RequestId& id,
                                                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<JsonRpcResponse> found;
        cv_.wait_for(lock, timeout, [&] {
            for (const auto& r : responses_) {
                if (r.id == id) {
                    found = r;
                    return true;
                }
            }
            return false;
        });
        return found;
    }

    bool wait_pushes(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return pushes_.size() >= count; });
    }

private:
    std::string id_;
    TransportKind kind_;
    size_t push_capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool open_{true};
    std::vector<JsonRpcResponse> responses_;
    std::vector<JsonRpcNotification> pushes_;
};

inline JsonRpcRequest make_request(int64_t id, std::string method,
                                   std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcRequest req;
    req.id = RequestId{id};
    req.method = std::move(method);
    req.params = std::move(params);
    return req;
}

inline JsonRpcNotification make_notification(std::string method,
                                             std::optional<nlohmann::json> params = std::nullopt) {
    JsonRpcNotification n;
    n.method = std::move(method);
    n.params = std::move(params);
    return n;
}

inline nlohmann::json initialize_params(const std::string& version = std::string(PROTOCOL_VERSION)) {
    return {
        {"protocolVersion", version},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "test-client"}, {"version", "1.0"}}}
    };
}

/// Run the handshake on `conn`; fails the calling test if it is rejected.
inline void make_ready(Dispatcher& dispatcher, Connection& conn) {
    auto resp = dispatcher.handle_request(conn, make_request(0, "initialize", initialize_params()));
    if (resp.error) throw std::runtime_error("initialize failed: " + resp.error->message);
}

/// Counting tool used across the dispatcher and server tests.
class CountingTool : public ToolHandler {
public:
    explicit CountingTool(std::string reply = "ok") : reply_(std::move(reply)) {}

    CallToolResult call(const nlohmann::json&) override {
        ++calls;
        return text_result(reply_);
    }

    std::atomic<int> calls{0};

private:
    std::string reply_;
};

inline ToolInfo tool_info(const std::string& name) {
    ToolInfo info;
    info.name = name;
    info.input_schema = {{"type", "object"}};
    return info;
}

inline ResourceInfo resource_info(const std::string& uri, const std::string& name = "res") {
    ResourceInfo info;
    info.uri = uri;
    info.name = name;
    return info;
}

inline std::string first_text(const nlohmann::json& call_result) {
    return call_result.at("content").at(0).at("text").get<std::string>();
}

/// The peer end of a line-stream connection over two pipes.
class PipePeer {
public:
    PipePeer() {
        if (::pipe(to_server_) < 0 || ::pipe(from_server_) < 0) {
            throw std::runtime_error("pipe failed");
        }
    }

    ~PipePeer() {
        close_writer();
        if (from_server_[0] >= 0) ::close(from_server_[0]);
    }

    PipePeer(const PipePeer&) = delete;
    PipePeer& operator=(const PipePeer&) = delete;

    /// fds the server transport takes ownership of.
    int server_read_fd() const { return to_server_[0]; }
    int server_write_fd() const { return from_server_[1]; }

    void write_line(const std::string& line) { write_raw(line + "\n"); }

    void write_raw(const std::string& data) {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0) {
            ssize_t n = ::write(to_server_[1], p, left);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw std::runtime_error("write failed");
            }
            p += n;
            left -= static_cast<size_t>(n);
        }
    }

    void send(const JsonRpcMessage& msg) { write_line(Codec::serialize(msg)); }

    /// Next line from the server, or nullopt on timeout/EOF.
    std::optional<std::string> read_line(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            auto nl = buffer_.find('\n');
            if (nl != std::string::npos) {
                std::string line = buffer_.substr(0, nl);
                buffer_.erase(0, nl + 1);
                return line;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) return std::nullopt;

            struct pollfd pfd{from_server_[0], POLLIN, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
            if (rc < 0 && errno == EINTR) continue;
            if (rc <= 0) return std::nullopt;
            char chunk[4096];
            ssize_t n = ::read(from_server_[0], chunk, sizeof(chunk));
            if (n <= 0) return std::nullopt;
            buffer_.append(chunk, static_cast<size_t>(n));
        }
    }

    std::optional<JsonRpcMessage> read_message(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto line = read_line(timeout);
        if (!line) return std::nullopt;
        return Codec::parse(*line);
    }

    /// Read until the response for `id` arrives; notifications seen on the
    /// way are kept in `notifications`.
    std::optional<JsonRpcResponse> await_response(const RequestId& id,
                                                  std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            auto msg = read_message(left);
            if (!msg) return std::nullopt;
            if (auto* resp = std::get_if<JsonRpcResponse>(&*msg)) {
                if (resp->id == id) return *resp;
            } else if (auto* notif = std::get_if<JsonRpcNotification>(&*msg)) {
                notifications.push_back(*notif);
            }
        }
        return std::nullopt;
    }

    JsonRpcResponse call(int64_t id, const std::string& method,
                         std::optional<nlohmann::json> params = std::nullopt) {
        send(make_request(id, method, std::move(params)));
        auto resp = await_response(RequestId{id});
        if (!resp) throw std::runtime_error("no response to " + method);
        return *resp;
    }

    /// Closing the write end makes the server see EOF.
    void close_writer() {
        if (to_server_[1] >= 0) {
            ::close(to_server_[1]);
            to_server_[1] = -1;
        }
    }

    std::vector<JsonRpcNotification> notifications;

private:
    int to_server_[2]{-1, -1};
    int from_server_[2]{-1, -1};
    std::string buffer_;
};

/// An McpServer serving a line-stream connection whose other end is `peer`.
class StdioSession {
public:
    explicit StdioSession(McpServer& server) : server_(server) {
        auto transport = std::make_unique<StdioTransport>(peer.server_read_fd(), peer.server_write_fd());
        thread_ = std::thread([this, t = std::move(transport)]() mutable { server_.serve(std::move(t)); });
    }

    ~StdioSession() { stop(); }

    StdioSession(const StdioSession&) = delete;
    StdioSession& operator=(const StdioSession&) = delete;

    /// Send initialize and return its result.
    nlohmann::json initialize(const std::string& version = std::string(PROTOCOL_VERSION)) {
        auto resp = peer.call(0, "initialize", initialize_params(version));
        if (!resp.result) throw std::runtime_error("initialize rejected: " + resp.error->message);
        return *resp.result;
    }

    /// End the input and wait for the server to finish serving.
    void stop() {
        peer.close_writer();
        if (thread_.joinable()) thread_.join();
    }

    PipePeer peer;

private:
    McpServer& server_;
    std::thread thread_;
};

} // namespace mcpkit::test
