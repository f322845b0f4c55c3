#pragma once
#include "json_rpc.hpp"
#include "lifecycle.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace mcpkit {

/// Server-side state of one accepted channel: its lifecycle, the ids of
/// requests it has in flight, and its logging threshold.
class Connection {
public:
    explicit Connection(ChannelPtr channel);

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] TransportKind kind() const { return kind_; }
    [[nodiscard]] const ChannelPtr& channel() const { return channel_; }

    Lifecycle& lifecycle() { return lifecycle_; }
    const Lifecycle& lifecycle() const { return lifecycle_; }

    /// Record a request id as pending. Returns false if that id is already
    /// pending on this connection.
    [[nodiscard]] bool begin_request(const RequestId& id);
    [[nodiscard]] bool is_pending(const RequestId& id) const;
    [[nodiscard]] size_t pending_count() const;

    /// Answer a request. Clears its correlation entry; responses for a
    /// closed connection are discarded.
    void send(const JsonRpcResponse& response);

    /// Returns false if the channel dropped the notification.
    bool push(const JsonRpcNotification& notification);

    void set_log_level(LogLevel level) { log_level_ = level; }
    [[nodiscard]] LogLevel log_level() const { return log_level_; }

private:
    ChannelPtr channel_;
    std::string id_;
    TransportKind kind_;
    Lifecycle lifecycle_;

    mutable std::mutex pending_mutex_;
    std::set<std::string> pending_;  // request_id_key()

    std::atomic<LogLevel> log_level_{LogLevel::Info};
};

using ConnectionPtr = std::shared_ptr<Connection>;

} // namespace mcpkit
