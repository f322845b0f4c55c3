#pragma once
#include "../json_rpc.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace mcpkit {

enum class TransportKind {
    LineStream,
    Http,
    WebSocket
};

const char* to_string(TransportKind kind);

/// One accepted connection, as seen by the server.
class IChannel {
public:
    virtual ~IChannel() = default;

    [[nodiscard]] virtual const std::string& id() const = 0;
    [[nodiscard]] virtual TransportKind kind() const = 0;

    /// Deliver the response to a request received on this channel.
    virtual void send(const JsonRpcResponse& response) = 0;

    /// Deliver an out-of-band notification. Returns false when the channel
    /// is closed or its outbound queue is full; the message is dropped.
    virtual bool push(const JsonRpcNotification& notification) = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const = 0;
};

using ChannelPtr = std::shared_ptr<IChannel>;

struct TransportCallbacks {
    std::function<void(const ChannelPtr&)> on_open;
    std::function<void(const ChannelPtr&, JsonRpcMessage)> on_message;
    std::function<void(const ChannelPtr&)> on_close;
    std::function<void(const ChannelPtr&, std::exception_ptr)> on_error;
};

/// Accepts connections and drives their receive loops.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Run until shutdown() is called or the transport's input ends.
    /// on_close is delivered for every channel that saw on_open.
    virtual void start(TransportCallbacks callbacks) = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_running() const = 0;
};

} // namespace mcpkit
