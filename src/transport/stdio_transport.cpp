#include "mcpkit/transport/stdio_transport.hpp"
#include "mcpkit/codec.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace mcpkit {

// ---------- StdioTransport::Channel ----------

class StdioTransport::Channel : public IChannel {
public:
    Channel(std::string id, std::shared_ptr<FrameQueue> outbox)
        : id_(std::move(id)), outbox_(std::move(outbox)) {}

    const std::string& id() const override { return id_; }
    TransportKind kind() const override { return TransportKind::LineStream; }

    void send(const JsonRpcResponse& response) override {
        if (!outbox_->push(Codec::serialize(response), false)) {
            logging::logger()->debug("Dropping response on closed channel {}", id_);
        }
    }

    bool push(const JsonRpcNotification& notification) override {
        if (!outbox_->push(Codec::serialize(notification), true)) {
            if (!outbox_->is_closed()) {
                logging::logger()->warn("Push queue of {} is full, dropping {}", id_, notification.method);
            }
            return false;
        }
        return true;
    }

    void close() override { outbox_->close(); }
    bool is_open() const override { return !outbox_->is_closed(); }

private:
    std::string id_;
    std::shared_ptr<FrameQueue> outbox_;
};

// ---------- StdioTransport ----------

StdioTransport::StdioTransport()
    : StdioTransport(Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : opts_(std::move(opts)), read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : StdioTransport(std::move(opts)) {
    read_fd_ = read_fd;
    write_fd_ = write_fd;
    owns_fds_ = true;
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (writer_thread_.joinable()) writer_thread_.join();
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(TransportCallbacks callbacks) {
    // shutdown() before start() means there is nothing to serve.
    if (shutdown_requested_.load()) return;
    if (running_.exchange(true)) {
        throw McpTransportError("StdioTransport is already running");
    }
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }

    outbox_ = std::make_shared<FrameQueue>(opts_.push_queue_capacity);
    channel_ = std::make_shared<Channel>(opts_.channel_id, outbox_);
    writer_thread_ = std::thread([this]() { write_loop(); });

    logging::logger()->info("Line-stream transport started");
    if (callbacks.on_open) callbacks.on_open(channel_);

    read_loop(callbacks);

    // The server drains in-flight calls inside on_close; their responses
    // still go out through the writer.
    if (callbacks.on_close) callbacks.on_close(channel_);
    outbox_->close();
    if (writer_thread_.joinable()) writer_thread_.join();

    running_ = false;
    logging::logger()->info("Line-stream transport stopped");
}

void StdioTransport::answer_decode_error(const TransportCallbacks& callbacks, std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const McpError& e) {
        channel_->send(Codec::decode_error_response(e));
    }
    if (callbacks.on_error) callbacks.on_error(channel_, error);
}

void StdioTransport::read_loop(const TransportCallbacks& callbacks) {
    std::string buffer;
    buffer.reserve(4096);

    char chunk[4096];

    while (running_) {
        // poll() so that shutdown() can interrupt the blocking read
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }

        if (fds[1].revents & POLLIN) break;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            if (callbacks.on_error) {
                callbacks.on_error(channel_, std::make_exception_ptr(
                    McpTransportError(std::string("Read error: ") + std::strerror(errno))));
            }
            break;
        }
        if (n == 0) break;  // EOF

        buffer.append(chunk, static_cast<size_t>(n));

        size_t pos = 0;
        while (true) {
            size_t nl = buffer.find('\n', pos);
            if (nl == std::string::npos) break;

            std::string line = buffer.substr(pos, nl - pos);
            pos = nl + 1;

            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.empty()) continue;

            if (line.size() > opts_.max_frame_bytes) {
                if (callbacks.on_error) {
                    callbacks.on_error(channel_, std::make_exception_ptr(McpTransportError(
                        "Frame of " + std::to_string(line.size()) + " bytes exceeds the limit")));
                }
                return;
            }

            JsonRpcMessage msg;
            try {
                msg = Codec::parse(line);
            } catch (const McpError&) {
                answer_decode_error(callbacks, std::current_exception());
                continue;
            }
            callbacks.on_message(channel_, std::move(msg));
        }

        if (pos > 0) buffer.erase(0, pos);

        // A partial line that is already over the limit can never become a
        // valid frame.
        if (buffer.size() > opts_.max_frame_bytes) {
            if (callbacks.on_error) {
                callbacks.on_error(channel_, std::make_exception_ptr(McpTransportError(
                    "Unterminated frame exceeds " + std::to_string(opts_.max_frame_bytes) + " bytes")));
            }
            return;
        }
    }
}

void StdioTransport::write_loop() {
    while (auto frame = outbox_->pop()) {
        frame->push_back('\n');
        const char* data = frame->data();
        size_t remaining = frame->size();

        while (remaining > 0) {
            ssize_t written = ::write(write_fd_, data, remaining);
            if (written < 0) {
                if (errno == EINTR) continue;
                logging::logger()->error("Line-stream write failed: {}", std::strerror(errno));
                outbox_->close();
                return;
            }
            data += written;
            remaining -= static_cast<size_t>(written);
        }
    }
}

void StdioTransport::shutdown() {
    shutdown_requested_ = true;
    if (!running_.exchange(false)) return;
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        ssize_t rc = ::write(wakeup_pipe_[1], &b, 1);
        (void)rc;  // non-blocking; a full pipe already wakes the reader
    }
}

bool StdioTransport::is_running() const {
    return running_;
}

} // namespace mcpkit
