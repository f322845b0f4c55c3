#pragma once
#include "frame_queue.hpp"
#include "transport.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace mcpkit {

/// StdioTransport reads newline-delimited JSON from one fd and writes to
/// another. The pair is a single connection; responses and pushes share
/// one writer thread so frames never interleave.
class StdioTransport : public ITransport {
public:
    struct Options {
        size_t max_frame_bytes = 4 * 1024 * 1024;
        /// Frames that may wait for the writer before pushes are refused.
        /// Responses are never refused.
        size_t push_queue_capacity = 256;
        std::string channel_id = "stdio";
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport over the given file descriptors, which it then owns.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    void start(TransportCallbacks callbacks) override;
    void shutdown() override;
    bool is_running() const override;

    [[nodiscard]] const Options& options() const { return opts_; }

private:
    class Channel;

    void read_loop(const TransportCallbacks& callbacks);
    void write_loop();
    void answer_decode_error(const TransportCallbacks& callbacks, std::exception_ptr error);

    Options opts_;
    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::shared_ptr<FrameQueue> outbox_;
    std::shared_ptr<Channel> channel_;
    std::thread writer_thread_;

    int wakeup_pipe_[2]{-1, -1};  // wakes poll() in read_loop on shutdown
};

} // namespace mcpkit
