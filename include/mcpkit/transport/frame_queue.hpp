#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace mcpkit {

/// Outbound frames of one connection, drained by a single writer.
///
/// Responses are always accepted while the queue is open; pushes are
/// refused once `capacity` frames are waiting.
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity);

    FrameQueue(const FrameQueue&) = delete;
    FrameQueue& operator=(const FrameQueue&) = delete;

    /// Returns false if the queue is closed, or if `bounded` and full.
    bool push(std::string frame, bool bounded);

    /// Blocks until a frame is available. nullopt once closed and drained.
    std::optional<std::string> pop();

    /// Like pop(), but gives up after `timeout`. `closed` is set when the
    /// queue is closed and drained.
    std::optional<std::string> pop_for(std::chrono::milliseconds timeout, bool& closed);

    /// Refuse new frames; already queued frames can still be popped.
    void close();

    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] size_t size() const;
    [[nodiscard]] size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_{false};
};

} // namespace mcpkit
