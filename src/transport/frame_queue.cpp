#include "mcpkit/transport/frame_queue.hpp"

namespace mcpkit {

FrameQueue::FrameQueue(size_t capacity) : capacity_(capacity) {}

bool FrameQueue::push(std::string frame, bool bounded) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        if (bounded && frames_.size() >= capacity_) return false;
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> FrameQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !frames_.empty() || closed_; });
    if (frames_.empty()) return std::nullopt;
    std::string frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

std::optional<std::string> FrameQueue::pop_for(std::chrono::milliseconds timeout, bool& closed) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !frames_.empty() || closed_; });
    closed = false;
    if (frames_.empty()) {
        closed = closed_;
        return std::nullopt;
    }
    std::string frame = std::move(frames_.front());
    frames_.pop_front();
    return frame;
}

void FrameQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool FrameQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t FrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

} // namespace mcpkit
