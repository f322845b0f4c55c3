#include "mcpkit/lifecycle.hpp"
#include "mcpkit/error.hpp"

namespace mcpkit {

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Uninitialized: return "uninitialized";
        case LifecycleState::Initializing:  return "initializing";
        case LifecycleState::Ready:         return "ready";
        case LifecycleState::ShuttingDown:  return "shutting_down";
        case LifecycleState::Closed:        return "closed";
    }
    return "unknown";
}

void Lifecycle::InFlightToken::release() {
    if (owner_) {
        owner_->finish_one();
        owner_ = nullptr;
    }
    keep_alive_.reset();
}

LifecycleState Lifecycle::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void Lifecycle::advance(LifecycleState next) {
    if (next <= state_) {
        throw McpProtocolError(error::InvalidRequest,
            std::string("Invalid lifecycle transition: ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
}

void Lifecycle::initialize(std::string negotiated_version, ClientCapabilities client_caps,
                           Implementation client_info) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != LifecycleState::Uninitialized) {
        throw McpProtocolError(error::InvalidRequest, "Connection already initialized");
    }
    advance(LifecycleState::Initializing);
    negotiated_version_ = std::move(negotiated_version);
    client_caps_ = std::move(client_caps);
    client_info_ = std::move(client_info);
    advance(LifecycleState::Ready);
}

std::optional<Lifecycle::InFlightToken> Lifecycle::track(std::shared_ptr<const void> keep_alive) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == LifecycleState::Closed) return std::nullopt;
    ++in_flight_;
    return InFlightToken(this, std::move(keep_alive));
}

void Lifecycle::finish_one() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) --in_flight_;
    }
    idle_cv_.notify_all();
}

size_t Lifecycle::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

bool Lifecycle::shutdown(std::chrono::milliseconds grace) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ >= LifecycleState::ShuttingDown) return in_flight_ == 0;
    advance(LifecycleState::ShuttingDown);

    bool drained = idle_cv_.wait_for(lock, grace, [this] { return in_flight_ == 0; });
    advance(LifecycleState::Closed);
    return drained;
}

std::string Lifecycle::negotiated_version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negotiated_version_;
}

ClientCapabilities Lifecycle::client_capabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_caps_;
}

Implementation Lifecycle::client_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

} // namespace mcpkit
