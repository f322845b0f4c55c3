#include "mcpkit/connection.hpp"
#include "mcpkit/logging.hpp"

namespace mcpkit {

Connection::Connection(ChannelPtr channel)
    : channel_(std::move(channel)), id_(channel_->id()), kind_(channel_->kind()) {}

bool Connection::begin_request(const RequestId& id) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.insert(request_id_key(id)).second;
}

bool Connection::is_pending(const RequestId& id) const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.count(request_id_key(id)) > 0;
}

size_t Connection::pending_count() const {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    return pending_.size();
}

void Connection::send(const JsonRpcResponse& response) {
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        pending_.erase(request_id_key(response.id));
    }
    if (lifecycle_.state() == LifecycleState::Closed || !channel_->is_open()) {
        logging::logger()->debug("Discarding response {} for closed connection {}",
                                 request_id_key(response.id), id_);
        return;
    }
    channel_->send(response);
}

bool Connection::push(const JsonRpcNotification& notification) {
    if (!channel_->is_open()) return false;
    return channel_->push(notification);
}

} // namespace mcpkit
