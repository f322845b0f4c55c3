#include "mcpkit/subscription_manager.hpp"
#include "mcpkit/error.hpp"
#include "mcpkit/logging.hpp"
#include <mutex>

namespace mcpkit {

const char* list_changed_method(ListKind kind) {
    switch (kind) {
        case ListKind::Tools:     return methods::ToolsListChanged;
        case ListKind::Resources: return methods::ResourcesListChanged;
        case ListKind::Prompts:   return methods::PromptsListChanged;
    }
    return methods::ToolsListChanged;
}

SubscriptionManager::SubscriptionManager(const ResourceRegistry& resources)
    : resources_(resources) {}

void SubscriptionManager::attach(const ConnectionPtr& conn) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    connections_[conn->id()] = conn;
}

void SubscriptionManager::detach(const std::string& connection_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    connections_.erase(connection_id);
    auto it = by_connection_.find(connection_id);
    if (it == by_connection_.end()) return;
    for (const auto& uri : it->second) {
        auto u = by_uri_.find(uri);
        if (u == by_uri_.end()) continue;
        u->second.erase(connection_id);
        if (u->second.empty()) by_uri_.erase(u);
    }
    by_connection_.erase(it);
}

void SubscriptionManager::subscribe(const std::string& connection_id, const std::string& uri) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = by_connection_.find(connection_id);
        if (it != by_connection_.end() && it->second.count(uri)) return;
    }

    auto entry = resources_.resolve(uri);
    if (!entry) {
        throw McpProtocolError(error::ResourceNotFound, "Resource not found: " + uri);
    }
    entry->handler->subscribe(uri);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!connections_.count(connection_id)) {
        throw McpError("Connection is not attached: " + connection_id);
    }
    by_uri_[uri].insert(connection_id);
    by_connection_[connection_id].insert(uri);
}

void SubscriptionManager::unsubscribe(const std::string& connection_id, const std::string& uri) {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = by_connection_.find(connection_id);
        if (it == by_connection_.end() || it->second.erase(uri) == 0) return;
        if (it->second.empty()) by_connection_.erase(it);
        auto u = by_uri_.find(uri);
        if (u != by_uri_.end()) {
            u->second.erase(connection_id);
            if (u->second.empty()) by_uri_.erase(u);
        }
    }

    if (auto entry = resources_.resolve(uri)) {
        entry->handler->unsubscribe(uri);
    }
}

void SubscriptionManager::prune(const std::string& connection_id, const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto u = by_uri_.find(uri);
    if (u != by_uri_.end()) {
        u->second.erase(connection_id);
        if (u->second.empty()) by_uri_.erase(u);
    }
    auto c = by_connection_.find(connection_id);
    if (c != by_connection_.end()) {
        c->second.erase(uri);
        if (c->second.empty()) by_connection_.erase(c);
    }
}

size_t SubscriptionManager::emit_updated(const std::string& uri) {
    std::vector<std::pair<std::string, ConnectionPtr>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto u = by_uri_.find(uri);
        if (u == by_uri_.end()) return 0;
        for (const auto& id : u->second) {
            auto c = connections_.find(id);
            targets.emplace_back(id, c == connections_.end() ? nullptr : c->second.lock());
        }
    }

    JsonRpcNotification notif;
    notif.method = methods::ResourcesUpdated;
    notif.params = nlohmann::json{{"uri", uri}};

    size_t delivered = 0;
    for (const auto& [id, conn] : targets) {
        if (conn && !conn->lifecycle().is_ready()) continue;
        if (conn && conn->push(notif)) {
            ++delivered;
            continue;
        }
        logging::logger()->debug("Pruning subscriber {} of {}", id, uri);
        prune(id, uri);
    }
    return delivered;
}

size_t SubscriptionManager::broadcast(const JsonRpcNotification& notification,
                                      const std::function<bool(const Connection&)>& filter) {
    std::vector<ConnectionPtr> targets;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        targets.reserve(connections_.size());
        for (const auto& [id, weak] : connections_) {
            if (auto conn = weak.lock()) targets.push_back(std::move(conn));
        }
    }

    size_t delivered = 0;
    for (const auto& conn : targets) {
        if (!conn->lifecycle().is_ready()) continue;
        if (filter && !filter(*conn)) continue;
        if (conn->push(notification)) {
            ++delivered;
        } else {
            logging::logger()->debug("Dropped {} for connection {}", notification.method, conn->id());
        }
    }
    return delivered;
}

size_t SubscriptionManager::emit_list_changed(ListKind kind) {
    JsonRpcNotification notif;
    notif.method = list_changed_method(kind);
    return broadcast(notif);
}

std::vector<std::string> SubscriptionManager::subscribers(const std::string& uri) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto u = by_uri_.find(uri);
    if (u == by_uri_.end()) return {};
    return {u->second.begin(), u->second.end()};
}

std::set<std::string> SubscriptionManager::subscriptions_of(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto c = by_connection_.find(connection_id);
    if (c == by_connection_.end()) return {};
    return c->second;
}

size_t SubscriptionManager::connection_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return connections_.size();
}

ConnectionPtr SubscriptionManager::find(const std::string& connection_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto c = connections_.find(connection_id);
    return c == connections_.end() ? nullptr : c->second.lock();
}

} // namespace mcpkit
