#pragma once
#include "connection.hpp"
#include "registry.hpp"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpkit {

enum class ListKind {
    Tools,
    Resources,
    Prompts
};

/// Notification method announcing a change to the given list.
const char* list_changed_method(ListKind kind);

/// Tracks which connections want `resources/updated` for which uris and
/// fans change notifications out to them.
class SubscriptionManager {
public:
    explicit SubscriptionManager(const ResourceRegistry& resources);

    SubscriptionManager(const SubscriptionManager&) = delete;
    SubscriptionManager& operator=(const SubscriptionManager&) = delete;

    /// Make a connection reachable by broadcasts.
    void attach(const ConnectionPtr& conn);

    /// Forget a connection and every subscription it holds.
    void detach(const std::string& connection_id);

    /// Resolve `uri` against the registered resources, let the owning
    /// handler know, then record the membership. Idempotent.
    /// Throws McpProtocolError(ResourceNotFound) if nothing resolves.
    void subscribe(const std::string& connection_id, const std::string& uri);

    /// No error if the connection was not subscribed.
    void unsubscribe(const std::string& connection_id, const std::string& uri);

    /// Push `resources/updated` to every Ready subscriber of `uri`.
    /// Subscribers whose push fails are pruned. Returns the number of
    /// successful deliveries.
    size_t emit_updated(const std::string& uri);

    /// Push the list-changed notification for `kind` to every Ready
    /// connection. Returns the number of successful deliveries.
    size_t emit_list_changed(ListKind kind);

    /// Push an arbitrary notification to every Ready connection accepted by
    /// `filter`.
    size_t broadcast(const JsonRpcNotification& notification,
                     const std::function<bool(const Connection&)>& filter = nullptr);

    [[nodiscard]] std::vector<std::string> subscribers(const std::string& uri) const;
    [[nodiscard]] std::set<std::string> subscriptions_of(const std::string& connection_id) const;
    [[nodiscard]] size_t connection_count() const;
    [[nodiscard]] ConnectionPtr find(const std::string& connection_id) const;

private:
    void prune(const std::string& connection_id, const std::string& uri);

    const ResourceRegistry& resources_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::weak_ptr<Connection>> connections_;
    std::map<std::string, std::set<std::string>> by_uri_;          // uri -> connection ids
    std::map<std::string, std::set<std::string>> by_connection_;   // connection id -> uris
};

} // namespace mcpkit
