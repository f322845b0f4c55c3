#include <gtest/gtest.h>
#include "mcpkit/subscription_manager.hpp"
#include "../support/test_support.hpp"

using namespace mcpkit;
using namespace mcpkit::test;

namespace {

class WatchedResource : public ResourceHandler {
public:
    std::vector<ResourceContent> read(const std::string& uri, const QueryParams&) override {
        return {ResourceContent{uri, std::string("text/plain"), std::string("data"), std::nullopt}};
    }
    void subscribe(const std::string&) override { ++subscribes; }
    void unsubscribe(const std::string&) override { ++unsubscribes; }

    int subscribes = 0;
    int unsubscribes = 0;
};

struct Peer {
    std::shared_ptr<FakeChannel> channel;
    ConnectionPtr conn;
};

Peer ready_peer(const std::string& id, size_t capacity = 1024) {
    Peer p;
    p.channel = std::make_shared<FakeChannel>(id, capacity);
    p.conn = std::make_shared<Connection>(p.channel);
    p.conn->lifecycle().initialize("2024-11-05", ClientCapabilities{}, Implementation{"c", "1"});
    return p;
}

class SubscriptionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler = std::make_shared<WatchedResource>();
        resources.add("res://a", resource_info("res://a"), handler);
    }

    ResourceRegistry resources;
    SubscriptionManager manager{resources};
    std::shared_ptr<WatchedResource> handler;
};

} // namespace

TEST_F(SubscriptionManagerTest, SubscribeDeliversExactlyOneUpdate) {
    auto p = ready_peer("c1");
    manager.attach(p.conn);
    manager.subscribe("c1", "res://a");

    EXPECT_EQ(manager.emit_updated("res://a"), 1u);
    ASSERT_EQ(p.channel->pushes().size(), 1u);
    EXPECT_EQ(p.channel->pushes()[0].method, methods::ResourcesUpdated);
    EXPECT_EQ((*p.channel->pushes()[0].params)["uri"], "res://a");
}

TEST_F(SubscriptionManagerTest, SubscribeIsIdempotent) {
    auto p = ready_peer("c1");
    manager.attach(p.conn);
    manager.subscribe("c1", "res://a");
    manager.subscribe("c1", "res://a");

    EXPECT_EQ(handler->subscribes, 1);
    EXPECT_EQ(manager.subscribers("res://a").size(), 1u);
    EXPECT_EQ(manager.emit_updated("res://a"), 1u);
}

TEST_F(SubscriptionManagerTest, UnsubscribeStopsUpdates) {
    auto p = ready_peer("c1");
    manager.attach(p.conn);
    manager.subscribe("c1", "res://a");
    manager.unsubscribe("c1", "res://a");

    EXPECT_EQ(handler->unsubscribes, 1);
    EXPECT_EQ(manager.emit_updated("res://a"), 0u);
    EXPECT_TRUE(p.channel->pushes().empty());

    // Not subscribed any more: silently accepted.
    EXPECT_NO_THROW(manager.unsubscribe("c1", "res://a"));
    EXPECT_EQ(handler->unsubscribes, 1);
}

TEST_F(SubscriptionManagerTest, UnknownResource) {
    auto p = ready_peer("c1");
    manager.attach(p.conn);
    try {
        manager.subscribe("c1", "res://missing");
        FAIL() << "subscribe to an unknown uri succeeded";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::ResourceNotFound);
    }
    EXPECT_TRUE(manager.subscriptions_of("c1").empty());
}

TEST_F(SubscriptionManagerTest, UpdatesOnlyReachSubscribers) {
    auto a = ready_peer("c1");
    auto b = ready_peer("c2");
    manager.attach(a.conn);
    manager.attach(b.conn);
    manager.subscribe("c1", "res://a");

    EXPECT_EQ(manager.emit_updated("res://a"), 1u);
    EXPECT_EQ(a.channel->pushes().size(), 1u);
    EXPECT_TRUE(b.channel->pushes().empty());
}

TEST_F(SubscriptionManagerTest, DetachForgetsSubscriptions) {
    auto p = ready_peer("c1");
    manager.attach(p.conn);
    manager.subscribe("c1", "res://a");
    manager.detach("c1");

    EXPECT_EQ(manager.connection_count(), 0u);
    EXPECT_TRUE(manager.subscribers("res://a").empty());
    EXPECT_EQ(manager.emit_updated("res://a"), 0u);
}

TEST_F(SubscriptionManagerTest, FailedPushPrunesSubscriber) {
    auto p = ready_peer("c1", 0);
    manager.attach(p.conn);
    manager.subscribe("c1", "res://a");

    EXPECT_EQ(manager.emit_updated("res://a"), 0u);
    EXPECT_TRUE(manager.subscribers("res://a").empty());
    EXPECT_TRUE(manager.subscriptions_of("c1").empty());
}

TEST_F(SubscriptionManagerTest, ExpiredConnectionIsPruned) {
    {
        auto p = ready_peer("c1");
        manager.attach(p.conn);
        manager.subscribe("c1", "res://a");
    }
    EXPECT_EQ(manager.emit_updated("res://a"), 0u);
    EXPECT_TRUE(manager.subscribers("res://a").empty());
}

TEST_F(SubscriptionManagerTest, ListChangedReachesReadyConnectionsOnly) {
    auto ready = ready_peer("c1");
    auto fresh_channel = std::make_shared<FakeChannel>("c2");
    auto fresh = std::make_shared<Connection>(fresh_channel);
    manager.attach(ready.conn);
    manager.attach(fresh);

    EXPECT_EQ(manager.emit_list_changed(ListKind::Tools), 1u);
    EXPECT_EQ(ready.channel->count_pushes(methods::ToolsListChanged), 1u);
    EXPECT_TRUE(fresh_channel->pushes().empty());
}

TEST_F(SubscriptionManagerTest, BroadcastFilter) {
    auto a = ready_peer("c1");
    auto b = ready_peer("c2");
    manager.attach(a.conn);
    manager.attach(b.conn);

    JsonRpcNotification notif;
    notif.method = methods::LoggingMessage;
    size_t n = manager.broadcast(notif, [](const Connection& c) { return c.id() == "c2"; });
    EXPECT_EQ(n, 1u);
    EXPECT_TRUE(a.channel->pushes().empty());
    EXPECT_EQ(b.channel->pushes().size(), 1u);
}

TEST_F(SubscriptionManagerTest, PrefixFamilySubscription) {
    auto family = std::make_shared<WatchedResource>();
    resources.add("http://server/", resource_info("http://server/"), family);
    auto p = ready_peer("c1");
    manager.attach(p.conn);

    manager.subscribe("c1", "http://server/status");
    EXPECT_EQ(family->subscribes, 1);
    EXPECT_EQ(manager.emit_updated("http://server/status"), 1u);
    EXPECT_EQ(manager.emit_updated("http://server/other"), 0u);
}

TEST(ListChangedMethod, Names) {
    EXPECT_STREQ(list_changed_method(ListKind::Tools), "tools/list_changed");
    EXPECT_STREQ(list_changed_method(ListKind::Resources), "resources/list_changed");
    EXPECT_STREQ(list_changed_method(ListKind::Prompts), "prompts/list_changed");
}
