#include <gtest/gtest.h>
#include "mcpkit/error.hpp"
#include "mcpkit/lifecycle.hpp"
#include <chrono>
#include <memory>
#include <thread>

using namespace mcpkit;

namespace {

void init(Lifecycle& lc) {
    lc.initialize("2024-11-05", ClientCapabilities{}, Implementation{"client", "1.0"});
}

} // namespace

TEST(Lifecycle, StartsUninitialized) {
    Lifecycle lc;
    EXPECT_EQ(lc.state(), LifecycleState::Uninitialized);
    EXPECT_FALSE(lc.is_ready());
    EXPECT_EQ(lc.in_flight(), 0u);
}

TEST(Lifecycle, InitializeReachesReady) {
    Lifecycle lc;
    init(lc);
    EXPECT_TRUE(lc.is_ready());
    EXPECT_EQ(lc.negotiated_version(), "2024-11-05");
    EXPECT_EQ(lc.client_info().name, "client");
}

TEST(Lifecycle, SecondInitializeRejected) {
    Lifecycle lc;
    init(lc);
    try {
        init(lc);
        FAIL() << "second initialize accepted";
    } catch (const McpProtocolError& e) {
        EXPECT_EQ(e.code, error::InvalidRequest);
    }
    EXPECT_TRUE(lc.is_ready());
}

TEST(Lifecycle, ShutdownWithoutInFlightDrainsImmediately) {
    Lifecycle lc;
    init(lc);
    EXPECT_TRUE(lc.shutdown(std::chrono::milliseconds(10)));
    EXPECT_EQ(lc.state(), LifecycleState::Closed);
}

TEST(Lifecycle, ShutdownFromUninitialized) {
    Lifecycle lc;
    EXPECT_TRUE(lc.shutdown(std::chrono::milliseconds(0)));
    EXPECT_EQ(lc.state(), LifecycleState::Closed);
    EXPECT_THROW(init(lc), McpProtocolError);
}

TEST(Lifecycle, ShutdownWaitsForInFlight) {
    Lifecycle lc;
    init(lc);
    auto token = lc.track();
    ASSERT_TRUE(token.has_value());
    EXPECT_EQ(lc.in_flight(), 1u);

    std::thread finisher([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        token->release();
    });
    EXPECT_TRUE(lc.shutdown(std::chrono::seconds(5)));
    finisher.join();
    EXPECT_EQ(lc.in_flight(), 0u);
}

TEST(Lifecycle, ShutdownAbandonsAfterGrace) {
    Lifecycle lc;
    init(lc);
    auto token = lc.track();
    ASSERT_TRUE(token.has_value());

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(lc.shutdown(std::chrono::milliseconds(50)));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    EXPECT_EQ(lc.state(), LifecycleState::Closed);
}

TEST(Lifecycle, TrackRefusedOnceClosed) {
    Lifecycle lc;
    init(lc);
    lc.shutdown(std::chrono::milliseconds(0));
    EXPECT_FALSE(lc.track().has_value());
}

TEST(Lifecycle, TokenReleasesOnDestruction) {
    Lifecycle lc;
    {
        auto token = lc.track();
        auto moved = std::move(*token);
        EXPECT_EQ(lc.in_flight(), 1u);
    }
    EXPECT_EQ(lc.in_flight(), 0u);
}

TEST(Lifecycle, TokenKeepsOwnerAliveUntilReleased) {
    auto owner = std::make_shared<Lifecycle>();
    std::weak_ptr<Lifecycle> watch = owner;
    init(*owner);

    auto token = owner->track(owner);
    ASSERT_TRUE(token.has_value());
    auto held = std::make_shared<Lifecycle::InFlightToken>(std::move(*token));
    token.reset();

    owner.reset();
    ASSERT_FALSE(watch.expired());
    EXPECT_EQ(watch.lock()->in_flight(), 1u);

    held.reset();
    EXPECT_TRUE(watch.expired());
}

TEST(Lifecycle, StateNames) {
    EXPECT_STREQ(to_string(LifecycleState::Ready), "ready");
    EXPECT_STREQ(to_string(LifecycleState::ShuttingDown), "shutting_down");
}
