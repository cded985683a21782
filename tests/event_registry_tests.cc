#include <gtest/gtest.h>

#include <vector>

#include "core/event_registry.h"

TEST(EventRegistryTest, DeliversInSubscriptionOrderUntilUnsubscribed) {
    using namespace railyard;

    core::EventRegistry<int> registry;
    std::vector<int> received;
    const core::SubscriptionToken first = registry.subscribe([&received](const int& value) { received.push_back(value); });
    const core::SubscriptionToken second = registry.subscribe([&received](const int& value) { received.push_back(value * 10); });
    ASSERT_NE(first, core::kInvalidSubscriptionToken);
    ASSERT_NE(first, second);

    registry.notify(1);
    EXPECT_EQ(received, (std::vector<int>{1, 10}));

    EXPECT_TRUE(registry.unsubscribe(first));
    EXPECT_FALSE(registry.unsubscribe(first));
    registry.notify(2);
    EXPECT_EQ(received, (std::vector<int>{1, 10, 20}));
    EXPECT_EQ(registry.subscriberCount(), 1u);
}

TEST(EventRegistryTest, EmptyCallbackIsRejected) {
    using namespace railyard;

    core::EventRegistry<int> registry;
    EXPECT_EQ(registry.subscribe(core::EventRegistry<int>::Callback{}), core::kInvalidSubscriptionToken);
    EXPECT_EQ(registry.subscriberCount(), 0u);
}

TEST(EventRegistryTest, UnsubscribingDuringDispatchKeepsCurrentEvent) {
    using namespace railyard;

    core::EventRegistry<int> registry;
    int secondCalls = 0;
    core::SubscriptionToken secondToken = core::kInvalidSubscriptionToken;
    registry.subscribe([&](const int&) { registry.unsubscribe(secondToken); });
    secondToken = registry.subscribe([&secondCalls](const int&) { ++secondCalls; });

    registry.notify(0);
    registry.notify(0);
    EXPECT_EQ(secondCalls, 1);
}
