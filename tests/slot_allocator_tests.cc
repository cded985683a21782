#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <string>

#include "core/slot_allocator.h"

TEST(SlotAllocatorTest, CreateGetDestroyRoundTrip) {
    using namespace railyard;

    core::SlotAllocator<std::string> allocator(2);
    const core::SlotId a = allocator.create("a");
    const core::SlotId b = allocator.create("b");
    ASSERT_NE(a, b);
    ASSERT_NE(allocator.get(a), nullptr);
    EXPECT_EQ(*allocator.get(a), "a");
    EXPECT_EQ(*allocator.get(b), "b");

    EXPECT_TRUE(allocator.destroy(a));
    EXPECT_EQ(allocator.get(a), nullptr);
    EXPECT_FALSE(allocator.destroy(a));
    EXPECT_EQ(*allocator.get(b), "b");
    EXPECT_EQ(allocator.liveCount(), 1u);
}

TEST(SlotAllocatorTest, GrowsByDoublingWhenFreeListRunsOut) {
    using namespace railyard;

    core::SlotAllocator<int> allocator(2);
    EXPECT_EQ(allocator.capacity(), 2u);
    allocator.create(1);
    allocator.create(2);
    allocator.create(3);
    EXPECT_EQ(allocator.capacity(), 4u);
    allocator.create(4);
    allocator.create(5);
    EXPECT_EQ(allocator.capacity(), 8u);
    EXPECT_EQ(allocator.liveCount(), 5u);
}

TEST(SlotAllocatorTest, DestroyedIdsAreRecycledOnlyAfterFreeSlotsBeforeThem) {
    using namespace railyard;

    core::SlotAllocator<int> allocator(3);
    const core::SlotId first = allocator.create(10);
    allocator.destroy(first);
    // Ids 1 and 2 were already queued ahead of the recycled id.
    EXPECT_EQ(allocator.create(11), 1u);
    EXPECT_EQ(allocator.create(12), 2u);
    EXPECT_EQ(allocator.create(13), first);
    EXPECT_EQ(*allocator.get(first), 13);
}

TEST(SlotAllocatorTest, LivingEntitiesTrackRandomCreateDestroySequences) {
    using namespace railyard;

    core::SlotAllocator<int> allocator(4);
    std::map<core::SlotId, int> expected;
    std::mt19937 rng(1234u);
    std::uniform_int_distribution<int> action(0, 2);

    int nextValue = 0;
    for (int step = 0; step < 2000; ++step) {
        if (action(rng) != 0 || expected.empty()) {
            const int value = nextValue++;
            const core::SlotId id = allocator.create(value);
            ASSERT_EQ(expected.count(id), 0u) << "live id handed out twice";
            expected[id] = value;
        } else {
            auto victim = expected.begin();
            std::advance(victim, static_cast<long>(rng() % expected.size()));
            ASSERT_TRUE(allocator.destroy(victim->first));
            expected.erase(victim);
        }

        ASSERT_EQ(allocator.liveCount(), expected.size());
    }

    for (const auto& [id, value] : expected) {
        ASSERT_NE(allocator.get(id), nullptr);
        EXPECT_EQ(*allocator.get(id), value);
    }

    std::vector<core::SlotId> living = allocator.livingEntities();
    std::sort(living.begin(), living.end());
    std::vector<core::SlotId> expectedIds;
    for (const auto& entry : expected) {
        expectedIds.push_back(entry.first);
    }
    EXPECT_EQ(living, expectedIds);

    for (const auto& [id, value] : allocator.livingEntitiesWithId()) {
        EXPECT_EQ(*value, expected.at(id));
    }
}

TEST(SlotAllocatorTest, ClearForgetsEverything) {
    using namespace railyard;

    core::SlotAllocator<int> allocator(2);
    allocator.create(1);
    allocator.create(2);
    allocator.create(3);
    allocator.clear();
    EXPECT_EQ(allocator.liveCount(), 0u);
    EXPECT_EQ(allocator.capacity(), 2u);
    EXPECT_EQ(allocator.get(0), nullptr);
    EXPECT_EQ(allocator.create(7), 0u);
}
