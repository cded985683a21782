#include <gtest/gtest.h>

#include <algorithm>
#include <map>
#include <random>
#include <vector>

#include "world/spatial_index.h"

namespace {

using railyard::geometry::Aabb;
using railyard::math::Vec2;
using railyard::world::SpatialValue;

Aabb randomBox(std::mt19937& rng) {
    std::uniform_real_distribution<double> position(-500.0, 500.0);
    std::uniform_real_distribution<double> extent(0.5, 40.0);
    const Vec2 min{position(rng), position(rng)};
    return Aabb{min, Vec2{min.x + extent(rng), min.y + extent(rng)}};
}

std::vector<SpatialValue> bruteForce(const std::map<SpatialValue, Aabb>& boxes, const Aabb& query) {
    std::vector<SpatialValue> result;
    for (const auto& [value, bounds] : boxes) {
        if (bounds.intersects(query)) {
            result.push_back(value);
        }
    }
    return result;
}

std::vector<SpatialValue> sorted(std::vector<SpatialValue> values) {
    std::sort(values.begin(), values.end());
    return values;
}

} // namespace

TEST(SpatialIndexTest, SearchMatchesBruteForceOverRandomBoxes) {
    using namespace railyard;

    world::SegmentSpatialIndex index;
    std::map<SpatialValue, Aabb> boxes;
    std::mt19937 rng(42u);
    for (SpatialValue value = 0; value < 300; ++value) {
        const Aabb bounds = randomBox(rng);
        boxes[value] = bounds;
        index.insert(bounds, value);
    }
    ASSERT_EQ(index.size(), boxes.size());
    EXPECT_GT(index.height(), 2u);

    for (int query = 0; query < 200; ++query) {
        const Aabb window = randomBox(rng).expanded(static_cast<double>(query % 5) * 10.0);
        EXPECT_EQ(sorted(index.search(window)), bruteForce(boxes, window)) << "query " << query;
    }
}

TEST(SpatialIndexTest, RemovalsKeepSearchExact) {
    using namespace railyard;

    world::SegmentSpatialIndex index(world::SpatialIndexConfig{6});
    std::map<SpatialValue, Aabb> boxes;
    std::mt19937 rng(7u);
    for (SpatialValue value = 0; value < 250; ++value) {
        const Aabb bounds = randomBox(rng);
        boxes[value] = bounds;
        index.insert(bounds, value);
    }

    for (SpatialValue value = 0; value < 250; value += 3) {
        EXPECT_TRUE(index.removeByValue(value));
        boxes.erase(value);
    }
    EXPECT_FALSE(index.removeByValue(0));
    EXPECT_FALSE(index.removeByValue(9999));
    ASSERT_EQ(index.size(), boxes.size());

    for (int query = 0; query < 200; ++query) {
        const Aabb window = randomBox(rng).expanded(25.0);
        EXPECT_EQ(sorted(index.search(window)), bruteForce(boxes, window)) << "query " << query;
    }

    std::vector<SpatialValue> expectedAll;
    for (const auto& entry : boxes) {
        expectedAll.push_back(entry.first);
    }
    EXPECT_EQ(sorted(index.getAllObjects()), expectedAll);
}

TEST(SpatialIndexTest, RemovingEverythingLeavesAnEmptyTree) {
    using namespace railyard;

    world::SegmentSpatialIndex index;
    std::mt19937 rng(99u);
    for (SpatialValue value = 0; value < 64; ++value) {
        index.insert(randomBox(rng), value);
    }
    for (SpatialValue value = 0; value < 64; ++value) {
        ASSERT_TRUE(index.removeByValue(value));
    }
    EXPECT_EQ(index.size(), 0u);
    EXPECT_TRUE(index.getAllObjects().empty());
    EXPECT_TRUE(index.search(Aabb{Vec2{-1000.0, -1000.0}, Vec2{1000.0, 1000.0}}).empty());
}

TEST(SpatialIndexTest, ReinsertingAValueMovesIt) {
    using namespace railyard;

    world::SegmentSpatialIndex index;
    index.insert(Aabb{Vec2{0.0, 0.0}, Vec2{1.0, 1.0}}, 5);
    index.insert(Aabb{Vec2{100.0, 100.0}, Vec2{101.0, 101.0}}, 5);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_TRUE(index.search(Aabb{Vec2{0.0, 0.0}, Vec2{2.0, 2.0}}).empty());
    EXPECT_EQ(index.search(Aabb{Vec2{99.0, 99.0}, Vec2{100.5, 100.5}}), std::vector<SpatialValue>{5});
}

TEST(SpatialIndexTest, TouchingBoxesIntersectAndStatsAreReported) {
    using namespace railyard;

    world::SegmentSpatialIndex index;
    index.insert(Aabb{Vec2{0.0, 0.0}, Vec2{1.0, 1.0}}, 1);
    index.insert(Aabb{Vec2{5.0, 5.0}, Vec2{6.0, 6.0}}, 2);

    world::SpatialQueryStats stats{};
    const std::vector<SpatialValue> hits = index.search(Aabb{Vec2{1.0, 1.0}, Vec2{2.0, 2.0}}, &stats);
    EXPECT_EQ(hits, std::vector<SpatialValue>{1});
    EXPECT_GE(stats.visitedNodeCount, 1u);
    EXPECT_EQ(stats.candidateCount, 1u);
}

TEST(SpatialIndexTest, ConfigIsClampedAndChangingCapacityClears) {
    using namespace railyard;

    world::SegmentSpatialIndex index(world::SpatialIndexConfig{1});
    EXPECT_EQ(index.config().maxEntries, 2u);
    EXPECT_EQ(index.minEntries(), 1u);
    index.insert(Aabb{Vec2{0.0, 0.0}, Vec2{1.0, 1.0}}, 1);

    index.setConfig(world::SpatialIndexConfig{500});
    EXPECT_EQ(index.config().maxEntries, 64u);
    EXPECT_EQ(index.size(), 0u);
}
