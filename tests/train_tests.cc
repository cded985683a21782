#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "sim/train.h"

namespace {

using railyard::sim::TrainPosition;
using railyard::track::TravelDirection;

// Joint 1 splits into a straight branch to joint 2 (segment 1) and a curved one to joint 3 (segment 2).
void BuildJunction(railyard::track::TrackGraph& graph) {
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {200.0, 0.0}, {}));
    ASSERT_TRUE(graph.branchToNewJoint(1, {500.0, 0.0}, {}));
    ASSERT_TRUE(graph.branchToNewJoint(1, {480.0, 120.0}, {{350.0, 0.0}}));
}

bool AnyBogieOn(const std::vector<TrainPosition>& bogies, railyard::track::SegmentId segment) {
    for (const TrainPosition& bogie : bogies) {
        if (bogie.segment == segment) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(TrainTest, ThrottleNamesRoundTrip) {
    using namespace railyard::sim;

    EXPECT_EQ(throttleName(ThrottleStep::Emergency), "er");
    EXPECT_EQ(throttleName(ThrottleStep::Neutral), "N");
    EXPECT_EQ(throttleName(ThrottleStep::P5), "p5");
    EXPECT_EQ(parseThrottleStep("b3"), std::optional<ThrottleStep>(ThrottleStep::B3));
    EXPECT_FALSE(parseThrottleStep("p6").has_value());
    EXPECT_DOUBLE_EQ(throttleAcceleration(ThrottleStep::Emergency), -1.3);
    EXPECT_DOUBLE_EQ(throttleAcceleration(ThrottleStep::Neutral), 0.0);
    EXPECT_DOUBLE_EQ(throttleAcceleration(ThrottleStep::P5), 0.7);
}

TEST(TrainTest, ThrottleStepsClampAtBothEnds) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);

    EXPECT_EQ(train.throttle(), ThrottleStep::Neutral);
    train.throttleUp();
    EXPECT_EQ(train.throttle(), ThrottleStep::P1);
    train.setThrottle(ThrottleStep::P5);
    train.throttleUp();
    EXPECT_EQ(train.throttle(), ThrottleStep::P5);
    train.setThrottle(ThrottleStep::Emergency);
    train.throttleDown();
    EXPECT_EQ(train.throttle(), ThrottleStep::Emergency);
    train.throttleUp();
    EXPECT_EQ(train.throttle(), ThrottleStep::B7);
}

TEST(TrainTest, AdvancePositionCrossesJointsAndStopsAtDeadEnds) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {100.0, 0.0}, {}));
    ASSERT_TRUE(graph.extendTrackFromJoint(1, {200.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);

    const TrainPosition start{0, 0.5, TravelDirection::Tangent, {50.0, 0.0}};
    const std::optional<WalkResult> across = advancePosition(100.0, start, graph, resolver);
    ASSERT_TRUE(across.has_value());
    EXPECT_FALSE(across->stop);
    EXPECT_EQ(across->position.segment, 1u);
    EXPECT_NEAR(across->position.t, 0.5, 1e-3);
    EXPECT_NEAR(across->position.point.x, 150.0, 0.1);
    ASSERT_EQ(across->passedJoints.size(), 1u);
    EXPECT_EQ(across->passedJoints[0], (OccupiedJoint{1, TravelDirection::Tangent}));
    ASSERT_EQ(across->enteringSegments.size(), 1u);
    EXPECT_EQ(across->enteringSegments[0].segment, 1u);
    EXPECT_EQ(across->enteringSegments[0].fromJoint, 1u);
    EXPECT_EQ(across->enteringSegments[0].toJoint, 2u);

    const std::optional<WalkResult> back = advancePosition(20.0, start, graph, resolver);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->position.segment, 0u);
    EXPECT_TRUE(back->passedJoints.empty());

    const std::optional<WalkResult> overrun = advancePosition(500.0, start, graph, resolver);
    ASSERT_TRUE(overrun.has_value());
    EXPECT_TRUE(overrun->stop);
    EXPECT_EQ(overrun->position.segment, 1u);
    EXPECT_DOUBLE_EQ(overrun->position.t, 1.0);

    const TrainPosition backwards{0, 0.5, TravelDirection::ReverseTangent, {50.0, 0.0}};
    const std::optional<WalkResult> toStart = advancePosition(80.0, backwards, graph, resolver);
    ASSERT_TRUE(toStart.has_value());
    EXPECT_TRUE(toStart->stop);
    EXPECT_DOUBLE_EQ(toStart->position.t, 0.0);

    const TrainPosition nowhere{9, 0.5, TravelDirection::Tangent, {}};
    EXPECT_FALSE(advancePosition(10.0, nowhere, graph, resolver).has_value());
}

TEST(TrainTest, SetPositionRequiresRoomForEveryBogie) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {300.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);

    // Only 30 units of track behind the lead for 140 units of train.
    EXPECT_FALSE(train.setPosition(TrainPosition{0, 0.1, TravelDirection::Tangent, {}}));
    EXPECT_FALSE(train.position().has_value());
    EXPECT_FALSE(train.setPosition(TrainPosition{5, 0.5, TravelDirection::Tangent, {}}));

    ASSERT_TRUE(train.setPosition(TrainPosition{0, 0.8, TravelDirection::Tangent, {}}));
    ASSERT_TRUE(train.position().has_value());
    EXPECT_NEAR(train.position()->point.x, 240.0, 1e-6);

    const std::vector<TrainPosition>& bogies = train.bogiePositions();
    ASSERT_EQ(bogies.size(), 6u);
    EXPECT_NEAR(bogies[1].point.x, 200.0, 0.1);
    EXPECT_NEAR(bogies[2].point.x, 190.0, 0.1);
    EXPECT_NEAR(bogies[5].point.x, 100.0, 0.1);
    EXPECT_EQ(bogies[5].direction, TravelDirection::ReverseTangent);
    EXPECT_TRUE(train.occupiedJoints().empty());
    ASSERT_EQ(train.occupiedSegments().size(), 1u);
    EXPECT_EQ(train.occupiedSegments()[0], (OccupiedSegment{0, TravelDirection::ReverseTangent}));

    train.clearPosition();
    EXPECT_FALSE(train.position().has_value());
    EXPECT_TRUE(train.bogiePositions().empty());
}

TEST(TrainTest, IdleTrainStaysPut) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {1000.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);
    ASSERT_TRUE(train.setPosition(TrainPosition{0, 0.5, TravelDirection::Tangent, {}}));

    train.setThrottle(ThrottleStep::Neutral);
    for (int i = 0; i < 100; ++i) {
        train.update(16.0);
    }
    EXPECT_DOUBLE_EQ(train.speed(), 0.0);
    EXPECT_DOUBLE_EQ(train.position()->t, 0.5);
}

TEST(TrainTest, PowerAcceleratesAndBrakesStop) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {1000.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);
    ASSERT_TRUE(train.setPosition(TrainPosition{0, 0.5, TravelDirection::Tangent, {}}));

    train.setThrottle(ThrottleStep::P5);
    train.update(1000.0);
    // No rolling resistance from a standstill.
    EXPECT_NEAR(train.speed(), 0.7, 1e-9);
    train.update(1000.0);
    EXPECT_NEAR(train.speed(), 1.3, 1e-9);
    EXPECT_GT(train.position()->t, 0.5);

    const double before = train.position()->t;
    train.setThrottle(ThrottleStep::Emergency);
    train.update(1000.0);
    EXPECT_DOUBLE_EQ(train.speed(), 0.0);
    EXPECT_DOUBLE_EQ(train.position()->t, before);
}

TEST(TrainTest, DeadEndBringsTrainToHardStop) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {300.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);
    ASSERT_TRUE(train.setPosition(TrainPosition{0, 0.9, TravelDirection::Tangent, {}}));

    train.setThrottle(ThrottleStep::P5);
    bool stopped = false;
    for (int i = 0; i < 100 && !stopped; ++i) {
        train.update(1000.0);
        stopped = train.throttle() == ThrottleStep::Neutral;
    }
    ASSERT_TRUE(stopped);
    EXPECT_DOUBLE_EQ(train.speed(), 0.0);
    EXPECT_LE(train.position()->t, 1.0);
    EXPECT_EQ(train.position()->segment, 0u);
}

TEST(TrainTest, BogiesFollowTheRouteTakenThroughAJunction) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);

    // Start on the curved branch, heading for the junction.
    ASSERT_TRUE(train.setPosition(TrainPosition{2, 0.1, TravelDirection::ReverseTangent, {}}));
    ASSERT_FALSE(AnyBogieOn(train.bogiePositions(), 1));
    train.setThrottle(ThrottleStep::P5);

    bool passed = false;
    for (int i = 0; i < 200 && !passed; ++i) {
        train.update(1000.0);
        ASSERT_EQ(train.bogiePositions().size(), 6u);
        ASSERT_FALSE(AnyBogieOn(train.bogiePositions(), 1)) << "after update " << i;
        passed = train.position()->segment == 0 && train.position()->t < 0.7;
    }
    ASSERT_TRUE(passed);
    EXPECT_TRUE(AnyBogieOn(train.bogiePositions(), 2));
    ASSERT_FALSE(train.occupiedJoints().empty());
    EXPECT_EQ(train.occupiedJoints().front(), (OccupiedJoint{1, TravelDirection::Tangent}));
    EXPECT_EQ(train.occupiedSegments().front().segment, 0u);
    EXPECT_EQ(train.occupiedSegments().back().segment, 2u);

    // Without the occupancy history the default route goes down the straight branch.
    const std::optional<std::vector<TrainPosition>> preview = train.getPreviewBogiePositions(*train.position());
    ASSERT_TRUE(preview.has_value());
    EXPECT_TRUE(AnyBogieOn(*preview, 1));
    EXPECT_FALSE(AnyBogieOn(*preview, 2));
    EXPECT_TRUE(train.previewPosition().has_value());
    train.clearPreviewPosition();
    EXPECT_FALSE(train.previewBogiePositions().has_value());
}

TEST(TrainTest, SwitchDirectionMakesRearBogieTheLead) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {1000.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);

    EXPECT_FALSE(train.switchDirection());

    ASSERT_TRUE(train.setPosition(TrainPosition{0, 0.5, TravelDirection::Tangent, {}}));
    ASSERT_TRUE(train.switchDirection());
    EXPECT_NEAR(train.position()->t, 0.36, 1e-3);
    EXPECT_EQ(train.position()->direction, TravelDirection::ReverseTangent);

    const std::vector<TrainPosition>& bogies = train.bogiePositions();
    ASSERT_EQ(bogies.size(), 6u);
    EXPECT_NEAR(bogies.back().t, 0.5, 1e-3);
    EXPECT_NEAR(bogies[1].t, 0.40, 1e-3);

    train.setThrottle(ThrottleStep::P5);
    train.update(1000.0);
    EXPECT_LT(train.position()->t, 0.36);
}

TEST(TrainTest, PreviewDirectionFlipRecomputesBogies) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {1000.0, 0.0}, {}));
    const DefaultJointDirectionResolver resolver(graph);
    Train train(graph, resolver);

    const std::optional<std::vector<TrainPosition>> preview =
        train.getPreviewBogiePositions(TrainPosition{0, 0.5, TravelDirection::Tangent, {}});
    ASSERT_TRUE(preview.has_value());
    EXPECT_LT(preview->back().t, 0.5);
    EXPECT_FALSE(train.position().has_value());

    train.flipTrainDirection();
    ASSERT_TRUE(train.previewBogiePositions().has_value());
    EXPECT_GT(train.previewBogiePositions()->back().t, 0.5);
    EXPECT_EQ(train.previewPosition()->direction, TravelDirection::ReverseTangent);
}
