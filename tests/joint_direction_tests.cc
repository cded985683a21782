#include <gtest/gtest.h>

#include <optional>
#include <vector>

#include "sim/joint_direction.h"

namespace {

using railyard::sim::NextHop;
using railyard::track::TravelDirection;

// Joint 1 splits into a straight branch to joint 2 and a curved one to joint 3.
void BuildJunction(railyard::track::TrackGraph& graph) {
    ASSERT_TRUE(graph.createNewTrackSegment({0.0, 0.0}, {200.0, 0.0}, {}));
    ASSERT_TRUE(graph.branchToNewJoint(1, {500.0, 0.0}, {}));
    ASSERT_TRUE(graph.branchToNewJoint(1, {480.0, 120.0}, {{350.0, 0.0}}));
}

void ExpectHop(const std::optional<NextHop>& hop, railyard::track::JointId joint, railyard::track::SegmentId segment, TravelDirection direction) {
    ASSERT_TRUE(hop.has_value());
    EXPECT_EQ(hop->joint, joint);
    EXPECT_EQ(hop->segment, segment);
    EXPECT_EQ(hop->direction, direction);
}

} // namespace

TEST(JointDirectionTest, DefaultsToLowestNeighbourId) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);

    ExpectHop(resolver.getNextJoint(1, TravelDirection::Tangent), 2, 1, TravelDirection::Tangent);
    ExpectHop(resolver.getNextJoint(1, TravelDirection::ReverseTangent), 0, 0, TravelDirection::ReverseTangent);
    ExpectHop(resolver.getNextJoint(0, TravelDirection::Tangent), 1, 0, TravelDirection::Tangent);
}

TEST(JointDirectionTest, DeadEndsAndUnknownJointsHaveNoNextHop) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);

    EXPECT_FALSE(resolver.getNextJoint(2, TravelDirection::Tangent).has_value());
    EXPECT_FALSE(resolver.getNextJoint(0, TravelDirection::ReverseTangent).has_value());
    EXPECT_FALSE(resolver.getNextJoint(99, TravelDirection::Tangent).has_value());
}

TEST(JointDirectionTest, OccupiedJointsOverrideTheDefault) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);

    const std::vector<OccupiedJoint> joints{{1, TravelDirection::Tangent}, {3, TravelDirection::ReverseTangent}};
    ExpectHop(resolver.getNextJoint(1, TravelDirection::Tangent, joints), 3, 2, TravelDirection::Tangent);

    // History recorded for the other direction does not apply.
    ExpectHop(resolver.getNextJoint(1, TravelDirection::ReverseTangent, joints), 0, 0, TravelDirection::ReverseTangent);
}

TEST(JointDirectionTest, LastOccupiedJointDefersToTailSegment) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);

    const std::vector<OccupiedJoint> joints{{1, TravelDirection::Tangent}};
    const std::vector<OccupiedSegment> segments{{0, TravelDirection::Tangent}, {2, TravelDirection::Tangent}};
    ExpectHop(resolver.getNextJoint(1, TravelDirection::Tangent, joints, segments), 3, 2, TravelDirection::Tangent);

    // Without segment history the default choice is used.
    ExpectHop(resolver.getNextJoint(1, TravelDirection::Tangent, joints), 2, 1, TravelDirection::Tangent);
}

TEST(JointDirectionTest, ResolverCanBeReplaced) {
    using namespace railyard::sim;

    // Always takes the highest neighbour id instead.
    class HighestIdResolver final : public JointDirectionResolver {
    public:
        explicit HighestIdResolver(const railyard::track::TrackGraph& graph) : m_graph(graph) {}

        std::optional<NextHop> getNextJoint(
            railyard::track::JointId joint,
            TravelDirection direction,
            std::span<const OccupiedJoint>,
            std::span<const OccupiedSegment>
        ) const override {
            const railyard::track::Joint* stored = m_graph.getJoint(joint);
            if (stored == nullptr) {
                return std::nullopt;
            }
            for (auto it = stored->connections.rbegin(); it != stored->connections.rend(); ++it) {
                if (it->second.sense != direction) {
                    continue;
                }
                const railyard::track::TrackSegment* segment = m_graph.getTrackSegmentWithJoints(it->second.segment);
                const TravelDirection along = segment->t0Joint == joint ? TravelDirection::Tangent : TravelDirection::ReverseTangent;
                return NextHop{it->first, along, it->second.segment};
            }
            return std::nullopt;
        }

    private:
        const railyard::track::TrackGraph& m_graph;
    };

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const HighestIdResolver resolver(graph);
    const JointDirectionResolver& base = resolver;
    ExpectHop(base.getNextJoint(1, TravelDirection::Tangent), 3, 2, TravelDirection::Tangent);
}

TEST(JointDirectionTest, HistoryThatDisagreesWithTheGraphFailsTheHop) {
    using namespace railyard::sim;

    railyard::track::TrackGraph graph;
    BuildJunction(graph);
    const DefaultJointDirectionResolver resolver(graph);

    // Joint 0 sits behind joint 1, not beyond it on the tangent side.
    const std::vector<OccupiedJoint> unconnected{{1, TravelDirection::Tangent}, {0, TravelDirection::Tangent}};
    EXPECT_FALSE(resolver.getNextJoint(1, TravelDirection::Tangent, unconnected).has_value());

    const std::vector<OccupiedJoint> lastJoint{{1, TravelDirection::Tangent}};
    const std::vector<OccupiedSegment> missingTail{{0, TravelDirection::Tangent}, {42, TravelDirection::Tangent}};
    EXPECT_FALSE(resolver.getNextJoint(1, TravelDirection::Tangent, lastJoint, missingTail).has_value());
}
