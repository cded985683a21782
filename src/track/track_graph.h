#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "core/event_registry.h"
#include "geometry/aabb.h"
#include "geometry/bezier_curve.h"
#include "math/math.h"
#include "track/joint_manager.h"
#include "track/track_config.h"
#include "track/track_curve_manager.h"
#include "track/track_events.h"
#include "track/track_types.h"

// Track graph subsystem
// Responsible for: graph mutations (connect, branch, extend, insert, remove) and hit-testing over joints and segments.
// Should NOT do: train motion, preview synthesis, or rendering.
namespace railyard::track {

struct DeadEndConnection {
    JointId neighbor = kInvalidJointId;
    SegmentId segment = kInvalidSegmentId;
};

enum class ElevationSortKey : std::uint8_t {
    Min = 0,
    Max = 1,
    Average = 2
};

class TrackGraph {
public:
    explicit TrackGraph(const TrackGraphConfig& config = TrackGraphConfig{});

    void setConfig(const TrackGraphConfig& config);
    [[nodiscard]] const TrackGraphConfig& config() const { return m_config; }

    [[nodiscard]] const Joint* getJoint(JointId joint) const;
    [[nodiscard]] std::vector<std::pair<JointId, const Joint*>> getJoints() const;
    [[nodiscard]] std::optional<math::Vec2> getJointPosition(JointId joint) const;

    JointId createNewEmptyJoint(const math::Vec2& position, const math::Vec2& tangent, Elevation elevation = Elevation::Ground);

    // Two fresh joints joined by one segment; the start joint's tangent points along the curve.
    bool createNewTrackSegment(
        const math::Vec2& startPosition,
        const math::Vec2& endPosition,
        const std::vector<math::Vec2>& controlPoints,
        Elevation startElevation = Elevation::Ground,
        Elevation endElevation = Elevation::Ground
    );
    bool connectJoints(JointId startJoint, JointId endJoint, const std::vector<math::Vec2>& controlPoints);
    bool branchToNewJoint(JointId startJoint, const math::Vec2& endPosition, const std::vector<math::Vec2>& controlPoints);
    // Like branchToNewJoint, but the curve must leave within 90 degrees of the joint's unused tangent side.
    bool extendTrackFromJoint(JointId startJoint, const math::Vec2& endPosition, const std::vector<math::Vec2>& controlPoints);

    // Both return the new joint, or nullopt for ramps and unknown segments.
    std::optional<JointId> insertJointIntoTrackSegment(JointId startJoint, JointId endJoint, double atT);
    std::optional<JointId> insertJointIntoTrackSegmentUsingTrackNumber(SegmentId segment, double atT);

    // Refuses to leave a joint with no way out on a side while the other side still branches.
    bool removeTrackSegment(SegmentId segment);

    [[nodiscard]] std::optional<math::Vec2> getTangentAtJoint(JointId joint) const;
    [[nodiscard]] std::optional<double> getCurvatureAtJoint(JointId joint) const;
    [[nodiscard]] bool jointIsEndingTrack(JointId joint) const;
    [[nodiscard]] bool tangentIsPointingInEmptyDirection(JointId joint) const;
    [[nodiscard]] std::optional<DeadEndConnection> getDeadEndJointSoleConnection(JointId joint) const;
    [[nodiscard]] std::optional<JointId> getTheOtherEndOfEndingTrack(JointId joint) const;

    // Joint hits win over curve hits, which win over edge hits.
    [[nodiscard]] ProjectionResult project(const math::Vec2& point) const;
    [[nodiscard]] std::optional<ProjectionJointResult> pointOnJoint(const math::Vec2& point) const;
    [[nodiscard]] std::optional<ProjectionCurveResult> projectPointOnTrack(const math::Vec2& point) const;
    [[nodiscard]] std::optional<ProjectionEdgeResult> onTrackSegmentEdge(const math::Vec2& point) const;

    [[nodiscard]] const TrackSegment* getTrackSegmentWithJoints(SegmentId segment) const;
    [[nodiscard]] const geometry::BezierCurve* getTrackSegmentCurve(SegmentId segment) const;
    [[nodiscard]] std::vector<std::pair<SegmentId, const TrackSegment*>> trackSegments() const;
    [[nodiscard]] std::optional<double> getFullLength(SegmentId segment) const;
    [[nodiscard]] std::vector<std::pair<SegmentId, const TrackSegment*>> getSortedTrackSegments(
        ElevationSortKey key = ElevationSortKey::Min
    ) const;

    [[nodiscard]] std::vector<TrackDrawData> getDrawData(const geometry::Aabb& viewport);
    // Position of the slice containing tVal in the last getDrawData result.
    [[nodiscard]] std::optional<std::size_t> getTrackDrawDataOrder(SegmentId segment, double tVal) const;

    [[nodiscard]] TrackCurveManager& trackCurveManager() { return m_trackCurveManager; }
    [[nodiscard]] const TrackCurveManager& trackCurveManager() const { return m_trackCurveManager; }

    core::SubscriptionToken subscribe(core::EventRegistry<TrackEvent>::Callback callback);
    bool unsubscribe(core::SubscriptionToken token);

    // Cross-checks joint adjacency against segment endpoints; logs every mismatch.
    [[nodiscard]] bool validateTopology() const;

private:
    [[nodiscard]] static geometry::BezierCurve buildCurve(
        const math::Vec2& start,
        const std::vector<math::Vec2>& controlPoints,
        const math::Vec2& end
    );
    [[nodiscard]] std::set<SegmentId> adjacentSegments(std::initializer_list<JointId> joints) const;
    bool attachNewJoint(JointId startJoint, const math::Vec2& endPosition, const geometry::BezierCurve& curve);
    std::optional<JointId> splitSegment(SegmentId segment, double atT);

    TrackGraphConfig m_config{};
    JointManager m_jointManager;
    TrackCurveManager m_trackCurveManager;
};

} // namespace railyard::track
