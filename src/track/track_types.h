#pragma once

#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <variant>
#include <vector>

#include "core/slot_allocator.h"
#include "geometry/aabb.h"
#include "geometry/bezier_curve.h"
#include "math/math.h"

// Track data model
// Responsible for: joint, segment, slice, draw-data and projection value types shared by the track subsystem.
// Should NOT do: mutation logic, spatial indexing, or train state.
namespace railyard::track {

using JointId = core::SlotId;
using SegmentId = core::SlotId;

inline constexpr JointId kInvalidJointId = std::numeric_limits<JointId>::max();
inline constexpr SegmentId kInvalidSegmentId = std::numeric_limits<SegmentId>::max();

inline constexpr double kDefaultGauge = 1.067;
// World units per elevation level.
inline constexpr double kLevelHeight = 10.0;

enum class Elevation : std::int8_t {
    Sub3 = -3,
    Sub2 = -2,
    Sub1 = -1,
    Ground = 0,
    Above1 = 1,
    Above2 = 2,
    Above3 = 3
};

inline constexpr Elevation kMinElevation = Elevation::Sub3;
inline constexpr Elevation kMaxElevation = Elevation::Above3;

inline constexpr double elevationHeight(Elevation level) {
    return static_cast<double>(static_cast<std::int8_t>(level)) * kLevelHeight;
}

// Which way a neighbour lies relative to the joint's stored tangent.
enum class TravelDirection : std::uint8_t {
    Tangent = 0,
    ReverseTangent = 1
};

inline constexpr TravelDirection flipDirection(TravelDirection direction) {
    return direction == TravelDirection::Tangent ? TravelDirection::ReverseTangent : TravelDirection::Tangent;
}

struct JointConnection {
    SegmentId segment = kInvalidSegmentId;
    TravelDirection sense = TravelDirection::Tangent;
};

struct Joint {
    math::Vec2 position{};
    math::Vec2 tangent{1.0, 0.0};
    Elevation elevation = Elevation::Ground;
    // Keyed by the joint at the far end; ordered so iteration is by neighbour id.
    std::map<JointId, JointConnection> connections;

    [[nodiscard]] bool connectedTo(JointId neighbor) const { return connections.count(neighbor) != 0; }
    [[nodiscard]] std::vector<JointId> neighbors(TravelDirection direction) const;
    [[nodiscard]] std::size_t directionCount(TravelDirection direction) const;
    [[nodiscard]] std::vector<JointId> tangentNeighbors() const { return neighbors(TravelDirection::Tangent); }
    [[nodiscard]] std::vector<JointId> reverseTangentNeighbors() const { return neighbors(TravelDirection::ReverseTangent); }
};

inline std::vector<JointId> Joint::neighbors(TravelDirection direction) const {
    std::vector<JointId> result;
    for (const auto& [neighbor, connection] : connections) {
        if (connection.sense == direction) {
            result.push_back(neighbor);
        }
    }
    return result;
}

inline std::size_t Joint::directionCount(TravelDirection direction) const {
    std::size_t count = 0;
    for (const auto& entry : connections) {
        if (entry.second.sense == direction) {
            ++count;
        }
    }
    return count;
}

struct ElevationSpan {
    Elevation from = Elevation::Ground;
    Elevation to = Elevation::Ground;

    constexpr bool operator==(const ElevationSpan&) const = default;
};

// Heights in world units.
struct HeightInterval {
    double from = 0.0;
    double to = 0.0;

    constexpr bool operator==(const HeightInterval&) const = default;
};

struct TInterval {
    double start = 0.0;
    double end = 1.0;

    constexpr bool operator==(const TInterval&) const = default;
};

struct SplitSlice {
    geometry::BezierCurve curve;
    HeightInterval elevation{};
    TInterval tInterval{};
};

struct TrackSegment {
    JointId t0Joint = kInvalidJointId;
    JointId t1Joint = kInvalidJointId;
    geometry::BezierCurve curve;
    double gauge = kDefaultGauge;
    ElevationSpan elevation{};
    // Interior parameters where the curve was subdivided, increasing.
    std::vector<double> splits;
    std::vector<SplitSlice> splitCurves;
    std::set<SegmentId> excludedSegments;
    std::vector<math::Vec2> positiveOffsets;
    std::vector<math::Vec2> negativeOffsets;
};

struct DrawDataKey {
    SegmentId segment = kInvalidSegmentId;
    std::uint32_t sliceIndex = 0;

    constexpr bool operator==(const DrawDataKey&) const = default;
    constexpr bool operator<(const DrawDataKey& rhs) const {
        return segment != rhs.segment ? segment < rhs.segment : sliceIndex < rhs.sliceIndex;
    }
};

struct TrackDrawData {
    DrawDataKey key{};
    geometry::BezierCurve curve;
    math::Vec2 startJointPosition{};
    math::Vec2 endJointPosition{};
    TInterval tInterval{};
    double gauge = kDefaultGauge;
    HeightInterval elevation{};
    HeightInterval originalElevation{};
    std::set<SegmentId> excludeSegmentsForCollisionCheck;
};

struct PreviewDrawData {
    std::size_t index = 0;
    TrackDrawData drawData;
    std::vector<math::Vec2> positiveOffsets;
    std::vector<math::Vec2> negativeOffsets;
};

struct ProjectionMiss {};

struct ProjectionJointResult {
    JointId joint = kInvalidJointId;
    math::Vec2 projectionPoint{};
    math::Vec2 tangent{};
    double curvature = 0.0;
    bool endingJoint = false;
};

struct ProjectionCurveResult {
    SegmentId segment = kInvalidSegmentId;
    JointId t0Joint = kInvalidJointId;
    JointId t1Joint = kInvalidJointId;
    double atT = 0.0;
    math::Vec2 projectionPoint{};
    math::Vec2 tangent{};
    double curvature = 0.0;
    ElevationSpan elevation{};
};

struct ProjectionEdgeResult {
    SegmentId segment = kInvalidSegmentId;
    JointId t0Joint = kInvalidJointId;
    JointId t1Joint = kInvalidJointId;
    double atT = 0.0;
    // Offset one gauge width off the rails, on the side of the query point.
    math::Vec2 projectionPoint{};
    math::Vec2 tangent{};
    double curvature = 0.0;
};

using ProjectionResult = std::variant<ProjectionMiss, ProjectionJointResult, ProjectionCurveResult, ProjectionEdgeResult>;

inline bool isHit(const ProjectionResult& result) {
    return !std::holds_alternative<ProjectionMiss>(result);
}

} // namespace railyard::track
