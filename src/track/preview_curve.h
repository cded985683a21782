#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "math/math.h"
#include "track/track_types.h"

// Track PreviewCurve subsystem
// Responsible for: classifying pointer projections into new-joint kinds and synthesizing preview control points.
// Should NOT do: commit anything to the graph or keep per-frame editor state beyond the flip toggles.
namespace railyard::track {

struct NewJoint {
    math::Vec2 position{};
    Elevation elevation = Elevation::Ground;
};

struct ConstrainedJoint {
    math::Vec2 position{};
    Elevation elevation = Elevation::Ground;
    ProjectionEdgeResult constraint{};
};

struct BranchJoint {
    math::Vec2 position{};
    Elevation elevation = Elevation::Ground;
    ProjectionJointResult constraint{};
};

struct ExtendingTrackJoint {
    math::Vec2 position{};
    Elevation elevation = Elevation::Ground;
    ProjectionJointResult constraint{};
};

struct BranchCurveJoint {
    math::Vec2 position{};
    Elevation elevation = Elevation::Ground;
    ProjectionCurveResult constraint{};
    ElevationSpan curveElevation{};
};

using NewJointType = std::variant<NewJoint, ConstrainedJoint, BranchJoint, ExtendingTrackJoint, BranchCurveJoint>;

enum class PreviewCurveKind : std::uint8_t {
    Straight = 0,
    Quadratic = 1,
    ReversedQuadratic = 2,
    Cubic = 3
};

struct PreviewCurveResult {
    PreviewCurveKind kind = PreviewCurveKind::Straight;
    // Includes both endpoints.
    std::vector<math::Vec2> controlPoints;
    // The curve runs from the end joint (t = 0) to the start joint (t = 1).
    bool startAndEndSwitched = false;
    bool shouldToggleStartTangentFlip = false;
    bool shouldToggleEndTangentFlip = false;
};

[[nodiscard]] math::Vec2 newJointPosition(const NewJointType& joint);
[[nodiscard]] Elevation newJointElevation(const NewJointType& joint);
[[nodiscard]] bool isBrandNewJoint(const NewJointType& joint);

// Misses become New, dead-end joints ExtendingTrack, other joints BranchJoint,
// curve hits BranchCurve (at the curve's level) and edge hits Constrained.
[[nodiscard]] NewJointType determineNewJointType(
    const math::Vec2& rawPosition,
    const ProjectionResult& projection,
    Elevation elevation = Elevation::Ground
);

[[nodiscard]] PreviewCurveKind determinePreviewCurveKind(
    const NewJointType& startJoint,
    const NewJointType& endJoint,
    bool extendAsStraightLine
);

class PreviewCurveCalculator {
public:
    void toggleStraightLine() { m_extendAsStraightLine = !m_extendAsStraightLine; }
    void toggleStartTangentFlip() { m_startTangentFlipped = !m_startTangentFlipped; }
    void toggleEndTangentFlip() { m_endTangentFlipped = !m_endTangentFlipped; }

    [[nodiscard]] bool extendAsStraightLine() const { return m_extendAsStraightLine; }
    [[nodiscard]] bool startTangentFlipped() const { return m_startTangentFlipped; }
    [[nodiscard]] bool endTangentFlipped() const { return m_endTangentFlipped; }

    // Clears a flip toggle when the tangent it applied to was already calibrated toward the chord.
    PreviewCurveResult getPreviewCurve(const NewJointType& startJoint, const NewJointType& endJoint);

private:
    bool m_extendAsStraightLine = false;
    bool m_startTangentFlipped = false;
    bool m_endTangentFlipped = false;
};

} // namespace railyard::track
