#include "track/preview_curve.h"

#include <algorithm>
#include <cmath>
#include <optional>

#include "track/elevation.h"

namespace railyard::track {
namespace {

constexpr double kCurvatureThreshold = 0.001;
constexpr double kQuadraticTightCurvature = 0.01;
constexpr double kCubicTightCurvature = 0.02;

struct TangentConstraint {
    math::Vec2 tangent{};
    double curvature = 0.0;
};

struct CalibratedTangent {
    math::Vec2 tangent{};
    bool flipped = false;
};

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::optional<TangentConstraint> constraintOf(const NewJointType& joint) {
    return std::visit(
        Overloaded{
            [](const NewJoint&) -> std::optional<TangentConstraint> { return std::nullopt; },
            [](const ConstrainedJoint& j) -> std::optional<TangentConstraint> {
                return TangentConstraint{j.constraint.tangent, j.constraint.curvature};
            },
            [](const BranchJoint& j) -> std::optional<TangentConstraint> {
                return TangentConstraint{j.constraint.tangent, j.constraint.curvature};
            },
            [](const ExtendingTrackJoint& j) -> std::optional<TangentConstraint> {
                return TangentConstraint{j.constraint.tangent, j.constraint.curvature};
            },
            [](const BranchCurveJoint& j) -> std::optional<TangentConstraint> {
                return TangentConstraint{j.constraint.tangent, j.constraint.curvature};
            },
        },
        joint);
}

// Flips the tangent when it points away from the chord.
CalibratedTangent calibrateTangent(const math::Vec2& rawTangent, const math::Vec2& curveStart, const math::Vec2& curveEnd) {
    const math::Vec2 chordDirection = math::normalize(curveEnd - curveStart);
    const double angle = math::normalizeAngleZeroToTwoPi(math::angleFromA2B(rawTangent, chordDirection));
    if (angle >= math::kPi * 0.5 && angle <= math::kPi * 1.5) {
        return CalibratedTangent{-rawTangent, true};
    }
    return CalibratedTangent{rawTangent, false};
}

std::vector<math::Vec2> quadraticFromTangentCurvature(
    const math::Vec2& start,
    const math::Vec2& end,
    const math::Vec2& tangent,
    double curvature
) {
    const math::Vec2 unitTangent = math::normalize(tangent);
    const double chordLength = math::distance(start, end);
    double controlDistance = chordLength * 0.5;

    const double magnitude = std::abs(curvature);
    if (magnitude > kCurvatureThreshold) {
        controlDistance *= std::min(1.0, 1.0 / ((magnitude * chordLength) + 1.0));
        if (magnitude > kQuadraticTightCurvature) {
            controlDistance *= 0.8;
        }
    }

    math::Vec2 control = start + (unitTangent * controlDistance);
    if (magnitude > kCurvatureThreshold) {
        control += math::perpendicular(unitTangent) * (curvature * chordLength * 0.1);
    }
    return {start, control, end};
}

double cubicControlDistance(double chordLength, double curvature) {
    double controlDistance = chordLength / 3.0;
    const double magnitude = std::abs(curvature);
    if (magnitude > kCurvatureThreshold) {
        controlDistance *= std::clamp(1.0 / ((magnitude * chordLength) + 1.0), 0.3, 1.5);
        if (magnitude > kCubicTightCurvature) {
            controlDistance *= 0.7;
        }
    }
    return controlDistance;
}

std::vector<math::Vec2> cubicFromTangentsCurvatures(
    const math::Vec2& start,
    const math::Vec2& end,
    const math::Vec2& startTangent,
    const math::Vec2& endTangent,
    double startCurvature,
    double endCurvature
) {
    const math::Vec2 unitStart = math::normalize(startTangent);
    const math::Vec2 unitEnd = math::normalize(endTangent);
    const double chordLength = math::distance(start, end);

    const math::Vec2 p1 = start + (unitStart * cubicControlDistance(chordLength, startCurvature)) +
        (math::perpendicular(unitStart) * (startCurvature * chordLength * 0.05));
    const math::Vec2 p2 = end - (unitEnd * cubicControlDistance(chordLength, endCurvature)) +
        (math::perpendicular(unitEnd) * (endCurvature * chordLength * 0.05));
    return {start, p1, p2, end};
}

PreviewCurveResult straightPreview(const NewJointType& startJoint, const NewJointType& endJoint, bool startFlipped) {
    const math::Vec2 start = newJointPosition(startJoint);
    const math::Vec2 end = newJointPosition(endJoint);
    const std::optional<TangentConstraint> constraint = constraintOf(startJoint);
    const math::Vec2 rawTangent = constraint.has_value() ? constraint->tangent : math::normalize(end - start);

    const CalibratedTangent calibrated = calibrateTangent(rawTangent, start, end);
    const math::Vec2 tangent = math::normalize(startFlipped ? -calibrated.tangent : calibrated.tangent);
    const math::Vec2 adjustedEnd = start + (tangent * math::dot(tangent, end - start));

    PreviewCurveResult result{};
    result.kind = PreviewCurveKind::Straight;
    result.controlPoints = {start, math::lerp(start, adjustedEnd, 0.5), adjustedEnd};
    result.shouldToggleStartTangentFlip = calibrated.flipped && startFlipped;
    return result;
}

PreviewCurveResult quadraticPreview(const NewJointType& startJoint, const NewJointType& endJoint, bool startFlipped) {
    const math::Vec2 start = newJointPosition(startJoint);
    const math::Vec2 end = newJointPosition(endJoint);
    const TangentConstraint constraint = constraintOf(startJoint).value_or(TangentConstraint{});

    const CalibratedTangent calibrated = calibrateTangent(constraint.tangent, start, end);
    const math::Vec2 tangent = startFlipped ? -calibrated.tangent : calibrated.tangent;

    PreviewCurveResult result{};
    result.kind = PreviewCurveKind::Quadratic;
    result.controlPoints = quadraticFromTangentCurvature(start, end, tangent, constraint.curvature);
    result.shouldToggleStartTangentFlip = calibrated.flipped && startFlipped;
    return result;
}

PreviewCurveResult reversedQuadraticPreview(const NewJointType& startJoint, const NewJointType& endJoint, bool endFlipped) {
    const math::Vec2 start = newJointPosition(startJoint);
    const math::Vec2 end = newJointPosition(endJoint);
    const TangentConstraint constraint = constraintOf(endJoint).value_or(TangentConstraint{});

    const CalibratedTangent calibrated = calibrateTangent(constraint.tangent, end, start);
    const math::Vec2 tangent = endFlipped ? -calibrated.tangent : calibrated.tangent;

    PreviewCurveResult result{};
    result.kind = PreviewCurveKind::ReversedQuadratic;
    result.controlPoints = quadraticFromTangentCurvature(end, start, tangent, constraint.curvature);
    result.startAndEndSwitched = true;
    result.shouldToggleEndTangentFlip = calibrated.flipped && endFlipped;
    return result;
}

PreviewCurveResult cubicPreview(
    const NewJointType& startJoint,
    const NewJointType& endJoint,
    bool startFlipped,
    bool endFlipped
) {
    const math::Vec2 start = newJointPosition(startJoint);
    const math::Vec2 end = newJointPosition(endJoint);
    const TangentConstraint startConstraint = constraintOf(startJoint).value_or(TangentConstraint{});
    const TangentConstraint endConstraint = constraintOf(endJoint).value_or(TangentConstraint{});

    const CalibratedTangent calibrated = calibrateTangent(startConstraint.tangent, start, end);
    const math::Vec2 startTangent = startFlipped ? -calibrated.tangent : calibrated.tangent;

    math::Vec2 endTangent = endConstraint.tangent;
    bool endCalibrated = false;
    if (std::holds_alternative<ExtendingTrackJoint>(endJoint)) {
        const CalibratedTangent calibratedEnd = calibrateTangent(endConstraint.tangent, end, start);
        endTangent = calibratedEnd.tangent;
        endCalibrated = calibratedEnd.flipped;
    }
    if (endFlipped) {
        endTangent = -endTangent;
    }

    PreviewCurveResult result{};
    result.kind = PreviewCurveKind::Cubic;
    result.controlPoints = cubicFromTangentsCurvatures(
        start, end, startTangent, endTangent, startConstraint.curvature, endConstraint.curvature);
    result.shouldToggleStartTangentFlip = calibrated.flipped && startFlipped;
    result.shouldToggleEndTangentFlip = endCalibrated && endFlipped;
    return result;
}

Elevation levelAtHeight(double height) {
    const long level = std::lround(height / kLevelHeight);
    const long clamped = std::clamp(
        level,
        static_cast<long>(static_cast<std::int8_t>(kMinElevation)),
        static_cast<long>(static_cast<std::int8_t>(kMaxElevation)));
    return static_cast<Elevation>(clamped);
}

} // namespace

math::Vec2 newJointPosition(const NewJointType& joint) {
    return std::visit([](const auto& j) { return j.position; }, joint);
}

Elevation newJointElevation(const NewJointType& joint) {
    return std::visit([](const auto& j) { return j.elevation; }, joint);
}

bool isBrandNewJoint(const NewJointType& joint) {
    return std::holds_alternative<NewJoint>(joint);
}

NewJointType determineNewJointType(const math::Vec2& rawPosition, const ProjectionResult& projection, Elevation elevation) {
    return std::visit(
        Overloaded{
            [&](const ProjectionMiss&) -> NewJointType { return NewJoint{rawPosition, elevation}; },
            [&](const ProjectionJointResult& hit) -> NewJointType {
                if (hit.endingJoint) {
                    return ExtendingTrackJoint{hit.projectionPoint, elevation, hit};
                }
                return BranchJoint{hit.projectionPoint, elevation, hit};
            },
            [&](const ProjectionCurveResult& hit) -> NewJointType {
                const Elevation curveLevel = trackIsSloped(hit.elevation)
                    ? levelAtHeight(getElevationAtT(hit.atT, toHeightInterval(hit.elevation)))
                    : hit.elevation.from;
                return BranchCurveJoint{hit.projectionPoint, curveLevel, hit, hit.elevation};
            },
            [&](const ProjectionEdgeResult& hit) -> NewJointType {
                return ConstrainedJoint{hit.projectionPoint, elevation, hit};
            },
        },
        projection);
}

PreviewCurveKind determinePreviewCurveKind(const NewJointType& startJoint, const NewJointType& endJoint, bool extendAsStraightLine) {
    if (isBrandNewJoint(startJoint)) {
        if (extendAsStraightLine || isBrandNewJoint(endJoint)) {
            return PreviewCurveKind::Straight;
        }
        return PreviewCurveKind::ReversedQuadratic;
    }
    if (extendAsStraightLine) {
        return PreviewCurveKind::Straight;
    }
    if (isBrandNewJoint(endJoint)) {
        return PreviewCurveKind::Quadratic;
    }
    return PreviewCurveKind::Cubic;
}

PreviewCurveResult PreviewCurveCalculator::getPreviewCurve(const NewJointType& startJoint, const NewJointType& endJoint) {
    PreviewCurveResult result{};
    switch (determinePreviewCurveKind(startJoint, endJoint, m_extendAsStraightLine)) {
    case PreviewCurveKind::Straight:
        result = straightPreview(startJoint, endJoint, m_startTangentFlipped);
        break;
    case PreviewCurveKind::Quadratic:
        result = quadraticPreview(startJoint, endJoint, m_startTangentFlipped);
        break;
    case PreviewCurveKind::ReversedQuadratic:
        result = reversedQuadraticPreview(startJoint, endJoint, m_endTangentFlipped);
        break;
    case PreviewCurveKind::Cubic:
        result = cubicPreview(startJoint, endJoint, m_startTangentFlipped, m_endTangentFlipped);
        break;
    }

    if (result.shouldToggleStartTangentFlip) {
        m_startTangentFlipped = !m_startTangentFlipped;
    }
    if (result.shouldToggleEndTangentFlip) {
        m_endTangentFlipped = !m_endTangentFlipped;
    }
    return result;
}

} // namespace railyard::track
