#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "geometry/aabb.h"
#include "math/math.h"

// Geometry BezierCurve subsystem
// Responsible for: evaluation, arc length, splitting, projection, and intersection of planar Bezier curves.
// Should NOT do: joint/segment bookkeeping, elevation, or rendering.
namespace railyard::geometry {

struct CurveIntersection {
    double selfT = 0.0;
    double otherT = 0.0;
};

struct CurveProjection {
    math::Vec2 point{};
    double t = 0.0;
    double distance = 0.0;
};

enum class AdvanceKind : std::uint8_t {
    WithinCurve = 0,
    BeforeCurve = 1,
    AfterCurve = 2
};

struct AdvanceResult {
    AdvanceKind kind = AdvanceKind::WithinCurve;
    // Valid for WithinCurve.
    double t = 0.0;
    math::Vec2 point{};
    // Valid for BeforeCurve / AfterCurve: distance left over past the end that was crossed.
    double remainingLength = 0.0;
};

class BezierCurve {
public:
    BezierCurve() = default;
    explicit BezierCurve(std::vector<math::Vec2> controlPoints);

    void setControlPoints(std::vector<math::Vec2> controlPoints);
    [[nodiscard]] const std::vector<math::Vec2>& controlPoints() const { return m_controlPoints; }
    [[nodiscard]] bool valid() const { return m_controlPoints.size() >= 2; }

    [[nodiscard]] math::Vec2 get(double t) const;
    [[nodiscard]] math::Vec2 derivative(double t) const;
    [[nodiscard]] math::Vec2 unitDerivative(double t) const;
    [[nodiscard]] math::Vec2 secondDerivative(double t) const;
    // Signed curvature; NaN where the derivative vanishes.
    [[nodiscard]] double curvature(double t) const;
    // Unit left-hand normal of the derivative.
    [[nodiscard]] math::Vec2 normal(double t) const;

    [[nodiscard]] double lengthAtT(double t) const;
    [[nodiscard]] double fullLength() const { return m_fullLength; }
    [[nodiscard]] const Aabb& aabb() const { return m_aabb; }

    [[nodiscard]] std::pair<BezierCurve, BezierCurve> split(double t) const;
    // Pieces [0, t1], [t1, t2], [t2, 1]; arguments are swapped if given out of order.
    [[nodiscard]] std::array<BezierCurve, 3> splitIn3Curves(double t1, double t2) const;

    // Sorted by selfT, near-duplicates merged within dedupTolerance in parameter space.
    [[nodiscard]] std::vector<CurveIntersection> getCurveIntersections(
        const BezierCurve& other,
        double dedupTolerance = 0.01
    ) const;

    [[nodiscard]] std::optional<CurveProjection> getProjection(const math::Vec2& point) const;

    // Walks an arc length (negative runs toward t = 0) starting from t.
    [[nodiscard]] AdvanceResult advanceAtTWithLength(double t, double length) const;

    // steps + 1 evenly spaced parameter samples including both ends.
    [[nodiscard]] std::vector<math::Vec2> lut(std::size_t steps) const;
    // Samples of the curve shifted along its unit normal by a signed distance.
    [[nodiscard]] std::vector<math::Vec2> offsetPoints(double distance, std::size_t steps = 100) const;

private:
    struct ArcLengthSample {
        double t = 0.0;
        double length = 0.0;
    };

    static constexpr std::size_t kArcLengthSteps = 1000;

    void rebuildCaches();
    const std::vector<ArcLengthSample>& arcLengthLut() const;

    std::vector<math::Vec2> m_controlPoints;
    std::vector<math::Vec2> m_derivativePoints;
    std::vector<math::Vec2> m_secondDerivativePoints;
    Aabb m_aabb{};
    double m_fullLength = 0.0;
    mutable std::vector<ArcLengthSample> m_arcLengthLut;
};

} // namespace railyard::geometry
