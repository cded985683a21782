#include "geometry/bezier_curve.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>

#include "core/log.h"

namespace railyard::geometry {
namespace {

// 24-point Gauss-Legendre abscissae and weights on [-1, 1].
constexpr std::array<double, 24> kLegendreAbscissae = {
    -0.0640568928626056260850430826247450385909, 0.0640568928626056260850430826247450385909,
    -0.1911188674736163091586398207570696318404, 0.1911188674736163091586398207570696318404,
    -0.3150426796961633743867932913198102407864, 0.3150426796961633743867932913198102407864,
    -0.4337935076260451384870842319133497124524, 0.4337935076260451384870842319133497124524,
    -0.5454214713888395356583756172183723700107, 0.5454214713888395356583756172183723700107,
    -0.6480936519369755692524957869107476266696, 0.6480936519369755692524957869107476266696,
    -0.7401241915785543642438281030999784255232, 0.7401241915785543642438281030999784255232,
    -0.8200019859739029219539498726697452080761, 0.8200019859739029219539498726697452080761,
    -0.8864155270044010342131543419821967550873, 0.8864155270044010342131543419821967550873,
    -0.9382745520027327585236490017087214496548, 0.9382745520027327585236490017087214496548,
    -0.9747285559713094981983919930081690617411, 0.9747285559713094981983919930081690617411,
    -0.9951872199970213601799974097007368118745, 0.9951872199970213601799974097007368118745,
};

constexpr std::array<double, 24> kLegendreWeights = {
    0.1279381953467521569740561652246953718517, 0.1279381953467521569740561652246953718517,
    0.1258374563468282961213753825111836887264, 0.1258374563468282961213753825111836887264,
    0.1216704729278033912044631534762624256070, 0.1216704729278033912044631534762624256070,
    0.1155056680537256013533444839067835598622, 0.1155056680537256013533444839067835598622,
    0.1074442701159656347825773424466062227946, 0.1074442701159656347825773424466062227946,
    0.0976186521041138882698806644642471544279, 0.0976186521041138882698806644642471544279,
    0.0861901615319532759171852029837426671850, 0.0861901615319532759171852029837426671850,
    0.0733464814110803057340336152531165181193, 0.0733464814110803057340336152531165181193,
    0.0592985849154367807463677585001085845412, 0.0592985849154367807463677585001085845412,
    0.0442774388174198061686027482113382288593, 0.0442774388174198061686027482113382288593,
    0.0285313886289336631813078159518782864491, 0.0285313886289336631813078159518782864491,
    0.0123412297999871995468056670700372915759, 0.0123412297999871995468056670700372915759,
};

constexpr std::size_t kProjectionLutSteps = 500;
constexpr double kProjectionTolerance = 1e-5;
constexpr double kIntersectionLeafLength = 0.5;
constexpr std::size_t kMaxIntersectionPairs = 1u << 16;

math::Vec2 evaluate(const std::vector<math::Vec2>& points, double t) {
    if (points.empty()) {
        return math::Vec2{};
    }
    if (points.size() == 3) {
        const double mt = 1.0 - t;
        return points[0] * (mt * mt) + points[1] * (2.0 * mt * t) + points[2] * (t * t);
    }
    if (points.size() == 4) {
        const double mt = 1.0 - t;
        return points[0] * (mt * mt * mt) + points[1] * (3.0 * mt * mt * t) +
               points[2] * (3.0 * mt * t * t) + points[3] * (t * t * t);
    }
    std::vector<math::Vec2> level = points;
    while (level.size() > 1) {
        for (std::size_t i = 0; i + 1 < level.size(); ++i) {
            level[i] = math::lerp(level[i], level[i + 1], t);
        }
        level.pop_back();
    }
    return level.front();
}

std::vector<math::Vec2> hodograph(const std::vector<math::Vec2>& points) {
    std::vector<math::Vec2> result;
    if (points.size() < 2) {
        return result;
    }
    const double order = static_cast<double>(points.size() - 1);
    result.reserve(points.size() - 1);
    for (std::size_t i = 1; i < points.size(); ++i) {
        result.push_back((points[i] - points[i - 1]) * order);
    }
    return result;
}

void appendUnitRoot(double root, std::vector<double>* outRoots) {
    if (std::isfinite(root) && root >= 0.0 && root <= 1.0) {
        outRoots->push_back(root);
    }
}

// Roots in [0, 1] of a derivative given in Bernstein form (at most quadratic).
void derivativeRoots(double d0, double d1, double d2, std::size_t count, std::vector<double>* outRoots) {
    if (count == 2) {
        if (!math::approximately(d0, d1, 1e-12)) {
            appendUnitRoot(d0 / (d0 - d1), outRoots);
        }
        return;
    }
    if (count != 3) {
        return;
    }
    const double a = d0 - (2.0 * d1) + d2;
    const double b = 2.0 * (d1 - d0);
    const double c = d0;
    if (math::approximately(a, 0.0, 1e-12)) {
        if (!math::approximately(b, 0.0, 1e-12)) {
            appendUnitRoot(-c / b, outRoots);
        }
        return;
    }
    const double discriminant = (b * b) - (4.0 * a * c);
    if (discriminant < 0.0) {
        return;
    }
    const double root = std::sqrt(discriminant);
    appendUnitRoot((-b + root) / (2.0 * a), outRoots);
    appendUnitRoot((-b - root) / (2.0 * a), outRoots);
}

Aabb computeAabb(const std::vector<math::Vec2>& points, const std::vector<math::Vec2>& derivativePoints) {
    std::vector<double> tValues{0.0, 1.0};
    if (derivativePoints.size() <= 3) {
        const auto component = [&](auto accessor) {
            const double d0 = derivativePoints.size() > 0 ? accessor(derivativePoints[0]) : 0.0;
            const double d1 = derivativePoints.size() > 1 ? accessor(derivativePoints[1]) : 0.0;
            const double d2 = derivativePoints.size() > 2 ? accessor(derivativePoints[2]) : 0.0;
            derivativeRoots(d0, d1, d2, derivativePoints.size(), &tValues);
        };
        component([](const math::Vec2& v) { return v.x; });
        component([](const math::Vec2& v) { return v.y; });
    } else {
        constexpr int kSamples = 64;
        for (int i = 1; i < kSamples; ++i) {
            tValues.push_back(static_cast<double>(i) / kSamples);
        }
    }

    const math::Vec2 first = evaluate(points, 0.0);
    Aabb bounds{first, first};
    for (const double t : tValues) {
        const math::Vec2 p = evaluate(points, t);
        bounds.min.x = std::min(bounds.min.x, p.x);
        bounds.min.y = std::min(bounds.min.y, p.y);
        bounds.max.x = std::max(bounds.max.x, p.x);
        bounds.max.y = std::max(bounds.max.y, p.y);
    }
    return bounds;
}

} // namespace

BezierCurve::BezierCurve(std::vector<math::Vec2> controlPoints)
    : m_controlPoints(std::move(controlPoints)) {
    rebuildCaches();
}

void BezierCurve::setControlPoints(std::vector<math::Vec2> controlPoints) {
    m_controlPoints = std::move(controlPoints);
    rebuildCaches();
}

void BezierCurve::rebuildCaches() {
    m_derivativePoints = hodograph(m_controlPoints);
    m_secondDerivativePoints = hodograph(m_derivativePoints);
    m_arcLengthLut.clear();
    if (m_controlPoints.empty()) {
        m_aabb = Aabb{};
        m_fullLength = 0.0;
        return;
    }
    m_aabb = computeAabb(m_controlPoints, m_derivativePoints);
    m_fullLength = lengthAtT(1.0);
}

math::Vec2 BezierCurve::get(double t) const {
    return evaluate(m_controlPoints, t);
}

math::Vec2 BezierCurve::derivative(double t) const {
    return evaluate(m_derivativePoints, t);
}

math::Vec2 BezierCurve::unitDerivative(double t) const {
    return math::normalize(derivative(t));
}

math::Vec2 BezierCurve::secondDerivative(double t) const {
    return evaluate(m_secondDerivativePoints, t);
}

double BezierCurve::curvature(double t) const {
    const math::Vec2 d = derivative(t);
    const math::Vec2 dd = secondDerivative(t);
    const double denominator = std::pow(math::lengthSquared(d), 1.5);
    if (denominator == 0.0) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return math::cross(d, dd) / denominator;
}

math::Vec2 BezierCurve::normal(double t) const {
    return math::perpendicular(unitDerivative(t));
}

double BezierCurve::lengthAtT(double t) const {
    const double clamped = std::clamp(t, 0.0, 1.0);
    const double z = clamped * 0.5;
    double sum = 0.0;
    for (std::size_t i = 0; i < kLegendreAbscissae.size(); ++i) {
        const double sampleT = (z * kLegendreAbscissae[i]) + z;
        sum += kLegendreWeights[i] * math::length(derivative(sampleT));
    }
    return z * sum;
}

std::pair<BezierCurve, BezierCurve> BezierCurve::split(double t) const {
    const double clamped = std::clamp(t, 0.0, 1.0);
    std::vector<math::Vec2> left;
    std::vector<math::Vec2> right;
    left.reserve(m_controlPoints.size());
    right.reserve(m_controlPoints.size());

    std::vector<math::Vec2> level = m_controlPoints;
    while (!level.empty()) {
        left.push_back(level.front());
        right.push_back(level.back());
        for (std::size_t i = 0; i + 1 < level.size(); ++i) {
            level[i] = math::lerp(level[i], level[i + 1], clamped);
        }
        level.pop_back();
    }
    std::reverse(right.begin(), right.end());
    return {BezierCurve(std::move(left)), BezierCurve(std::move(right))};
}

std::array<BezierCurve, 3> BezierCurve::splitIn3Curves(double t1, double t2) const {
    if (t2 < t1) {
        std::swap(t1, t2);
    }
    auto [first, rest] = split(t1);
    const double remapped = t1 >= 1.0 ? 0.0 : (t2 - t1) / (1.0 - t1);
    auto [second, third] = rest.split(remapped);
    return {std::move(first), std::move(second), std::move(third)};
}

std::vector<CurveIntersection> BezierCurve::getCurveIntersections(
    const BezierCurve& other,
    double dedupTolerance
) const {
    struct Piece {
        BezierCurve curve;
        double startT = 0.0;
        double endT = 1.0;
    };
    struct PiecePair {
        Piece self;
        Piece other;
    };

    std::vector<CurveIntersection> raw;
    if (!valid() || !other.valid()) {
        return raw;
    }

    std::deque<PiecePair> pending;
    pending.push_back(PiecePair{Piece{*this, 0.0, 1.0}, Piece{other, 0.0, 1.0}});
    std::size_t processed = 0;
    while (!pending.empty()) {
        if (++processed > kMaxIntersectionPairs) {
            RY_LOGW("geometry") << "curve intersection search exceeded " << kMaxIntersectionPairs
                                << " candidate pairs; curves likely overlap";
            break;
        }
        PiecePair pair = std::move(pending.front());
        pending.pop_front();
        if (!pair.self.curve.aabb().intersects(pair.other.curve.aabb())) {
            continue;
        }
        if (pair.self.curve.fullLength() < kIntersectionLeafLength &&
            pair.other.curve.fullLength() < kIntersectionLeafLength) {
            raw.push_back(CurveIntersection{
                (pair.self.startT + pair.self.endT) * 0.5,
                (pair.other.startT + pair.other.endT) * 0.5});
            continue;
        }

        const double selfMid = (pair.self.startT + pair.self.endT) * 0.5;
        const double otherMid = (pair.other.startT + pair.other.endT) * 0.5;
        auto [selfA, selfB] = pair.self.curve.split(0.5);
        auto [otherA, otherB] = pair.other.curve.split(0.5);
        const Piece selfPieces[2] = {
            Piece{std::move(selfA), pair.self.startT, selfMid},
            Piece{std::move(selfB), selfMid, pair.self.endT}};
        const Piece otherPieces[2] = {
            Piece{std::move(otherA), pair.other.startT, otherMid},
            Piece{std::move(otherB), otherMid, pair.other.endT}};
        for (const Piece& selfPiece : selfPieces) {
            for (const Piece& otherPiece : otherPieces) {
                if (selfPiece.curve.aabb().intersects(otherPiece.curve.aabb())) {
                    pending.push_back(PiecePair{selfPiece, otherPiece});
                }
            }
        }
    }

    std::sort(raw.begin(), raw.end(), [](const CurveIntersection& lhs, const CurveIntersection& rhs) {
        return lhs.selfT < rhs.selfT;
    });

    std::vector<CurveIntersection> result;
    for (const CurveIntersection& candidate : raw) {
        bool duplicate = false;
        for (const CurveIntersection& existing : result) {
            const bool selfClose = math::approximately(candidate.selfT, existing.selfT, dedupTolerance);
            const bool otherClose = math::approximately(candidate.otherT, existing.otherT, dedupTolerance);
            if (selfClose && otherClose) {
                duplicate = true;
                break;
            }
            const bool selfNear = math::approximately(candidate.selfT, existing.selfT, dedupTolerance * 10.0);
            const bool otherNear = math::approximately(candidate.otherT, existing.otherT, dedupTolerance * 10.0);
            if (selfNear || otherNear) {
                const double selfGap = math::distance(get(candidate.selfT), get(existing.selfT));
                const double otherGap = math::distance(other.get(candidate.otherT), other.get(existing.otherT));
                if (selfGap < dedupTolerance * 100.0 && otherGap < dedupTolerance * 100.0) {
                    duplicate = true;
                    break;
                }
            }
        }
        if (!duplicate) {
            result.push_back(candidate);
        }
    }
    return result;
}

std::optional<CurveProjection> BezierCurve::getProjection(const math::Vec2& point) const {
    if (!valid()) {
        return std::nullopt;
    }

    std::size_t bestIndex = 0;
    double bestDistance = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i <= kProjectionLutSteps; ++i) {
        const double t = static_cast<double>(i) / kProjectionLutSteps;
        const double d = math::distance(get(t), point);
        if (d < bestDistance) {
            bestDistance = d;
            bestIndex = i;
        }
    }

    // Golden-section refinement inside the neighbouring LUT interval.
    double low = static_cast<double>(bestIndex == 0 ? 0 : bestIndex - 1) / kProjectionLutSteps;
    double high = static_cast<double>(std::min(bestIndex + 1, kProjectionLutSteps)) / kProjectionLutSteps;
    constexpr double kInvPhi = 0.6180339887498949;
    double a = high - ((high - low) * kInvPhi);
    double b = low + ((high - low) * kInvPhi);
    double distanceA = math::distance(get(a), point);
    double distanceB = math::distance(get(b), point);
    while (high - low > kProjectionTolerance) {
        if (distanceA < distanceB) {
            high = b;
            b = a;
            distanceB = distanceA;
            a = high - ((high - low) * kInvPhi);
            distanceA = math::distance(get(a), point);
        } else {
            low = a;
            a = b;
            distanceA = distanceB;
            b = low + ((high - low) * kInvPhi);
            distanceB = math::distance(get(b), point);
        }
    }

    double bestT = static_cast<double>(bestIndex) / kProjectionLutSteps;
    const double refinedT = (low + high) * 0.5;
    const double refinedDistance = math::distance(get(refinedT), point);
    if (refinedDistance < bestDistance) {
        bestT = refinedT;
        bestDistance = refinedDistance;
    }
    return CurveProjection{get(bestT), bestT, bestDistance};
}

const std::vector<BezierCurve::ArcLengthSample>& BezierCurve::arcLengthLut() const {
    if (m_arcLengthLut.empty()) {
        m_arcLengthLut.reserve(kArcLengthSteps + 1);
        for (std::size_t i = 0; i <= kArcLengthSteps; ++i) {
            const double t = static_cast<double>(i) / kArcLengthSteps;
            m_arcLengthLut.push_back(ArcLengthSample{t, lengthAtT(t)});
        }
    }
    return m_arcLengthLut;
}

AdvanceResult BezierCurve::advanceAtTWithLength(double t, double length) const {
    AdvanceResult result{};
    if (t <= 0.0 && length < 0.0) {
        result.kind = AdvanceKind::BeforeCurve;
        result.remainingLength = -length;
        return result;
    }
    if (t >= 1.0 && length > 0.0) {
        result.kind = AdvanceKind::AfterCurve;
        result.remainingLength = length;
        return result;
    }

    const double targetLength = lengthAtT(t) + length;
    if (targetLength > m_fullLength) {
        result.kind = AdvanceKind::AfterCurve;
        result.remainingLength = targetLength - m_fullLength;
        return result;
    }
    if (targetLength < 0.0) {
        result.kind = AdvanceKind::BeforeCurve;
        result.remainingLength = -targetLength;
        return result;
    }

    const std::vector<ArcLengthSample>& samples = arcLengthLut();
    const auto upper = std::lower_bound(
        samples.begin(),
        samples.end(),
        targetLength,
        [](const ArcLengthSample& sample, double value) { return sample.length < value; });

    double resultT = 1.0;
    if (upper == samples.begin()) {
        resultT = 0.0;
    } else if (upper != samples.end()) {
        const ArcLengthSample& high = *upper;
        const ArcLengthSample& low = *(upper - 1);
        const double span = high.length - low.length;
        resultT = span <= 0.0 ? low.t : low.t + (((targetLength - low.length) / span) * (high.t - low.t));
    }
    result.kind = AdvanceKind::WithinCurve;
    result.t = std::clamp(resultT, 0.0, 1.0);
    result.point = get(result.t);
    return result;
}

std::vector<math::Vec2> BezierCurve::lut(std::size_t steps) const {
    std::vector<math::Vec2> points;
    const std::size_t count = std::max<std::size_t>(steps, 1);
    points.reserve(count + 1);
    for (std::size_t i = 0; i <= count; ++i) {
        points.push_back(get(static_cast<double>(i) / count));
    }
    return points;
}

std::vector<math::Vec2> BezierCurve::offsetPoints(double distance, std::size_t steps) const {
    std::vector<math::Vec2> points;
    const std::size_t count = std::max<std::size_t>(steps, 1);
    points.reserve(count + 1);
    for (std::size_t i = 0; i <= count; ++i) {
        const double t = static_cast<double>(i) / count;
        points.push_back(get(t) + (normal(t) * distance));
    }
    return points;
}

} // namespace railyard::geometry
