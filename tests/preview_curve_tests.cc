#include <gtest/gtest.h>

#include <variant>
#include <vector>

#include "track/preview_curve.h"

namespace {

using railyard::math::Vec2;

void ExpectPoint(const Vec2& actual, const Vec2& expected, double epsilon = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, epsilon);
    EXPECT_NEAR(actual.y, expected.y, epsilon);
}

railyard::track::ProjectionJointResult jointHit(const Vec2& position, const Vec2& tangent, bool endingJoint) {
    railyard::track::ProjectionJointResult hit{};
    hit.joint = 0;
    hit.projectionPoint = position;
    hit.tangent = tangent;
    hit.endingJoint = endingJoint;
    return hit;
}

} // namespace

TEST(PreviewCurveTest, ClassifiesProjectionsIntoJointKinds) {
    using namespace railyard::track;

    const Vec2 raw{3.0, 4.0};
    EXPECT_TRUE(std::holds_alternative<NewJoint>(determineNewJointType(raw, ProjectionMiss{}, Elevation::Above1)));
    EXPECT_EQ(newJointElevation(determineNewJointType(raw, ProjectionMiss{}, Elevation::Above1)), Elevation::Above1);
    ExpectPoint(newJointPosition(determineNewJointType(raw, ProjectionMiss{})), raw);

    const NewJointType extending = determineNewJointType(raw, jointHit({2.0, 2.0}, {1.0, 0.0}, true));
    EXPECT_TRUE(std::holds_alternative<ExtendingTrackJoint>(extending));
    ExpectPoint(newJointPosition(extending), Vec2{2.0, 2.0});

    const NewJointType branch = determineNewJointType(raw, jointHit({2.0, 2.0}, {1.0, 0.0}, false));
    EXPECT_TRUE(std::holds_alternative<BranchJoint>(branch));
    EXPECT_FALSE(isBrandNewJoint(branch));

    ProjectionEdgeResult edge{};
    edge.projectionPoint = Vec2{3.0, 1.0};
    const NewJointType constrained = determineNewJointType(raw, edge, Elevation::Sub1);
    EXPECT_TRUE(std::holds_alternative<ConstrainedJoint>(constrained));
    EXPECT_EQ(newJointElevation(constrained), Elevation::Sub1);
    ExpectPoint(newJointPosition(constrained), Vec2{3.0, 1.0});
}

TEST(PreviewCurveTest, CurveHitTakesTheLevelOfTheTrackUnderIt) {
    using namespace railyard::track;

    ProjectionCurveResult flat{};
    flat.elevation = ElevationSpan{Elevation::Above2, Elevation::Above2};
    const NewJointType onFlat = determineNewJointType({0.0, 0.0}, flat, Elevation::Ground);
    ASSERT_TRUE(std::holds_alternative<BranchCurveJoint>(onFlat));
    EXPECT_EQ(newJointElevation(onFlat), Elevation::Above2);
    EXPECT_EQ(std::get<BranchCurveJoint>(onFlat).curveElevation, flat.elevation);

    ProjectionCurveResult ramp{};
    ramp.elevation = ElevationSpan{Elevation::Ground, Elevation::Above2};
    ramp.atT = 0.5;
    EXPECT_EQ(newJointElevation(determineNewJointType({0.0, 0.0}, ramp)), Elevation::Above1);
    ramp.atT = 0.2;
    EXPECT_EQ(newJointElevation(determineNewJointType({0.0, 0.0}, ramp)), Elevation::Ground);
    ramp.atT = 0.9;
    EXPECT_EQ(newJointElevation(determineNewJointType({0.0, 0.0}, ramp)), Elevation::Above2);
}

TEST(PreviewCurveTest, CurveKindTable) {
    using namespace railyard::track;

    const NewJointType fresh = NewJoint{{0.0, 0.0}, Elevation::Ground};
    const NewJointType constrained = BranchJoint{{0.0, 0.0}, Elevation::Ground, {}};

    EXPECT_EQ(determinePreviewCurveKind(fresh, fresh, false), PreviewCurveKind::Straight);
    EXPECT_EQ(determinePreviewCurveKind(fresh, fresh, true), PreviewCurveKind::Straight);
    EXPECT_EQ(determinePreviewCurveKind(fresh, constrained, false), PreviewCurveKind::ReversedQuadratic);
    EXPECT_EQ(determinePreviewCurveKind(fresh, constrained, true), PreviewCurveKind::Straight);
    EXPECT_EQ(determinePreviewCurveKind(constrained, fresh, false), PreviewCurveKind::Quadratic);
    EXPECT_EQ(determinePreviewCurveKind(constrained, fresh, true), PreviewCurveKind::Straight);
    EXPECT_EQ(determinePreviewCurveKind(constrained, constrained, false), PreviewCurveKind::Cubic);
    EXPECT_EQ(determinePreviewCurveKind(constrained, constrained, true), PreviewCurveKind::Straight);
}

TEST(PreviewCurveTest, StraightBetweenFreshJointsRunsAlongTheChord) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    const PreviewCurveResult result = calculator.getPreviewCurve(
        NewJoint{{0.0, 0.0}, Elevation::Ground}, NewJoint{{40.0, 30.0}, Elevation::Ground});

    EXPECT_EQ(result.kind, PreviewCurveKind::Straight);
    ASSERT_EQ(result.controlPoints.size(), 3u);
    ExpectPoint(result.controlPoints[1], Vec2{20.0, 15.0});
    ExpectPoint(result.controlPoints[2], Vec2{40.0, 30.0});
    EXPECT_FALSE(result.startAndEndSwitched);
}

TEST(PreviewCurveTest, StraightFromConstrainedJointProjectsEndOntoTangent) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    calculator.toggleStraightLine();
    ASSERT_TRUE(calculator.extendAsStraightLine());

    const PreviewCurveResult result = calculator.getPreviewCurve(
        ExtendingTrackJoint{{0.0, 0.0}, Elevation::Ground, jointHit({0.0, 0.0}, {1.0, 0.0}, true)},
        NewJoint{{100.0, 30.0}, Elevation::Ground});

    EXPECT_EQ(result.kind, PreviewCurveKind::Straight);
    ASSERT_EQ(result.controlPoints.size(), 3u);
    ExpectPoint(result.controlPoints[2], Vec2{100.0, 0.0});
}

TEST(PreviewCurveTest, QuadraticLeavesAlongCalibratedTangent) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    // The stored tangent points away from the new joint and gets turned around.
    const PreviewCurveResult result = calculator.getPreviewCurve(
        ExtendingTrackJoint{{0.0, 0.0}, Elevation::Ground, jointHit({0.0, 0.0}, {-1.0, 0.0}, true)},
        NewJoint{{100.0, 0.0}, Elevation::Ground});

    EXPECT_EQ(result.kind, PreviewCurveKind::Quadratic);
    ASSERT_EQ(result.controlPoints.size(), 3u);
    ExpectPoint(result.controlPoints[0], Vec2{0.0, 0.0});
    ExpectPoint(result.controlPoints[1], Vec2{50.0, 0.0});
    ExpectPoint(result.controlPoints[2], Vec2{100.0, 0.0});
    EXPECT_FALSE(result.shouldToggleStartTangentFlip);
    EXPECT_FALSE(calculator.startTangentFlipped());
}

TEST(PreviewCurveTest, QuadraticCurvatureShortensAndOffsetsControl) {
    using namespace railyard::track;

    ProjectionJointResult hit = jointHit({0.0, 0.0}, {1.0, 0.0}, true);
    hit.curvature = 0.005;

    PreviewCurveCalculator calculator;
    const PreviewCurveResult result = calculator.getPreviewCurve(
        ExtendingTrackJoint{{0.0, 0.0}, Elevation::Ground, hit}, NewJoint{{100.0, 0.0}, Elevation::Ground});

    ASSERT_EQ(result.controlPoints.size(), 3u);
    ExpectPoint(result.controlPoints[1], Vec2{50.0 / 1.5, 0.05}, 1e-9);
}

TEST(PreviewCurveTest, FlipToggleResetsWhenCalibrationAlreadyFlipped) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    calculator.toggleStartTangentFlip();
    ASSERT_TRUE(calculator.startTangentFlipped());

    const PreviewCurveResult result = calculator.getPreviewCurve(
        ExtendingTrackJoint{{0.0, 0.0}, Elevation::Ground, jointHit({0.0, 0.0}, {-1.0, 0.0}, true)},
        NewJoint{{100.0, 0.0}, Elevation::Ground});

    // The user's flip cancels the calibration, so the curve heads backwards once.
    ExpectPoint(result.controlPoints[1], Vec2{-50.0, 0.0});
    EXPECT_TRUE(result.shouldToggleStartTangentFlip);
    EXPECT_FALSE(calculator.startTangentFlipped());
}

TEST(PreviewCurveTest, ReversedQuadraticRunsFromEndJoint) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    const PreviewCurveResult result = calculator.getPreviewCurve(
        NewJoint{{0.0, 0.0}, Elevation::Ground},
        BranchJoint{{100.0, 0.0}, Elevation::Ground, jointHit({100.0, 0.0}, {1.0, 0.0}, false)});

    EXPECT_EQ(result.kind, PreviewCurveKind::ReversedQuadratic);
    EXPECT_TRUE(result.startAndEndSwitched);
    ASSERT_EQ(result.controlPoints.size(), 3u);
    ExpectPoint(result.controlPoints[0], Vec2{100.0, 0.0});
    ExpectPoint(result.controlPoints[1], Vec2{50.0, 0.0});
    ExpectPoint(result.controlPoints[2], Vec2{0.0, 0.0});
}

TEST(PreviewCurveTest, CubicPlacesControlsAThirdOfTheChordOut) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    const PreviewCurveResult result = calculator.getPreviewCurve(
        BranchJoint{{0.0, 0.0}, Elevation::Ground, jointHit({0.0, 0.0}, {1.0, 0.0}, false)},
        BranchJoint{{90.0, 0.0}, Elevation::Ground, jointHit({90.0, 0.0}, {1.0, 0.0}, false)});

    EXPECT_EQ(result.kind, PreviewCurveKind::Cubic);
    ASSERT_EQ(result.controlPoints.size(), 4u);
    ExpectPoint(result.controlPoints[1], Vec2{30.0, 0.0});
    ExpectPoint(result.controlPoints[2], Vec2{60.0, 0.0});
    ExpectPoint(result.controlPoints[3], Vec2{90.0, 0.0});
}

TEST(PreviewCurveTest, CubicCalibratesExtendingEndJoint) {
    using namespace railyard::track;

    PreviewCurveCalculator calculator;
    // A dead end facing the start joint: its tangent is turned to point back along the chord.
    const PreviewCurveResult result = calculator.getPreviewCurve(
        BranchJoint{{0.0, 0.0}, Elevation::Ground, jointHit({0.0, 0.0}, {1.0, 0.0}, false)},
        ExtendingTrackJoint{{90.0, 0.0}, Elevation::Ground, jointHit({90.0, 0.0}, {1.0, 0.0}, true)});

    ASSERT_EQ(result.controlPoints.size(), 4u);
    ExpectPoint(result.controlPoints[2], Vec2{120.0, 0.0});
}
