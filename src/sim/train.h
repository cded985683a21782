#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "math/math.h"
#include "sim/joint_direction.h"
#include "track/track_graph.h"
#include "track/track_types.h"

// Simulation Train subsystem
// Responsible for: throttle-driven kinematics, graph walks, bogie placement, and occupancy bookkeeping for one train.
// Should NOT do: mutate the track graph, pick routes beyond the direction resolver, or render.
namespace railyard::sim {

enum class ThrottleStep : std::uint8_t {
    Emergency = 0,
    B7,
    B6,
    B5,
    B4,
    B3,
    B2,
    B1,
    Neutral,
    P1,
    P2,
    P3,
    P4,
    P5
};

inline constexpr std::size_t kThrottleStepCount = 14;

// Ordered from full emergency braking to full power.
inline constexpr std::array<double, kThrottleStepCount> kThrottleAcceleration = {
    -1.3, -1.2, -1.0, -0.7, -0.5, -0.3, -0.2, -0.1, 0.0, 0.1, 0.2, 0.3, 0.5, 0.7
};

[[nodiscard]] inline constexpr double throttleAcceleration(ThrottleStep step) {
    return kThrottleAcceleration[static_cast<std::size_t>(step)];
}

[[nodiscard]] std::string_view throttleName(ThrottleStep step);
// Accepts "er", "b7".."b1", "N", "p1".."p5".
[[nodiscard]] std::optional<ThrottleStep> parseThrottleStep(std::string_view text);

struct TrainPosition {
    track::SegmentId segment = track::kInvalidSegmentId;
    double t = 0.0;
    // Tangent runs t = 0 -> 1.
    track::TravelDirection direction = track::TravelDirection::Tangent;
    math::Vec2 point{};
};

struct EnteredSegment {
    track::SegmentId segment = track::kInvalidSegmentId;
    track::JointId fromJoint = track::kInvalidJointId;
    track::JointId toJoint = track::kInvalidJointId;
    track::TravelDirection direction = track::TravelDirection::Tangent;
};

struct WalkResult {
    TrainPosition position{};
    // Set when the walk ran into a dead end; position is pinned to the segment end.
    bool stop = false;
    // Newest first.
    std::vector<OccupiedJoint> passedJoints;
    std::vector<EnteredSegment> enteringSegments;
};

// Walks distance along the graph from position. nullopt means a referenced joint or segment is missing.
[[nodiscard]] std::optional<WalkResult> advancePosition(
    double distance,
    const TrainPosition& position,
    const track::TrackGraph& graph,
    const JointDirectionResolver& resolver,
    std::span<const OccupiedJoint> occupiedJoints = {},
    std::span<const OccupiedSegment> occupiedSegments = {}
);

struct TrainConfig {
    // Gap from each bogie to the previous one, starting at the lead position.
    std::vector<double> bogieOffsets{40.0, 10.0, 40.0, 10.0, 40.0};
    double rollingResistance = 0.1;
    // Rolling resistance is skipped at or below this acceleration.
    double hardBrakeThreshold = -0.5;
    double idleDistanceEpsilon = 0.01;
};

[[nodiscard]] TrainConfig clampTrainConfig(const TrainConfig& config);

class Train {
public:
    Train(const track::TrackGraph& graph, const JointDirectionResolver& resolver, const TrainConfig& config = TrainConfig{});

    [[nodiscard]] const TrainConfig& config() const { return m_config; }

    // Rejects positions where the whole train does not fit; resets occupancy otherwise.
    bool setPosition(const TrainPosition& position);
    void clearPosition();
    [[nodiscard]] const std::optional<TrainPosition>& position() const { return m_position; }

    // deltaTimeMs in milliseconds.
    void update(double deltaTimeMs);

    void setThrottle(ThrottleStep step) { m_throttle = step; }
    void throttleUp();
    void throttleDown();
    [[nodiscard]] ThrottleStep throttle() const { return m_throttle; }
    [[nodiscard]] double speed() const { return m_speed; }
    [[nodiscard]] double acceleration() const { return m_acceleration; }

    // Lead position followed by one entry per bogie offset; empty when the train is not placed.
    [[nodiscard]] const std::vector<TrainPosition>& bogiePositions() const { return m_bogiePositions; }

    // Ignores occupancy and leaves it untouched.
    [[nodiscard]] std::optional<std::vector<TrainPosition>> getPreviewBogiePositions(const TrainPosition& position);
    [[nodiscard]] const std::optional<TrainPosition>& previewPosition() const { return m_previewPosition; }
    [[nodiscard]] const std::optional<std::vector<TrainPosition>>& previewBogiePositions() const { return m_previewBogiePositions; }
    void clearPreviewPosition();
    void flipTrainDirection();

    // Front and back swap roles without moving the train.
    bool switchDirection();

    // Front of the train first, directions pointing towards the back.
    [[nodiscard]] const std::vector<OccupiedJoint>& occupiedJoints() const { return m_occupiedJoints; }
    [[nodiscard]] const std::vector<OccupiedSegment>& occupiedSegments() const { return m_occupiedSegments; }

private:
    [[nodiscard]] std::optional<std::vector<TrainPosition>> computeBogiePositions(const TrainPosition& lead, bool preview);
    void releasePassedOccupancy(const TrainPosition& lead, const WalkResult& tail);
    void hardStop();

    const track::TrackGraph& m_graph;
    const JointDirectionResolver& m_resolver;
    TrainConfig m_config{};

    std::optional<TrainPosition> m_position;
    std::vector<TrainPosition> m_bogiePositions;
    std::vector<OccupiedJoint> m_occupiedJoints;
    std::vector<OccupiedSegment> m_occupiedSegments;

    std::optional<TrainPosition> m_previewPosition;
    std::optional<std::vector<TrainPosition>> m_previewBogiePositions;

    ThrottleStep m_throttle = ThrottleStep::Neutral;
    double m_speed = 0.0;
    double m_acceleration = 0.0;
};

} // namespace railyard::sim
