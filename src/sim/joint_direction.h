#pragma once

#include <cstdint>
#include <optional>
#include <span>

#include "track/track_graph.h"
#include "track/track_types.h"

// Simulation JointDirection subsystem
// Responsible for: choosing the next joint and segment when a walk along the track reaches a joint.
// Should NOT do: move trains, keep occupancy history, or mutate the track graph.
namespace railyard::sim {

struct OccupiedJoint {
    track::JointId joint = track::kInvalidJointId;
    // Direction of travel out of the joint, seen from the front of the train towards its back.
    track::TravelDirection direction = track::TravelDirection::Tangent;

    constexpr bool operator==(const OccupiedJoint&) const = default;
};

struct OccupiedSegment {
    track::SegmentId segment = track::kInvalidSegmentId;
    track::TravelDirection direction = track::TravelDirection::Tangent;

    constexpr bool operator==(const OccupiedSegment&) const = default;
};

struct NextHop {
    track::JointId joint = track::kInvalidJointId;
    // Tangent when the segment is entered at its t = 0 end.
    track::TravelDirection direction = track::TravelDirection::Tangent;
    track::SegmentId segment = track::kInvalidSegmentId;
};

// Outcome of looking a joint up in the occupancy history.
enum class HistoryMatch : std::uint8_t {
    Absent,
    Found,
    Inconsistent
};

struct HistoryLookup {
    HistoryMatch match = HistoryMatch::Absent;
    NextHop hop{};
};

class JointDirectionResolver {
public:
    virtual ~JointDirectionResolver() = default;

    // nullopt when nothing lies beyond the joint in that direction or the graph is inconsistent.
    [[nodiscard]] virtual std::optional<NextHop> getNextJoint(
        track::JointId joint,
        track::TravelDirection direction,
        std::span<const OccupiedJoint> occupiedJoints = {},
        std::span<const OccupiedSegment> occupiedSegments = {}
    ) const = 0;
};

// Follows the occupancy history when the joint appears in it; otherwise takes the
// neighbour with the lowest joint id. History that disagrees with the graph fails the hop.
class DefaultJointDirectionResolver final : public JointDirectionResolver {
public:
    explicit DefaultJointDirectionResolver(const track::TrackGraph& graph) : m_graph(graph) {}

    [[nodiscard]] std::optional<NextHop> getNextJoint(
        track::JointId joint,
        track::TravelDirection direction,
        std::span<const OccupiedJoint> occupiedJoints = {},
        std::span<const OccupiedSegment> occupiedSegments = {}
    ) const override;

private:
    [[nodiscard]] std::optional<NextHop> hopAlongSegment(track::JointId from, track::JointId to, track::SegmentId segment) const;
    [[nodiscard]] HistoryLookup followHistory(
        track::JointId joint,
        track::TravelDirection direction,
        std::span<const OccupiedJoint> occupiedJoints,
        std::span<const OccupiedSegment> occupiedSegments
    ) const;

    const track::TrackGraph& m_graph;
};

} // namespace railyard::sim
