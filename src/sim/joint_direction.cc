#include "sim/joint_direction.h"

#include "core/log.h"

namespace railyard::sim {

std::optional<NextHop> DefaultJointDirectionResolver::hopAlongSegment(
    track::JointId from,
    track::JointId to,
    track::SegmentId segmentId
) const {
    if (m_graph.getJoint(to) == nullptr) {
        RY_LOGE("train") << "next joint " << to << " not found";
        return std::nullopt;
    }
    const track::TrackSegment* segment = m_graph.getTrackSegmentWithJoints(segmentId);
    if (segment == nullptr) {
        RY_LOGE("train") << "segment " << segmentId << " between " << from << " and " << to << " not found";
        return std::nullopt;
    }
    const track::TravelDirection direction =
        segment->t0Joint == from ? track::TravelDirection::Tangent : track::TravelDirection::ReverseTangent;
    return NextHop{to, direction, segmentId};
}

HistoryLookup DefaultJointDirectionResolver::followHistory(
    track::JointId jointId,
    track::TravelDirection direction,
    std::span<const OccupiedJoint> occupiedJoints,
    std::span<const OccupiedSegment> occupiedSegments
) const {
    const HistoryLookup inconsistent{HistoryMatch::Inconsistent, NextHop{}};
    const track::Joint* joint = m_graph.getJoint(jointId);
    for (std::size_t i = 0; i < occupiedJoints.size(); ++i) {
        if (occupiedJoints[i].joint != jointId || occupiedJoints[i].direction != direction) {
            continue;
        }
        if (i + 1 < occupiedJoints.size()) {
            const track::JointId nextJoint = occupiedJoints[i + 1].joint;
            const auto connection = joint->connections.find(nextJoint);
            if (connection == joint->connections.end()) {
                RY_LOGE("train") << "occupied joint " << nextJoint << " is not connected to " << jointId;
                return inconsistent;
            }
            const std::optional<NextHop> hop = hopAlongSegment(jointId, nextJoint, connection->second.segment);
            if (!hop.has_value()) {
                return inconsistent;
            }
            return HistoryLookup{HistoryMatch::Found, *hop};
        }
        if (occupiedSegments.empty()) {
            return HistoryLookup{};
        }
        // Last recorded joint: the tail segment decides.
        const OccupiedSegment& tail = occupiedSegments.back();
        const track::TrackSegment* segment = m_graph.getTrackSegmentWithJoints(tail.segment);
        if (segment == nullptr) {
            RY_LOGE("train") << "occupied segment " << tail.segment << " not found";
            return inconsistent;
        }
        const track::JointId nextJoint = tail.direction == track::TravelDirection::Tangent ? segment->t1Joint : segment->t0Joint;
        if (m_graph.getJoint(nextJoint) == nullptr) {
            RY_LOGE("train") << "joint " << nextJoint << " of occupied segment " << tail.segment << " not found";
            return inconsistent;
        }
        return HistoryLookup{HistoryMatch::Found, NextHop{nextJoint, tail.direction, tail.segment}};
    }
    return HistoryLookup{};
}

std::optional<NextHop> DefaultJointDirectionResolver::getNextJoint(
    track::JointId jointId,
    track::TravelDirection direction,
    std::span<const OccupiedJoint> occupiedJoints,
    std::span<const OccupiedSegment> occupiedSegments
) const {
    const track::Joint* joint = m_graph.getJoint(jointId);
    if (joint == nullptr) {
        RY_LOGE("train") << "joint " << jointId << " not found";
        return std::nullopt;
    }

    const HistoryLookup history = followHistory(jointId, direction, occupiedJoints, occupiedSegments);
    if (history.match == HistoryMatch::Found) {
        return history.hop;
    }
    if (history.match == HistoryMatch::Inconsistent) {
        return std::nullopt;
    }

    // connections is ordered by neighbour id.
    for (const auto& [neighbor, connection] : joint->connections) {
        if (connection.sense == direction) {
            return hopAlongSegment(jointId, neighbor, connection.segment);
        }
    }
    RY_LOGT("train") << "joint " << jointId << " has no exit in that direction";
    return std::nullopt;
}

} // namespace railyard::sim
