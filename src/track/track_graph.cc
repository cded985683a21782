#include "track/track_graph.h"

#include <algorithm>
#include <cmath>

#include "core/log.h"

namespace railyard::track {
namespace {

constexpr double kMinSegmentLength = 1e-3;

TravelDirection departureSense(const math::Vec2& jointTangent, const math::Vec2& curveDirection) {
    return math::sameDirection(jointTangent, curveDirection) ? TravelDirection::Tangent : TravelDirection::ReverseTangent;
}

// Arriving along the joint's tangent means leaving back along the segment goes against it.
TravelDirection arrivalSense(const math::Vec2& jointTangent, const math::Vec2& curveDirection) {
    return math::sameDirection(jointTangent, curveDirection) ? TravelDirection::ReverseTangent : TravelDirection::Tangent;
}

double segmentSortValue(const ElevationSpan& span, ElevationSortKey key) {
    const double from = elevationHeight(span.from);
    const double to = elevationHeight(span.to);
    switch (key) {
    case ElevationSortKey::Min:
        return std::min(from, to);
    case ElevationSortKey::Max:
        return std::max(from, to);
    case ElevationSortKey::Average:
        return (from + to) * 0.5;
    }
    return std::min(from, to);
}

} // namespace

TrackGraph::TrackGraph(const TrackGraphConfig& config)
    : m_config(clampTrackGraphConfig(config)),
      m_jointManager(m_config.initialCapacity),
      m_trackCurveManager(m_config) {}

void TrackGraph::setConfig(const TrackGraphConfig& config) {
    m_config = clampTrackGraphConfig(config);
    m_trackCurveManager.setConfig(m_config);
}

geometry::BezierCurve TrackGraph::buildCurve(
    const math::Vec2& start,
    const std::vector<math::Vec2>& controlPoints,
    const math::Vec2& end
) {
    std::vector<math::Vec2> points;
    points.reserve(controlPoints.size() + 2);
    points.push_back(start);
    if (controlPoints.empty()) {
        // Straight track is stored as a quadratic with a centred control point.
        points.push_back(math::lerp(start, end, 0.5));
    } else {
        points.insert(points.end(), controlPoints.begin(), controlPoints.end());
    }
    points.push_back(end);
    return geometry::BezierCurve(std::move(points));
}

std::set<SegmentId> TrackGraph::adjacentSegments(std::initializer_list<JointId> joints) const {
    std::set<SegmentId> result;
    for (const JointId jointId : joints) {
        const Joint* joint = m_jointManager.getJoint(jointId);
        if (joint == nullptr) {
            continue;
        }
        for (const auto& entry : joint->connections) {
            result.insert(entry.second.segment);
        }
    }
    return result;
}

const Joint* TrackGraph::getJoint(JointId joint) const {
    return m_jointManager.getJoint(joint);
}

std::vector<std::pair<JointId, const Joint*>> TrackGraph::getJoints() const {
    return m_jointManager.getJoints();
}

std::optional<math::Vec2> TrackGraph::getJointPosition(JointId jointId) const {
    const Joint* joint = m_jointManager.getJoint(jointId);
    if (joint == nullptr) {
        return std::nullopt;
    }
    return joint->position;
}

JointId TrackGraph::createNewEmptyJoint(const math::Vec2& position, const math::Vec2& tangent, Elevation elevation) {
    Joint joint{};
    joint.position = position;
    joint.tangent = tangent;
    joint.elevation = elevation;
    return m_jointManager.createJoint(std::move(joint));
}

bool TrackGraph::createNewTrackSegment(
    const math::Vec2& startPosition,
    const math::Vec2& endPosition,
    const std::vector<math::Vec2>& controlPoints,
    Elevation startElevation,
    Elevation endElevation
) {
    const geometry::BezierCurve curve = buildCurve(startPosition, controlPoints, endPosition);
    if (curve.fullLength() < kMinSegmentLength) {
        RY_LOGD("graph") << "createNewTrackSegment: degenerate curve";
        return false;
    }

    const JointId startId = createNewEmptyJoint(startPosition, curve.unitDerivative(0.0), startElevation);
    const JointId endId = createNewEmptyJoint(endPosition, curve.unitDerivative(1.0), endElevation);
    const SegmentId segment = m_trackCurveManager.createCurveWithJoints(
        curve, startId, endId, startElevation, endElevation, m_config.defaultGauge);

    m_jointManager.getMutableJoint(startId)->connections[endId] = JointConnection{segment, TravelDirection::Tangent};
    m_jointManager.getMutableJoint(endId)->connections[startId] = JointConnection{segment, TravelDirection::ReverseTangent};
    return true;
}

bool TrackGraph::connectJoints(JointId startJointId, JointId endJointId, const std::vector<math::Vec2>& controlPoints) {
    if (startJointId == endJointId) {
        RY_LOGD("graph") << "connectJoints: joint " << startJointId << " cannot connect to itself";
        return false;
    }
    const Joint* startJoint = m_jointManager.getJoint(startJointId);
    const Joint* endJoint = m_jointManager.getJoint(endJointId);
    if (startJoint == nullptr || endJoint == nullptr) {
        RY_LOGD("graph") << "connectJoints: unknown joint " << startJointId << " or " << endJointId;
        return false;
    }
    if (startJoint->connectedTo(endJointId)) {
        RY_LOGD("graph") << "connectJoints: joints " << startJointId << " and " << endJointId << " already connected";
        return false;
    }

    const geometry::BezierCurve curve = buildCurve(startJoint->position, controlPoints, endJoint->position);
    if (curve.fullLength() < kMinSegmentLength) {
        RY_LOGD("graph") << "connectJoints: degenerate curve";
        return false;
    }

    const TravelDirection startSense = departureSense(startJoint->tangent, curve.unitDerivative(0.0));
    const TravelDirection endSense = arrivalSense(endJoint->tangent, curve.unitDerivative(1.0));
    const SegmentId segment = m_trackCurveManager.createCurveWithJoints(
        curve,
        startJointId,
        endJointId,
        startJoint->elevation,
        endJoint->elevation,
        m_config.defaultGauge,
        adjacentSegments({startJointId, endJointId}));

    m_jointManager.getMutableJoint(startJointId)->connections[endJointId] = JointConnection{segment, startSense};
    m_jointManager.getMutableJoint(endJointId)->connections[startJointId] = JointConnection{segment, endSense};
    return true;
}

bool TrackGraph::attachNewJoint(JointId startJointId, const math::Vec2& endPosition, const geometry::BezierCurve& curve) {
    const Joint* startJoint = m_jointManager.getJoint(startJointId);
    const Elevation elevation = startJoint->elevation;
    const TravelDirection startSense = departureSense(startJoint->tangent, curve.unitDerivative(0.0));
    const std::set<SegmentId> exclude = adjacentSegments({startJointId});

    const JointId newJointId = createNewEmptyJoint(endPosition, curve.unitDerivative(1.0), elevation);
    const SegmentId segment = m_trackCurveManager.createCurveWithJoints(
        curve, startJointId, newJointId, elevation, elevation, m_config.defaultGauge, exclude);

    m_jointManager.getMutableJoint(newJointId)->connections[startJointId] = JointConnection{segment, TravelDirection::ReverseTangent};
    m_jointManager.getMutableJoint(startJointId)->connections[newJointId] = JointConnection{segment, startSense};
    return true;
}

bool TrackGraph::branchToNewJoint(JointId startJointId, const math::Vec2& endPosition, const std::vector<math::Vec2>& controlPoints) {
    const Joint* startJoint = m_jointManager.getJoint(startJointId);
    if (startJoint == nullptr) {
        RY_LOGD("graph") << "branchToNewJoint: unknown joint " << startJointId;
        return false;
    }
    const geometry::BezierCurve curve = buildCurve(startJoint->position, controlPoints, endPosition);
    if (curve.fullLength() < kMinSegmentLength) {
        RY_LOGD("graph") << "branchToNewJoint: degenerate curve";
        return false;
    }
    return attachNewJoint(startJointId, endPosition, curve);
}

bool TrackGraph::extendTrackFromJoint(JointId startJointId, const math::Vec2& endPosition, const std::vector<math::Vec2>& controlPoints) {
    const Joint* startJoint = m_jointManager.getJoint(startJointId);
    if (startJoint == nullptr) {
        RY_LOGD("graph") << "extendTrackFromJoint: unknown joint " << startJointId;
        return false;
    }

    const geometry::BezierCurve curve = buildCurve(startJoint->position, controlPoints, endPosition);
    if (curve.fullLength() < kMinSegmentLength) {
        RY_LOGD("graph") << "extendTrackFromJoint: degenerate curve";
        return false;
    }

    const math::Vec2 emptyDirection = tangentIsPointingInEmptyDirection(startJointId) ? startJoint->tangent : -startJoint->tangent;
    const double angle = math::normalizeAngleZeroToTwoPi(math::angleFromA2B(emptyDirection, curve.unitDerivative(0.0)));
    if (angle > math::kPi * 0.5 && angle < math::kPi * 1.5) {
        RY_LOGD("graph") << "extendTrackFromJoint: joint " << startJointId << " cannot extend backwards";
        return false;
    }
    return attachNewJoint(startJointId, endPosition, curve);
}

std::optional<JointId> TrackGraph::insertJointIntoTrackSegment(JointId startJointId, JointId endJointId, double atT) {
    const Joint* startJoint = m_jointManager.getJoint(startJointId);
    const Joint* endJoint = m_jointManager.getJoint(endJointId);
    if (startJoint == nullptr || endJoint == nullptr) {
        RY_LOGD("graph") << "insertJointIntoTrackSegment: unknown joint " << startJointId << " or " << endJointId;
        return std::nullopt;
    }
    if (startJoint->elevation != endJoint->elevation) {
        RY_LOGD("graph") << "insertJointIntoTrackSegment: cannot split a ramp";
        return std::nullopt;
    }
    const auto connection = startJoint->connections.find(endJointId);
    if (connection == startJoint->connections.end()) {
        RY_LOGD("graph") << "insertJointIntoTrackSegment: joints " << startJointId << " and " << endJointId << " not connected";
        return std::nullopt;
    }
    return splitSegment(connection->second.segment, atT);
}

std::optional<JointId> TrackGraph::insertJointIntoTrackSegmentUsingTrackNumber(SegmentId segment, double atT) {
    return splitSegment(segment, atT);
}

std::optional<JointId> TrackGraph::splitSegment(SegmentId segmentId, double atT) {
    const TrackSegment* segment = m_trackCurveManager.getTrackSegmentWithJoints(segmentId);
    if (segment == nullptr) {
        RY_LOGD("graph") << "insert joint: unknown segment " << segmentId;
        return std::nullopt;
    }
    if (!(atT > 0.0 && atT < 1.0)) {
        RY_LOGD("graph") << "insert joint: parameter " << atT << " is not inside the segment";
        return std::nullopt;
    }

    const JointId t0Id = segment->t0Joint;
    const JointId t1Id = segment->t1Joint;
    const Joint* t0Joint = m_jointManager.getJoint(t0Id);
    const Joint* t1Joint = m_jointManager.getJoint(t1Id);
    if (t0Joint == nullptr || t1Joint == nullptr) {
        RY_LOGE("graph") << "segment " << segmentId << " references missing joint " << t0Id << " or " << t1Id;
        return std::nullopt;
    }
    if (t0Joint->elevation != t1Joint->elevation) {
        RY_LOGD("graph") << "insert joint: cannot split ramp segment " << segmentId;
        return std::nullopt;
    }

    const geometry::BezierCurve oldCurve = segment->curve;
    const double gauge = segment->gauge;
    const Elevation elevation = t0Joint->elevation;
    const TravelDirection t0Sense = departureSense(t0Joint->tangent, oldCurve.derivative(0.0));
    const TravelDirection t1Sense = arrivalSense(t1Joint->tangent, oldCurve.derivative(1.0));
    auto [firstCurve, secondCurve] = oldCurve.split(atT);

    const JointId newJointId = createNewEmptyJoint(oldCurve.get(atT), firstCurve.unitDerivative(1.0), elevation);
    m_trackCurveManager.destroyCurve(segmentId);

    std::set<SegmentId> firstExclude = adjacentSegments({t0Id});
    firstExclude.erase(segmentId);
    const SegmentId firstSegment = m_trackCurveManager.createCurveWithJoints(
        firstCurve, t0Id, newJointId, elevation, elevation, gauge, firstExclude);

    std::set<SegmentId> secondExclude = adjacentSegments({t1Id});
    secondExclude.erase(segmentId);
    secondExclude.insert(firstSegment);
    const SegmentId secondSegment = m_trackCurveManager.createCurveWithJoints(
        secondCurve, newJointId, t1Id, elevation, elevation, gauge, secondExclude);

    Joint* newJoint = m_jointManager.getMutableJoint(newJointId);
    newJoint->connections[t0Id] = JointConnection{firstSegment, TravelDirection::ReverseTangent};
    newJoint->connections[t1Id] = JointConnection{secondSegment, TravelDirection::Tangent};

    Joint* mutableT0 = m_jointManager.getMutableJoint(t0Id);
    mutableT0->connections.erase(t1Id);
    mutableT0->connections[newJointId] = JointConnection{firstSegment, t0Sense};

    Joint* mutableT1 = m_jointManager.getMutableJoint(t1Id);
    mutableT1->connections.erase(t0Id);
    mutableT1->connections[newJointId] = JointConnection{secondSegment, t1Sense};

    RY_LOGD("graph") << "split segment " << segmentId << " at " << atT << " into " << firstSegment << " and "
                     << secondSegment << " via joint " << newJointId;
    return newJointId;
}

bool TrackGraph::removeTrackSegment(SegmentId segmentId) {
    const TrackSegment* segment = m_trackCurveManager.getTrackSegmentWithJoints(segmentId);
    if (segment == nullptr) {
        RY_LOGD("graph") << "removeTrackSegment: unknown segment " << segmentId;
        return false;
    }
    const JointId t0Id = segment->t0Joint;
    const JointId t1Id = segment->t1Joint;
    const Joint* t0Joint = m_jointManager.getJoint(t0Id);
    const Joint* t1Joint = m_jointManager.getJoint(t1Id);
    if (t0Joint == nullptr || t1Joint == nullptr) {
        RY_LOGE("graph") << "segment " << segmentId << " references missing joint " << t0Id << " or " << t1Id;
        return false;
    }

    const auto wouldStrandJoint = [](const Joint& joint, JointId neighbor) {
        const auto it = joint.connections.find(neighbor);
        if (it == joint.connections.end()) {
            return false;
        }
        const TravelDirection sense = it->second.sense;
        return joint.directionCount(sense) == 1 && joint.directionCount(flipDirection(sense)) > 1;
    };
    if (wouldStrandJoint(*t0Joint, t1Id)) {
        RY_LOGD("graph") << "removeTrackSegment: segment " << segmentId << " is joint " << t0Id << "'s only way out on that side";
        return false;
    }
    if (wouldStrandJoint(*t1Joint, t0Id)) {
        RY_LOGD("graph") << "removeTrackSegment: segment " << segmentId << " is joint " << t1Id << "'s only way out on that side";
        return false;
    }

    m_trackCurveManager.destroyCurve(segmentId);

    Joint* mutableT0 = m_jointManager.getMutableJoint(t0Id);
    mutableT0->connections.erase(t1Id);
    const bool t0Orphaned = mutableT0->connections.empty();
    Joint* mutableT1 = m_jointManager.getMutableJoint(t1Id);
    mutableT1->connections.erase(t0Id);
    const bool t1Orphaned = mutableT1->connections.empty();

    if (t0Orphaned) {
        m_jointManager.destroyJoint(t0Id);
    }
    if (t1Orphaned) {
        m_jointManager.destroyJoint(t1Id);
    }
    return true;
}

std::optional<math::Vec2> TrackGraph::getTangentAtJoint(JointId jointId) const {
    const Joint* joint = m_jointManager.getJoint(jointId);
    if (joint == nullptr) {
        return std::nullopt;
    }
    return joint->tangent;
}

std::optional<double> TrackGraph::getCurvatureAtJoint(JointId jointId) const {
    const Joint* joint = m_jointManager.getJoint(jointId);
    if (joint == nullptr || joint->connections.empty()) {
        return std::nullopt;
    }
    const TrackSegment* segment = m_trackCurveManager.getTrackSegmentWithJoints(joint->connections.begin()->second.segment);
    if (segment == nullptr) {
        RY_LOGE("graph") << "joint " << jointId << " references a missing segment";
        return std::nullopt;
    }
    const double atT = segment->t1Joint == jointId ? 1.0 : 0.0;
    const double curvature = segment->curve.curvature(atT);
    // Signed for travel along the joint tangent, not along the curve parameter.
    return math::dot(segment->curve.derivative(atT), joint->tangent) < 0.0 ? -curvature : curvature;
}

bool TrackGraph::jointIsEndingTrack(JointId jointId) const {
    const Joint* joint = m_jointManager.getJoint(jointId);
    return joint != nullptr && joint->connections.size() == 1;
}

bool TrackGraph::tangentIsPointingInEmptyDirection(JointId jointId) const {
    const Joint* joint = m_jointManager.getJoint(jointId);
    return joint != nullptr && joint->directionCount(TravelDirection::Tangent) == 0;
}

std::optional<DeadEndConnection> TrackGraph::getDeadEndJointSoleConnection(JointId jointId) const {
    if (!jointIsEndingTrack(jointId)) {
        return std::nullopt;
    }
    const auto& [neighbor, connection] = *m_jointManager.getJoint(jointId)->connections.begin();
    return DeadEndConnection{neighbor, connection.segment};
}

std::optional<JointId> TrackGraph::getTheOtherEndOfEndingTrack(JointId jointId) const {
    const std::optional<DeadEndConnection> connection = getDeadEndJointSoleConnection(jointId);
    if (!connection.has_value()) {
        return std::nullopt;
    }
    return connection->neighbor;
}

ProjectionResult TrackGraph::project(const math::Vec2& point) const {
    if (std::optional<ProjectionJointResult> joint = pointOnJoint(point)) {
        return *joint;
    }
    if (std::optional<ProjectionCurveResult> curve = projectPointOnTrack(point)) {
        return *curve;
    }
    if (std::optional<ProjectionEdgeResult> edge = onTrackSegmentEdge(point)) {
        return *edge;
    }
    return ProjectionMiss{};
}

std::optional<ProjectionJointResult> TrackGraph::pointOnJoint(const math::Vec2& point) const {
    std::optional<ProjectionJointResult> best;
    double minDistance = m_config.jointHitRadius;
    for (const auto& [jointId, joint] : m_jointManager.getJoints()) {
        const double distance = math::distance(point, joint->position);
        if (distance >= minDistance) {
            continue;
        }
        minDistance = distance;
        best = ProjectionJointResult{
            jointId,
            joint->position,
            joint->tangent,
            getCurvatureAtJoint(jointId).value_or(0.0),
            jointIsEndingTrack(jointId)};
    }
    return best;
}

std::optional<ProjectionCurveResult> TrackGraph::projectPointOnTrack(const math::Vec2& point) const {
    return m_trackCurveManager.projectOnCurve(point);
}

std::optional<ProjectionEdgeResult> TrackGraph::onTrackSegmentEdge(const math::Vec2& point) const {
    return m_trackCurveManager.onTrackSegmentEdge(point);
}

const TrackSegment* TrackGraph::getTrackSegmentWithJoints(SegmentId segment) const {
    return m_trackCurveManager.getTrackSegmentWithJoints(segment);
}

const geometry::BezierCurve* TrackGraph::getTrackSegmentCurve(SegmentId segment) const {
    return m_trackCurveManager.getTrackSegment(segment);
}

std::vector<std::pair<SegmentId, const TrackSegment*>> TrackGraph::trackSegments() const {
    return m_trackCurveManager.getTrackSegmentsWithJoints();
}

std::optional<double> TrackGraph::getFullLength(SegmentId segment) const {
    const geometry::BezierCurve* curve = m_trackCurveManager.getTrackSegment(segment);
    if (curve == nullptr) {
        return std::nullopt;
    }
    return curve->fullLength();
}

std::vector<std::pair<SegmentId, const TrackSegment*>> TrackGraph::getSortedTrackSegments(ElevationSortKey key) const {
    std::vector<std::pair<SegmentId, const TrackSegment*>> segments = m_trackCurveManager.getTrackSegmentsWithJoints();
    std::stable_sort(segments.begin(), segments.end(), [key](const auto& lhs, const auto& rhs) {
        return segmentSortValue(lhs.second->elevation, key) < segmentSortValue(rhs.second->elevation, key);
    });
    return segments;
}

std::vector<TrackDrawData> TrackGraph::getDrawData(const geometry::Aabb& viewport) {
    return m_trackCurveManager.getDrawData(viewport);
}

std::optional<std::size_t> TrackGraph::getTrackDrawDataOrder(SegmentId segmentId, double tVal) const {
    const TrackSegment* segment = m_trackCurveManager.getTrackSegmentWithJoints(segmentId);
    if (segment == nullptr || segment->splitCurves.empty()) {
        RY_LOGD("graph") << "getTrackDrawDataOrder: unknown segment " << segmentId;
        return std::nullopt;
    }

    std::size_t low = 0;
    std::size_t high = segment->splitCurves.size();
    while (low < high) {
        const std::size_t mid = low + ((high - low) / 2);
        const TInterval& interval = segment->splitCurves[mid].tInterval;
        if (tVal < interval.start) {
            high = mid;
        } else if (tVal > interval.end) {
            low = mid + 1;
        } else {
            return m_trackCurveManager.getTrackOrder(DrawDataKey{segmentId, static_cast<std::uint32_t>(mid)});
        }
    }
    RY_LOGD("graph") << "getTrackDrawDataOrder: t " << tVal << " outside segment " << segmentId;
    return std::nullopt;
}

core::SubscriptionToken TrackGraph::subscribe(core::EventRegistry<TrackEvent>::Callback callback) {
    return m_trackCurveManager.subscribe(std::move(callback));
}

bool TrackGraph::unsubscribe(core::SubscriptionToken token) {
    return m_trackCurveManager.unsubscribe(token);
}

bool TrackGraph::validateTopology() const {
    bool consistent = true;
    for (const auto& [jointId, joint] : m_jointManager.getJoints()) {
        for (const auto& [neighborId, connection] : joint->connections) {
            const TrackSegment* segment = m_trackCurveManager.getTrackSegmentWithJoints(connection.segment);
            const bool joins = segment != nullptr &&
                ((segment->t0Joint == jointId && segment->t1Joint == neighborId) ||
                 (segment->t1Joint == jointId && segment->t0Joint == neighborId));
            if (!joins) {
                RY_LOGE("graph") << "joint " << jointId << " -> " << neighborId << " names segment "
                                 << connection.segment << " which does not join them";
                consistent = false;
                continue;
            }
            const Joint* neighbor = m_jointManager.getJoint(neighborId);
            if (neighbor == nullptr || !neighbor->connectedTo(jointId) ||
                neighbor->connections.at(jointId).segment != connection.segment) {
                RY_LOGE("graph") << "joint " << neighborId << " does not mirror its connection to " << jointId;
                consistent = false;
            }
        }
    }
    for (const auto& [segmentId, segment] : m_trackCurveManager.getTrackSegmentsWithJoints()) {
        const Joint* t0Joint = m_jointManager.getJoint(segment->t0Joint);
        if (t0Joint == nullptr || !t0Joint->connectedTo(segment->t1Joint)) {
            RY_LOGE("graph") << "segment " << segmentId << " is not wired into joint " << segment->t0Joint;
            consistent = false;
        }
    }
    return consistent;
}

} // namespace railyard::track
