#include "sim/train.h"

#include <algorithm>

#include "core/log.h"

namespace railyard::sim {
namespace {

constexpr std::array<std::string_view, kThrottleStepCount> kThrottleNames = {
    "er", "b7", "b6", "b5", "b4", "b3", "b2", "b1", "N", "p1", "p2", "p3", "p4", "p5"
};

double travelSign(track::TravelDirection direction) {
    return direction == track::TravelDirection::Tangent ? 1.0 : -1.0;
}

double segmentEndT(track::TravelDirection direction) {
    return direction == track::TravelDirection::Tangent ? 1.0 : 0.0;
}

template <typename Entry, typename Match>
std::optional<std::size_t> findLastIndex(const std::vector<Entry>& entries, Match match) {
    for (std::size_t i = entries.size(); i > 0; --i) {
        if (match(entries[i - 1])) {
            return i - 1;
        }
    }
    return std::nullopt;
}

} // namespace

std::string_view throttleName(ThrottleStep step) {
    return kThrottleNames[static_cast<std::size_t>(step)];
}

std::optional<ThrottleStep> parseThrottleStep(std::string_view text) {
    for (std::size_t i = 0; i < kThrottleNames.size(); ++i) {
        if (kThrottleNames[i] == text) {
            return static_cast<ThrottleStep>(i);
        }
    }
    return std::nullopt;
}

std::optional<WalkResult> advancePosition(
    double distance,
    const TrainPosition& position,
    const track::TrackGraph& graph,
    const JointDirectionResolver& resolver,
    std::span<const OccupiedJoint> occupiedJoints,
    std::span<const OccupiedSegment> occupiedSegments
) {
    const track::TrackSegment* segment = graph.getTrackSegmentWithJoints(position.segment);
    if (segment == nullptr) {
        RY_LOGE("train") << "walk started on missing segment " << position.segment;
        return std::nullopt;
    }

    WalkResult result{};
    track::TravelDirection direction = position.direction;
    track::SegmentId segmentId = position.segment;
    geometry::AdvanceResult next = segment->curve.advanceAtTWithLength(position.t, distance * travelSign(direction));

    while (next.kind != geometry::AdvanceKind::WithinCurve) {
        const bool forward = direction == track::TravelDirection::Tangent;
        const track::JointId comingFrom = forward ? segment->t0Joint : segment->t1Joint;
        const track::JointId entering = forward ? segment->t1Joint : segment->t0Joint;
        const track::Joint* joint = graph.getJoint(entering);
        if (joint == nullptr) {
            RY_LOGE("train") << "segment " << segmentId << " ends at missing joint " << entering;
            return std::nullopt;
        }
        const auto arrival = joint->connections.find(comingFrom);
        if (arrival == joint->connections.end()) {
            RY_LOGE("train") << "joint " << entering << " has no connection back to " << comingFrom;
            return std::nullopt;
        }
        const track::TravelDirection exitDirection = track::flipDirection(arrival->second.sense);

        const std::optional<NextHop> hop = resolver.getNextJoint(entering, exitDirection, occupiedJoints, occupiedSegments);
        if (!hop.has_value()) {
            const double endT = segmentEndT(direction);
            result.position = TrainPosition{segmentId, endT, direction, segment->curve.get(endT)};
            result.stop = true;
            return result;
        }

        result.enteringSegments.insert(
            result.enteringSegments.begin(), EnteredSegment{hop->segment, entering, hop->joint, hop->direction});
        result.passedJoints.insert(result.passedJoints.begin(), OccupiedJoint{entering, exitDirection});

        segment = graph.getTrackSegmentWithJoints(hop->segment);
        if (segment == nullptr) {
            RY_LOGE("train") << "resolver returned missing segment " << hop->segment;
            return std::nullopt;
        }
        direction = hop->direction;
        segmentId = hop->segment;
        const double startT = direction == track::TravelDirection::Tangent ? 0.0 : 1.0;
        next = segment->curve.advanceAtTWithLength(startT, next.remainingLength * travelSign(direction));
    }

    result.position = TrainPosition{segmentId, next.t, direction, next.point};
    return result;
}

TrainConfig clampTrainConfig(const TrainConfig& config) {
    TrainConfig clamped = config;
    for (double& offset : clamped.bogieOffsets) {
        offset = std::clamp(offset, 0.1, 1000.0);
    }
    clamped.rollingResistance = std::clamp(config.rollingResistance, 0.0, 10.0);
    clamped.hardBrakeThreshold = std::clamp(config.hardBrakeThreshold, -10.0, 0.0);
    clamped.idleDistanceEpsilon = std::clamp(config.idleDistanceEpsilon, 0.0, 1.0);
    return clamped;
}

Train::Train(const track::TrackGraph& graph, const JointDirectionResolver& resolver, const TrainConfig& config)
    : m_graph(graph),
      m_resolver(resolver),
      m_config(clampTrainConfig(config)) {}

bool Train::setPosition(const TrainPosition& position) {
    const geometry::BezierCurve* curve = m_graph.getTrackSegmentCurve(position.segment);
    if (curve == nullptr) {
        RY_LOGD("train") << "setPosition: unknown segment " << position.segment;
        return false;
    }
    TrainPosition placed = position;
    placed.t = std::clamp(position.t, 0.0, 1.0);
    placed.point = curve->get(placed.t);

    std::vector<OccupiedJoint> previousJoints = std::move(m_occupiedJoints);
    std::vector<OccupiedSegment> previousSegments = std::move(m_occupiedSegments);
    m_occupiedJoints.clear();
    m_occupiedSegments.clear();

    std::optional<std::vector<TrainPosition>> bogies = computeBogiePositions(placed, false);
    if (!bogies.has_value()) {
        RY_LOGD("train") << "setPosition: train does not fit on segment " << position.segment << " at t " << position.t;
        m_occupiedJoints = std::move(previousJoints);
        m_occupiedSegments = std::move(previousSegments);
        return false;
    }
    m_position = placed;
    m_bogiePositions = std::move(*bogies);
    m_speed = 0.0;
    m_acceleration = 0.0;
    return true;
}

void Train::clearPosition() {
    m_position.reset();
    m_bogiePositions.clear();
    m_occupiedJoints.clear();
    m_occupiedSegments.clear();
    m_speed = 0.0;
    m_acceleration = 0.0;
    m_throttle = ThrottleStep::Neutral;
}

void Train::throttleUp() {
    const auto index = static_cast<std::size_t>(m_throttle);
    if (index + 1 < kThrottleStepCount) {
        m_throttle = static_cast<ThrottleStep>(index + 1);
    }
}

void Train::throttleDown() {
    const auto index = static_cast<std::size_t>(m_throttle);
    if (index > 0) {
        m_throttle = static_cast<ThrottleStep>(index - 1);
    }
}

void Train::hardStop() {
    m_speed = 0.0;
    m_acceleration = 0.0;
    m_throttle = ThrottleStep::Neutral;
}

void Train::update(double deltaTimeMs) {
    if (!m_position.has_value()) {
        return;
    }
    const double dt = deltaTimeMs / 1000.0;
    if (m_graph.getTrackSegmentWithJoints(m_position->segment) == nullptr) {
        RY_LOGW("train") << "segment " << m_position->segment << " under the train no longer exists";
        hardStop();
        return;
    }

    m_acceleration = throttleAcceleration(m_throttle);
    if (m_speed > 0.0 && m_acceleration > m_config.hardBrakeThreshold) {
        m_acceleration -= m_config.rollingResistance;
    }
    m_speed += m_acceleration * dt;
    if (m_speed < 0.0) {
        m_acceleration = 0.0;
        m_speed = 0.0;
    }

    const double distance = m_speed * dt;
    if (math::approximately(distance, 0.0, m_config.idleDistanceEpsilon)) {
        return;
    }

    const std::optional<WalkResult> walk = advancePosition(distance, *m_position, m_graph, m_resolver);
    if (!walk.has_value() || walk->stop) {
        RY_LOGD("train") << "train stopped at segment " << m_position->segment;
        hardStop();
        return;
    }

    std::vector<OccupiedJoint> joints;
    joints.reserve(walk->passedJoints.size() + m_occupiedJoints.size());
    for (const OccupiedJoint& passed : walk->passedJoints) {
        joints.push_back(OccupiedJoint{passed.joint, track::flipDirection(passed.direction)});
    }
    joints.insert(joints.end(), m_occupiedJoints.begin(), m_occupiedJoints.end());
    m_occupiedJoints = std::move(joints);

    std::vector<OccupiedSegment> segments;
    segments.reserve(walk->enteringSegments.size() + m_occupiedSegments.size());
    for (const EnteredSegment& entered : walk->enteringSegments) {
        segments.push_back(OccupiedSegment{entered.segment, track::flipDirection(entered.direction)});
    }
    segments.insert(segments.end(), m_occupiedSegments.begin(), m_occupiedSegments.end());
    m_occupiedSegments = std::move(segments);

    m_position = walk->position;
    std::optional<std::vector<TrainPosition>> bogies = computeBogiePositions(*m_position, false);
    if (!bogies.has_value()) {
        RY_LOGW("train") << "bogies could not be placed behind segment " << m_position->segment;
        m_bogiePositions.clear();
        return;
    }
    m_bogiePositions = std::move(*bogies);
}

std::optional<std::vector<TrainPosition>> Train::computeBogiePositions(const TrainPosition& lead, bool preview) {
    std::vector<TrainPosition> positions;
    positions.reserve(m_config.bogieOffsets.size() + 1);
    positions.push_back(lead);

    TrainPosition expand = lead;
    expand.direction = track::flipDirection(lead.direction);

    const std::span<const OccupiedJoint> joints = preview ? std::span<const OccupiedJoint>{} : std::span<const OccupiedJoint>{m_occupiedJoints};
    const std::span<const OccupiedSegment> segments =
        preview ? std::span<const OccupiedSegment>{} : std::span<const OccupiedSegment>{m_occupiedSegments};

    double accumulated = 0.0;
    std::optional<WalkResult> tail;
    for (const double offset : m_config.bogieOffsets) {
        accumulated += offset;
        std::optional<WalkResult> walk = advancePosition(accumulated, expand, m_graph, m_resolver, joints, segments);
        if (!walk.has_value() || walk->stop) {
            return std::nullopt;
        }
        positions.push_back(walk->position);
        tail = std::move(walk);
    }

    if (!preview) {
        if (tail.has_value()) {
            releasePassedOccupancy(lead, *tail);
        } else {
            releasePassedOccupancy(lead, WalkResult{lead, false, {}, {}});
        }
    }
    return positions;
}

void Train::releasePassedOccupancy(const TrainPosition& lead, const WalkResult& tail) {
    if (tail.passedJoints.empty()) {
        // Whole train sits on the lead segment.
        m_occupiedJoints.clear();
    } else if (m_occupiedJoints.empty()) {
        m_occupiedJoints.assign(tail.passedJoints.rbegin(), tail.passedJoints.rend());
    } else {
        const track::JointId rearmost = tail.passedJoints.front().joint;
        const std::optional<std::size_t> index =
            findLastIndex(m_occupiedJoints, [rearmost](const OccupiedJoint& entry) { return entry.joint == rearmost; });
        if (index.has_value()) {
            m_occupiedJoints.resize(*index + 1);
        }
    }

    const OccupiedSegment front{lead.segment, track::flipDirection(lead.direction)};
    if (tail.enteringSegments.empty()) {
        m_occupiedSegments.assign(1, front);
    } else if (m_occupiedSegments.empty()) {
        m_occupiedSegments.push_back(front);
        for (auto it = tail.enteringSegments.rbegin(); it != tail.enteringSegments.rend(); ++it) {
            m_occupiedSegments.push_back(OccupiedSegment{it->segment, it->direction});
        }
    } else {
        const track::SegmentId rearmost = tail.enteringSegments.front().segment;
        const std::optional<std::size_t> index = findLastIndex(
            m_occupiedSegments, [rearmost](const OccupiedSegment& entry) { return entry.segment == rearmost; });
        if (index.has_value()) {
            m_occupiedSegments.resize(*index + 1);
        }
    }
}

std::optional<std::vector<TrainPosition>> Train::getPreviewBogiePositions(const TrainPosition& position) {
    if (m_previewPosition.has_value() && m_previewPosition->segment == position.segment &&
        m_previewPosition->t == position.t && m_previewPosition->direction == position.direction) {
        return m_previewBogiePositions;
    }
    m_previewPosition = position;
    m_previewBogiePositions = computeBogiePositions(position, true);
    return m_previewBogiePositions;
}

void Train::clearPreviewPosition() {
    m_previewPosition.reset();
    m_previewBogiePositions.reset();
}

void Train::flipTrainDirection() {
    if (!m_previewPosition.has_value()) {
        return;
    }
    m_previewPosition->direction = track::flipDirection(m_previewPosition->direction);
    m_previewBogiePositions = computeBogiePositions(*m_previewPosition, true);
}

bool Train::switchDirection() {
    if (!m_position.has_value() || m_bogiePositions.empty()) {
        return false;
    }
    const TrainPosition newLead = m_bogiePositions.back();

    std::vector<double> offsets(m_config.bogieOffsets.rbegin(), m_config.bogieOffsets.rend());
    std::vector<OccupiedJoint> joints;
    joints.reserve(m_occupiedJoints.size());
    for (auto it = m_occupiedJoints.rbegin(); it != m_occupiedJoints.rend(); ++it) {
        joints.push_back(OccupiedJoint{it->joint, track::flipDirection(it->direction)});
    }
    std::vector<OccupiedSegment> segments;
    segments.reserve(m_occupiedSegments.size());
    for (auto it = m_occupiedSegments.rbegin(); it != m_occupiedSegments.rend(); ++it) {
        segments.push_back(OccupiedSegment{it->segment, track::flipDirection(it->direction)});
    }

    std::swap(m_config.bogieOffsets, offsets);
    std::swap(m_occupiedJoints, joints);
    std::swap(m_occupiedSegments, segments);
    std::optional<std::vector<TrainPosition>> bogies = computeBogiePositions(newLead, false);
    if (!bogies.has_value()) {
        RY_LOGW("train") << "switchDirection: bogies could not be placed, keeping the current heading";
        std::swap(m_config.bogieOffsets, offsets);
        std::swap(m_occupiedJoints, joints);
        std::swap(m_occupiedSegments, segments);
        return false;
    }
    m_position = newLead;
    m_bogiePositions = std::move(*bogies);
    return true;
}

} // namespace railyard::sim
