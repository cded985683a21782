#include "track/track_curve_manager.h"

#include <algorithm>
#include <cmath>
#include <limits>

#include "core/log.h"
#include "track/draw_order.h"
#include "track/elevation.h"

namespace railyard::track {
namespace {

constexpr std::size_t kOffsetSamples = 100;

// Split parameters are capped to two decimals so near-coincident crossings share a cut.
double roundSplitParameter(double t) {
    return std::round(t * 100.0) / 100.0;
}

} // namespace

TrackCurveManager::TrackCurveManager(const TrackGraphConfig& config)
    : m_config(clampTrackGraphConfig(config)),
      m_segments(m_config.initialCapacity),
      m_spatialIndex(world::SpatialIndexConfig{m_config.spatialIndexMaxEntries}) {}

void TrackCurveManager::setConfig(const TrackGraphConfig& config) {
    const TrackGraphConfig clamped = clampTrackGraphConfig(config);
    if (clamped.spatialIndexMaxEntries != m_config.spatialIndexMaxEntries) {
        m_spatialIndex.setConfig(world::SpatialIndexConfig{clamped.spatialIndexMaxEntries});
        for (const auto& [id, segment] : m_segments.livingEntitiesWithId()) {
            m_spatialIndex.insert(segment->curve.aabb(), id);
        }
    }
    m_config = clamped;
}

void TrackCurveManager::clear() {
    m_segments.clear();
    m_spatialIndex.clear();
    m_persistedDrawData.clear();
    m_sortedDrawData.clear();
    m_trackOrder.clear();
    m_drawDataDirty = true;
}

void TrackCurveManager::emit(TrackEvent event, std::vector<TrackEvent>* outEvents) {
    m_events.notify(event);
    if (outEvents != nullptr) {
        outEvents->push_back(std::move(event));
    }
}

core::SubscriptionToken TrackCurveManager::subscribe(core::EventRegistry<TrackEvent>::Callback callback) {
    return m_events.subscribe(std::move(callback));
}

bool TrackCurveManager::unsubscribe(core::SubscriptionToken token) {
    return m_events.unsubscribe(token);
}

std::vector<SegmentCollision> TrackCurveManager::checkForCollisions(
    const geometry::BezierCurve& curve,
    const std::set<SegmentId>& excludeSegmentsForCollisionCheck,
    bool skipFlat
) const {
    std::vector<SegmentCollision> collisions;
    for (const SegmentId candidate : m_spatialIndex.search(curve.aabb())) {
        if (excludeSegmentsForCollisionCheck.count(candidate) != 0) {
            continue;
        }
        const TrackSegment* segment = m_segments.get(candidate);
        if (segment == nullptr) {
            RY_LOGE("track") << "spatial index returned unknown segment " << candidate;
            continue;
        }
        if (skipFlat && !trackIsSloped(segment->elevation)) {
            continue;
        }
        for (const geometry::CurveIntersection& hit : curve.getCurveIntersections(segment->curve)) {
            collisions.push_back(SegmentCollision{candidate, hit.selfT, hit.otherT});
        }
    }
    std::sort(collisions.begin(), collisions.end(), [](const SegmentCollision& lhs, const SegmentCollision& rhs) {
        return lhs.selfT < rhs.selfT;
    });
    return collisions;
}

std::vector<SplitSlice> TrackCurveManager::computeSplitSlices(
    const geometry::BezierCurve& curve,
    const HeightInterval& heights,
    const std::set<SegmentId>& excludeSegmentsForCollisionCheck,
    std::vector<double>* outSplits
) const {
    const bool skipFlat = !trackIsSloped(heights);
    const std::vector<SegmentCollision> collisions = checkForCollisions(curve, excludeSegmentsForCollisionCheck, skipFlat);

    // Cut halfway between consecutive crossings so every slice holds at most one.
    std::vector<double> splits;
    double previousT = 0.0;
    for (const SegmentCollision& collision : collisions) {
        const double cut = roundSplitParameter((collision.selfT + previousT) * 0.5);
        previousT = collision.selfT;
        if (cut <= 0.0 || cut >= 1.0) {
            continue;
        }
        if (!splits.empty() && cut <= splits.back()) {
            continue;
        }
        splits.push_back(cut);
    }

    const auto sliceAt = [&heights](geometry::BezierCurve piece, double start, double end) {
        return SplitSlice{
            std::move(piece),
            HeightInterval{getElevationAtT(start, heights), getElevationAtT(end, heights)},
            TInterval{start, end}};
    };

    std::vector<SplitSlice> slices;
    if (splits.empty()) {
        slices.push_back(sliceAt(curve, 0.0, 1.0));
    } else {
        slices.push_back(sliceAt(curve.split(splits.front()).first, 0.0, splits.front()));
        for (std::size_t i = 0; i + 1 < splits.size(); ++i) {
            std::array<geometry::BezierCurve, 3> pieces = curve.splitIn3Curves(splits[i], splits[i + 1]);
            slices.push_back(sliceAt(std::move(pieces[1]), splits[i], splits[i + 1]));
        }
        slices.push_back(sliceAt(curve.split(splits.back()).second, splits.back(), 1.0));
    }

    if (outSplits != nullptr) {
        *outSplits = std::move(splits);
    }
    return slices;
}

TrackDrawData TrackCurveManager::makeDrawData(
    SegmentId segment,
    std::uint32_t sliceIndex,
    const SplitSlice& slice,
    const TrackSegment& owner
) {
    TrackDrawData drawData{};
    drawData.key = DrawDataKey{segment, sliceIndex};
    drawData.curve = slice.curve;
    const std::vector<math::Vec2>& controlPoints = owner.curve.controlPoints();
    if (!controlPoints.empty()) {
        drawData.startJointPosition = controlPoints.front();
        drawData.endJointPosition = controlPoints.back();
    }
    drawData.tInterval = slice.tInterval;
    drawData.gauge = owner.gauge;
    drawData.elevation = slice.elevation;
    drawData.originalElevation = toHeightInterval(owner.elevation);
    drawData.excludeSegmentsForCollisionCheck = owner.excludedSegments;
    return drawData;
}

SegmentId TrackCurveManager::createCurveWithJoints(
    const geometry::BezierCurve& curve,
    JointId t0Joint,
    JointId t1Joint,
    Elevation t0Elevation,
    Elevation t1Elevation,
    double gauge,
    const std::set<SegmentId>& excludeSegmentsForCollisionCheck,
    std::vector<TrackEvent>* outEvents
) {
    if (!curve.valid()) {
        RY_LOGD("track") << "rejecting curve with " << curve.controlPoints().size() << " control points";
        return kInvalidSegmentId;
    }

    TrackSegment segment{};
    segment.t0Joint = t0Joint;
    segment.t1Joint = t1Joint;
    segment.curve = curve;
    segment.gauge = gauge;
    segment.elevation = ElevationSpan{t0Elevation, t1Elevation};
    segment.excludedSegments = excludeSegmentsForCollisionCheck;
    segment.positiveOffsets = curve.offsetPoints(gauge * 0.5, kOffsetSamples);
    segment.negativeOffsets = curve.offsetPoints(-gauge * 0.5, kOffsetSamples);
    segment.splitCurves = computeSplitSlices(
        curve,
        toHeightInterval(segment.elevation),
        excludeSegmentsForCollisionCheck,
        &segment.splits);

    const SegmentId id = m_segments.create(std::move(segment));
    // Subscribers may create segments, so nothing may point into m_segments across an emit.
    std::vector<TrackDrawData> pending;
    {
        const TrackSegment& stored = *m_segments.get(id);
        m_spatialIndex.insert(stored.curve.aabb(), id);
        pending.reserve(stored.splitCurves.size());
        for (std::size_t sliceIndex = 0; sliceIndex < stored.splitCurves.size(); ++sliceIndex) {
            pending.push_back(makeDrawData(id, static_cast<std::uint32_t>(sliceIndex), stored.splitCurves[sliceIndex], stored));
        }
    }
    m_drawDataDirty = true;

    emit(SegmentCreated{id}, outEvents);
    for (TrackDrawData& drawData : pending) {
        const std::size_t index = drawDataInsertIndex(m_persistedDrawData, drawData);
        m_persistedDrawData.insert(m_persistedDrawData.begin() + static_cast<std::ptrdiff_t>(index), drawData);
        emit(DrawDataAdded{index, std::move(drawData)}, outEvents);
    }

    RY_LOGD("track") << "created segment " << id << " (" << t0Joint << " -> " << t1Joint << ") with "
                     << pending.size() << " slice(s)";
    return id;
}

bool TrackCurveManager::destroyCurve(SegmentId segmentId, std::vector<TrackEvent>* outEvents) {
    const TrackSegment* segment = m_segments.get(segmentId);
    if (segment == nullptr) {
        RY_LOGD("track") << "destroyCurve: unknown segment " << segmentId;
        return false;
    }
    const std::size_t sliceCount = segment->splitCurves.size();

    if (!m_spatialIndex.removeByValue(segmentId)) {
        RY_LOGE("track") << "segment " << segmentId << " missing from spatial index";
    }
    m_segments.destroy(segmentId);
    m_drawDataDirty = true;

    // The id is recycled later; a stale exclusion would hide real crossings with its next owner.
    for (const SegmentId remaining : m_segments.livingEntities()) {
        m_segments.get(remaining)->excludedSegments.erase(segmentId);
    }
    for (TrackDrawData& drawData : m_persistedDrawData) {
        drawData.excludeSegmentsForCollisionCheck.erase(segmentId);
    }

    std::size_t minIndex = std::numeric_limits<std::size_t>::max();
    for (std::size_t sliceIndex = 0; sliceIndex < sliceCount; ++sliceIndex) {
        const DrawDataKey key{segmentId, static_cast<std::uint32_t>(sliceIndex)};
        const auto it = std::find_if(m_persistedDrawData.begin(), m_persistedDrawData.end(), [&key](const TrackDrawData& drawData) {
            return drawData.key == key;
        });
        if (it == m_persistedDrawData.end()) {
            RY_LOGE("track") << "draw data " << segmentId << ":" << sliceIndex << " missing on destroy";
            continue;
        }
        const std::size_t index = static_cast<std::size_t>(it - m_persistedDrawData.begin());
        minIndex = std::min(minIndex, index);
        m_persistedDrawData.erase(it);
        emit(DrawDataDeleted{key, index}, outEvents);
    }
    emit(SegmentDestroyed{segmentId}, outEvents);

    RY_LOGD("track") << "destroyed segment " << segmentId << ", draw order shifted from " << minIndex;
    return true;
}

const TrackSegment* TrackCurveManager::getTrackSegmentWithJoints(SegmentId segment) const {
    return m_segments.get(segment);
}

const geometry::BezierCurve* TrackCurveManager::getTrackSegment(SegmentId segment) const {
    const TrackSegment* stored = m_segments.get(segment);
    return stored == nullptr ? nullptr : &stored->curve;
}

std::vector<std::pair<SegmentId, const TrackSegment*>> TrackCurveManager::getTrackSegmentsWithJoints() const {
    return m_segments.livingEntitiesWithId();
}

std::vector<SegmentId> TrackCurveManager::segmentsIntersecting(const geometry::Aabb& bounds) const {
    return m_spatialIndex.search(bounds);
}

std::optional<ProjectionCurveResult> TrackCurveManager::projectOnCurve(const math::Vec2& position) const {
    std::optional<ProjectionCurveResult> best;
    double minDistance = m_config.curveHitRadius;
    for (const SegmentId candidate : m_spatialIndex.search(geometry::Aabb::fromPoint(position, m_config.curveHitRadius))) {
        const TrackSegment* segment = m_segments.get(candidate);
        if (segment == nullptr) {
            continue;
        }
        const std::optional<geometry::CurveProjection> projection = segment->curve.getProjection(position);
        if (!projection.has_value() || projection->distance >= minDistance) {
            continue;
        }
        minDistance = projection->distance;
        best = ProjectionCurveResult{
            candidate,
            segment->t0Joint,
            segment->t1Joint,
            projection->t,
            projection->point,
            segment->curve.unitDerivative(projection->t),
            segment->curve.curvature(projection->t),
            segment->elevation};
    }
    return best;
}

std::optional<ProjectionEdgeResult> TrackCurveManager::onTrackSegmentEdge(const math::Vec2& position) const {
    std::optional<ProjectionEdgeResult> best;
    double minDistance = m_config.edgeHitDistance;
    for (const SegmentId candidate : m_spatialIndex.search(geometry::Aabb::fromPoint(position, m_config.edgeSearchRadius))) {
        const TrackSegment* segment = m_segments.get(candidate);
        if (segment == nullptr) {
            continue;
        }
        const std::optional<geometry::CurveProjection> projection = segment->curve.getProjection(position);
        if (!projection.has_value()) {
            continue;
        }
        // Must land on the shoulder: beyond the rails but within reach.
        if (projection->distance >= minDistance || projection->distance <= segment->gauge * 0.5) {
            continue;
        }
        minDistance = projection->distance;

        const math::Vec2 tangent = segment->curve.unitDerivative(projection->t);
        const math::Vec2 towardQuery = math::normalize(position - projection->point);
        math::Vec2 outward = math::perpendicular(tangent);
        if (math::angleFromA2B(tangent, towardQuery) < 0.0) {
            outward = -outward;
        }
        best = ProjectionEdgeResult{
            candidate,
            segment->t0Joint,
            segment->t1Joint,
            projection->t,
            projection->point + (outward * segment->gauge),
            tangent,
            segment->curve.curvature(projection->t)};
    }
    return best;
}

std::vector<PreviewDrawData> TrackCurveManager::getPreviewDrawData(
    const geometry::BezierCurve& curve,
    Elevation fromElevation,
    Elevation toElevation,
    double gauge,
    const std::set<SegmentId>& excludeSegmentsForCollisionCheck
) const {
    std::vector<PreviewDrawData> previews;
    if (!curve.valid()) {
        return previews;
    }

    TrackSegment prospective{};
    prospective.curve = curve;
    prospective.gauge = gauge;
    prospective.elevation = ElevationSpan{fromElevation, toElevation};
    prospective.excludedSegments = excludeSegmentsForCollisionCheck;
    const std::vector<SplitSlice> slices = computeSplitSlices(
        curve,
        toHeightInterval(prospective.elevation),
        excludeSegmentsForCollisionCheck,
        nullptr);

    for (std::size_t sliceIndex = 0; sliceIndex < slices.size(); ++sliceIndex) {
        PreviewDrawData preview{};
        preview.drawData = makeDrawData(kInvalidSegmentId, static_cast<std::uint32_t>(sliceIndex), slices[sliceIndex], prospective);
        preview.index = drawDataInsertIndex(m_persistedDrawData, preview.drawData);
        preview.positiveOffsets = slices[sliceIndex].curve.offsetPoints(gauge * 0.5, kOffsetSamples);
        preview.negativeOffsets = slices[sliceIndex].curve.offsetPoints(-gauge * 0.5, kOffsetSamples);
        previews.push_back(std::move(preview));
    }
    return previews;
}

const std::vector<TrackDrawData>& TrackCurveManager::sortedDrawData() {
    if (!m_drawDataDirty) {
        return m_sortedDrawData;
    }
    m_sortedDrawData.clear();
    for (const auto& [id, segment] : m_segments.livingEntitiesWithId()) {
        for (std::size_t sliceIndex = 0; sliceIndex < segment->splitCurves.size(); ++sliceIndex) {
            m_sortedDrawData.push_back(makeDrawData(id, static_cast<std::uint32_t>(sliceIndex), segment->splitCurves[sliceIndex], *segment));
        }
    }
    sortDrawData(&m_sortedDrawData);
    m_drawDataDirty = false;
    return m_sortedDrawData;
}

std::vector<TrackDrawData> TrackCurveManager::getDrawData(const geometry::Aabb& viewport) {
    std::vector<TrackDrawData> visible;
    for (const TrackDrawData& drawData : sortedDrawData()) {
        if (drawData.curve.aabb().intersects(viewport)) {
            visible.push_back(drawData);
        }
    }
    m_trackOrder.clear();
    for (std::size_t index = 0; index < visible.size(); ++index) {
        m_trackOrder[visible[index].key] = index;
    }
    return visible;
}

std::optional<std::size_t> TrackCurveManager::getTrackOrder(const DrawDataKey& key) const {
    const auto it = m_trackOrder.find(key);
    if (it == m_trackOrder.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace railyard::track
