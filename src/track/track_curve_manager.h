#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "core/event_registry.h"
#include "core/slot_allocator.h"
#include "geometry/aabb.h"
#include "geometry/bezier_curve.h"
#include "track/track_config.h"
#include "track/track_events.h"
#include "track/track_types.h"
#include "world/spatial_index.h"

// Track TrackCurveManager subsystem
// Responsible for: segment storage, collision splitting on insert, spatial lookup, and incremental draw order.
// Should NOT do: joint adjacency rewiring, train motion, or rendering.
namespace railyard::track {

struct SegmentCollision {
    SegmentId segment = kInvalidSegmentId;
    // Parameter on the curve being tested.
    double selfT = 0.0;
    // Parameter on the stored segment.
    double otherT = 0.0;
};

class TrackCurveManager {
public:
    explicit TrackCurveManager(const TrackGraphConfig& config = TrackGraphConfig{});

    void setConfig(const TrackGraphConfig& config);
    [[nodiscard]] const TrackGraphConfig& config() const { return m_config; }

    // Stores the curve, splitting it at crossings with non-excluded segments. A ramp is split at
    // every crossing; a flat curve only where it crosses a ramp.
    SegmentId createCurveWithJoints(
        const geometry::BezierCurve& curve,
        JointId t0Joint,
        JointId t1Joint,
        Elevation t0Elevation,
        Elevation t1Elevation,
        double gauge = kDefaultGauge,
        const std::set<SegmentId>& excludeSegmentsForCollisionCheck = {},
        std::vector<TrackEvent>* outEvents = nullptr
    );
    bool destroyCurve(SegmentId segment, std::vector<TrackEvent>* outEvents = nullptr);

    [[nodiscard]] const TrackSegment* getTrackSegmentWithJoints(SegmentId segment) const;
    [[nodiscard]] const geometry::BezierCurve* getTrackSegment(SegmentId segment) const;
    [[nodiscard]] std::vector<std::pair<SegmentId, const TrackSegment*>> getTrackSegmentsWithJoints() const;
    [[nodiscard]] std::size_t segmentCount() const { return m_segments.liveCount(); }

    [[nodiscard]] std::vector<SegmentCollision> checkForCollisions(
        const geometry::BezierCurve& curve,
        const std::set<SegmentId>& excludeSegmentsForCollisionCheck,
        bool skipFlat
    ) const;

    [[nodiscard]] std::optional<ProjectionCurveResult> projectOnCurve(const math::Vec2& position) const;
    [[nodiscard]] std::optional<ProjectionEdgeResult> onTrackSegmentEdge(const math::Vec2& position) const;
    [[nodiscard]] std::vector<SegmentId> segmentsIntersecting(const geometry::Aabb& bounds) const;

    // Slices a prospective curve would produce and where each would land in the persisted order.
    [[nodiscard]] std::vector<PreviewDrawData> getPreviewDrawData(
        const geometry::BezierCurve& curve,
        Elevation fromElevation,
        Elevation toElevation,
        double gauge,
        const std::set<SegmentId>& excludeSegmentsForCollisionCheck
    ) const;

    // Incrementally maintained painter's order.
    [[nodiscard]] const std::vector<TrackDrawData>& persistedDrawData() const { return m_persistedDrawData; }
    // Full rebuild of the painter's order, cached until the next mutation.
    [[nodiscard]] const std::vector<TrackDrawData>& sortedDrawData();
    // Sorted slices intersecting the viewport; records each slice's position for getTrackOrder.
    [[nodiscard]] std::vector<TrackDrawData> getDrawData(const geometry::Aabb& viewport);
    [[nodiscard]] std::optional<std::size_t> getTrackOrder(const DrawDataKey& key) const;

    core::SubscriptionToken subscribe(core::EventRegistry<TrackEvent>::Callback callback);
    bool unsubscribe(core::SubscriptionToken token);

    void clear();

private:
    [[nodiscard]] std::vector<SplitSlice> computeSplitSlices(
        const geometry::BezierCurve& curve,
        const HeightInterval& heights,
        const std::set<SegmentId>& excludeSegmentsForCollisionCheck,
        std::vector<double>* outSplits
    ) const;
    [[nodiscard]] static TrackDrawData makeDrawData(
        SegmentId segment,
        std::uint32_t sliceIndex,
        const SplitSlice& slice,
        const TrackSegment& owner
    );
    void emit(TrackEvent event, std::vector<TrackEvent>* outEvents);

    TrackGraphConfig m_config{};
    core::SlotAllocator<TrackSegment> m_segments;
    world::SegmentSpatialIndex m_spatialIndex;
    std::vector<TrackDrawData> m_persistedDrawData;
    std::vector<TrackDrawData> m_sortedDrawData;
    bool m_drawDataDirty = true;
    std::map<DrawDataKey, std::size_t> m_trackOrder;
    core::EventRegistry<TrackEvent> m_events;
};

} // namespace railyard::track
