#include "track/draw_order.h"

#include <cmath>
#include <utility>

#include "core/log.h"
#include "track/elevation.h"

namespace railyard::track {

double compareDrawOrder(const TrackDrawData& a, const TrackDrawData& b) {
    // Neighbouring slices only touch at their shared cut.
    if (a.key.segment == b.key.segment) {
        return static_cast<double>(a.key.sliceIndex) - static_cast<double>(b.key.sliceIndex);
    }
    if (!trackIsSloped(a.elevation) && !trackIsSloped(b.elevation)) {
        return a.elevation.from - b.elevation.from;
    }

    const double aMax = maxElevation(a.elevation);
    const double bMax = maxElevation(b.elevation);
    if (!elevationIntervalOverlaps(a.elevation, b.elevation)) {
        return aMax - bMax;
    }
    if (a.excludeSegmentsForCollisionCheck.count(b.key.segment) != 0 ||
        b.excludeSegmentsForCollisionCheck.count(a.key.segment) != 0) {
        return 0.0;
    }
    if (!a.curve.aabb().intersects(b.curve.aabb())) {
        return aMax - bMax;
    }

    const std::vector<geometry::CurveIntersection> crossings = a.curve.getCurveIntersections(b.curve);
    if (crossings.empty()) {
        return aMax - bMax;
    }

    // With several crossings the one with the largest height gap decides.
    double decisive = 0.0;
    for (const geometry::CurveIntersection& crossing : crossings) {
        const double gap = getElevationAtT(crossing.selfT, a.elevation) - getElevationAtT(crossing.otherT, b.elevation);
        if (std::abs(gap) > std::abs(decisive)) {
            decisive = gap;
        }
    }
    if (crossings.size() > 1) {
        RY_LOGW("draw") << "slices " << a.key.segment << ":" << a.key.sliceIndex << " and "
                        << b.key.segment << ":" << b.key.sliceIndex << " cross " << crossings.size()
                        << " times; ordering by the largest height gap " << decisive;
    }
    return decisive;
}

std::size_t drawDataInsertIndex(const std::vector<TrackDrawData>& sorted, const TrackDrawData& item) {
    std::size_t low = 0;
    std::size_t high = sorted.size();
    while (low < high) {
        const std::size_t mid = low + ((high - low) / 2);
        if (compareDrawOrder(sorted[mid], item) <= 0.0) {
            low = mid + 1;
        } else {
            high = mid;
        }
    }
    return low;
}

void sortDrawData(std::vector<TrackDrawData>* drawData) {
    std::vector<TrackDrawData> sorted;
    sorted.reserve(drawData->size());
    for (TrackDrawData& item : *drawData) {
        const std::size_t index = drawDataInsertIndex(sorted, item);
        sorted.insert(sorted.begin() + static_cast<std::ptrdiff_t>(index), std::move(item));
    }
    *drawData = std::move(sorted);
}

} // namespace railyard::track
