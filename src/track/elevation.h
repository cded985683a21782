#pragma once

#include <algorithm>

#include "track/track_types.h"

namespace railyard::track {

inline double getElevationAtT(double t, const HeightInterval& interval) {
    return interval.from + ((interval.to - interval.from) * t);
}

inline HeightInterval toHeightInterval(const ElevationSpan& span) {
    return HeightInterval{elevationHeight(span.from), elevationHeight(span.to)};
}

inline bool trackIsSloped(const HeightInterval& interval) {
    return interval.from != interval.to;
}

inline bool trackIsSloped(const ElevationSpan& span) {
    return span.from != span.to;
}

inline double maxElevation(const HeightInterval& interval) {
    return std::max(interval.from, interval.to);
}

inline bool elevationIntervalOverlaps(const HeightInterval& a, const HeightInterval& b) {
    const double aMin = std::min(a.from, a.to);
    const double aMax = std::max(a.from, a.to);
    const double bMin = std::min(b.from, b.to);
    const double bMax = std::max(b.from, b.to);
    return aMin <= bMax && bMin <= aMax;
}

} // namespace railyard::track
