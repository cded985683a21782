#pragma once

#include <algorithm>
#include <cstdint>

#include "track/track_types.h"

namespace railyard::track {

struct TrackGraphConfig {
    // Hit-test radii in world units.
    double jointHitRadius = 1.0;
    double curveHitRadius = 1.0;
    double edgeSearchRadius = 10.0;
    double edgeHitDistance = 2.0;
    double defaultGauge = kDefaultGauge;
    std::uint32_t initialCapacity = 10;
    std::uint32_t spatialIndexMaxEntries = 4;
};

inline TrackGraphConfig clampTrackGraphConfig(const TrackGraphConfig& config) {
    TrackGraphConfig clamped = config;
    clamped.jointHitRadius = std::clamp(clamped.jointHitRadius, 0.01, 100.0);
    clamped.curveHitRadius = std::clamp(clamped.curveHitRadius, 0.01, 100.0);
    clamped.edgeSearchRadius = std::clamp(clamped.edgeSearchRadius, 0.01, 100.0);
    clamped.edgeHitDistance = std::clamp(clamped.edgeHitDistance, 0.01, 100.0);
    clamped.defaultGauge = std::clamp(clamped.defaultGauge, 0.1, 10.0);
    clamped.initialCapacity = std::clamp<std::uint32_t>(clamped.initialCapacity, 1u, 65536u);
    clamped.spatialIndexMaxEntries = std::clamp<std::uint32_t>(clamped.spatialIndexMaxEntries, 2u, 64u);
    return clamped;
}

} // namespace railyard::track
