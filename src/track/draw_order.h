#pragma once

#include <cstddef>
#include <vector>

#include "track/track_types.h"

// Track DrawOrder subsystem
// Responsible for: painter's ordering of track slices so grade-separated crossings layer correctly.
// Should NOT do: viewport culling, rendering, or owning draw data.
namespace railyard::track {

// Negative when a must be drawn before b, positive when after, zero when either order is fine.
// Not a strict weak ordering; only use it through the insertion helpers below.
[[nodiscard]] double compareDrawOrder(const TrackDrawData& a, const TrackDrawData& b);

// Binary search for the slot after every element that does not draw after item.
[[nodiscard]] std::size_t drawDataInsertIndex(const std::vector<TrackDrawData>& sorted, const TrackDrawData& item);

// Rebuilds the order from scratch by repeated binary insertion.
void sortDrawData(std::vector<TrackDrawData>* drawData);

} // namespace railyard::track
