#pragma once

#include <cstddef>
#include <variant>

#include "track/track_types.h"

// Track events
// Responsible for: the notifications a track mutation emits, in emission order.
// Should NOT do: dispatch policy (see core/event_registry.h) or rendering.
namespace railyard::track {

struct DrawDataAdded {
    // Position in the persisted draw-order list at insertion time.
    std::size_t index = 0;
    TrackDrawData drawData;
};

struct DrawDataDeleted {
    DrawDataKey key{};
    std::size_t index = 0;
};

struct SegmentCreated {
    SegmentId segment = kInvalidSegmentId;
};

struct SegmentDestroyed {
    SegmentId segment = kInvalidSegmentId;
};

using TrackEvent = std::variant<DrawDataAdded, DrawDataDeleted, SegmentCreated, SegmentDestroyed>;

} // namespace railyard::track
