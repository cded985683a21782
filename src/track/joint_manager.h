#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "core/slot_allocator.h"
#include "track/track_types.h"

// Track JointManager subsystem
// Responsible for: storage and lookup of joints by stable id.
// Should NOT do: adjacency rewiring decisions or segment geometry.
namespace railyard::track {

class JointManager {
public:
    explicit JointManager(std::size_t initialCapacity = 10);

    JointId createJoint(Joint joint);
    bool destroyJoint(JointId id);

    [[nodiscard]] const Joint* getJoint(JointId id) const;
    [[nodiscard]] Joint* getMutableJoint(JointId id);
    [[nodiscard]] std::vector<std::pair<JointId, const Joint*>> getJoints() const;
    [[nodiscard]] std::size_t jointCount() const;

    void clear();

private:
    core::SlotAllocator<Joint> m_joints;
};

} // namespace railyard::track
