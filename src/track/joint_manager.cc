#include "track/joint_manager.h"

namespace railyard::track {

JointManager::JointManager(std::size_t initialCapacity)
    : m_joints(initialCapacity) {}

JointId JointManager::createJoint(Joint joint) {
    joint.tangent = math::normalize(joint.tangent);
    return m_joints.create(std::move(joint));
}

bool JointManager::destroyJoint(JointId id) {
    return m_joints.destroy(id);
}

const Joint* JointManager::getJoint(JointId id) const {
    return m_joints.get(id);
}

Joint* JointManager::getMutableJoint(JointId id) {
    return m_joints.get(id);
}

std::vector<std::pair<JointId, const Joint*>> JointManager::getJoints() const {
    return m_joints.livingEntitiesWithId();
}

std::size_t JointManager::jointCount() const {
    return m_joints.liveCount();
}

void JointManager::clear() {
    m_joints.clear();
}

} // namespace railyard::track
