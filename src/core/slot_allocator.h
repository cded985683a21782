#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <utility>
#include <vector>

// Core SlotAllocator subsystem
// Responsible for: stable integer handles over a packed array with O(1) create/destroy.
// Should NOT do: reference counting, generation tagging, or iteration-order guarantees.
namespace railyard::core {

using SlotId = std::uint32_t;

inline constexpr SlotId kInvalidSlotId = std::numeric_limits<SlotId>::max();

// Live values sit in a packed array; destroying swaps the last live value into the hole.
// Freed ids are recycled first-in first-out, and the id space doubles when exhausted.
template <typename T>
class SlotAllocator {
public:
    explicit SlotAllocator(std::size_t initialCapacity = 10);

    SlotId create(T value);
    bool destroy(SlotId id);

    [[nodiscard]] bool contains(SlotId id) const;
    [[nodiscard]] const T* get(SlotId id) const;
    [[nodiscard]] T* get(SlotId id);

    [[nodiscard]] std::size_t liveCount() const { return m_packed.size(); }
    [[nodiscard]] std::size_t capacity() const { return m_idToPacked.size(); }

    // Packed order, not creation order. Invalidated by the next create/destroy.
    [[nodiscard]] std::vector<SlotId> livingEntities() const { return m_packedToId; }
    [[nodiscard]] std::vector<std::pair<SlotId, const T*>> livingEntitiesWithId() const;

    void clear();

private:
    static constexpr std::size_t kNotLive = std::numeric_limits<std::size_t>::max();

    void grow();

    std::size_t m_initialCapacity;
    std::vector<T> m_packed;
    std::vector<SlotId> m_packedToId;
    std::vector<std::size_t> m_idToPacked;
    std::deque<SlotId> m_freeIds;
};

template <typename T>
SlotAllocator<T>::SlotAllocator(std::size_t initialCapacity)
    : m_initialCapacity(initialCapacity == 0 ? 1 : initialCapacity) {
    clear();
}

template <typename T>
void SlotAllocator<T>::clear() {
    m_packed.clear();
    m_packedToId.clear();
    m_idToPacked.assign(m_initialCapacity, kNotLive);
    m_freeIds.clear();
    for (std::size_t id = 0; id < m_initialCapacity; ++id) {
        m_freeIds.push_back(static_cast<SlotId>(id));
    }
}

template <typename T>
void SlotAllocator<T>::grow() {
    const std::size_t oldCapacity = m_idToPacked.size();
    const std::size_t newCapacity = oldCapacity * 2;
    m_idToPacked.resize(newCapacity, kNotLive);
    for (std::size_t id = oldCapacity; id < newCapacity; ++id) {
        m_freeIds.push_back(static_cast<SlotId>(id));
    }
}

template <typename T>
SlotId SlotAllocator<T>::create(T value) {
    if (m_freeIds.empty()) {
        grow();
    }
    const SlotId id = m_freeIds.front();
    m_freeIds.pop_front();

    m_idToPacked[id] = m_packed.size();
    m_packed.push_back(std::move(value));
    m_packedToId.push_back(id);
    return id;
}

template <typename T>
bool SlotAllocator<T>::destroy(SlotId id) {
    if (!contains(id)) {
        return false;
    }
    const std::size_t hole = m_idToPacked[id];
    const std::size_t last = m_packed.size() - 1;
    if (hole != last) {
        const SlotId movedId = m_packedToId[last];
        m_packed[hole] = std::move(m_packed[last]);
        m_packedToId[hole] = movedId;
        m_idToPacked[movedId] = hole;
    }
    m_packed.pop_back();
    m_packedToId.pop_back();
    m_idToPacked[id] = kNotLive;
    m_freeIds.push_back(id);
    return true;
}

template <typename T>
bool SlotAllocator<T>::contains(SlotId id) const {
    return id < m_idToPacked.size() && m_idToPacked[id] != kNotLive;
}

template <typename T>
const T* SlotAllocator<T>::get(SlotId id) const {
    if (!contains(id)) {
        return nullptr;
    }
    return &m_packed[m_idToPacked[id]];
}

template <typename T>
T* SlotAllocator<T>::get(SlotId id) {
    if (!contains(id)) {
        return nullptr;
    }
    return &m_packed[m_idToPacked[id]];
}

template <typename T>
std::vector<std::pair<SlotId, const T*>> SlotAllocator<T>::livingEntitiesWithId() const {
    std::vector<std::pair<SlotId, const T*>> result;
    result.reserve(m_packed.size());
    for (std::size_t packedIndex = 0; packedIndex < m_packed.size(); ++packedIndex) {
        result.emplace_back(m_packedToId[packedIndex], &m_packed[packedIndex]);
    }
    return result;
}

} // namespace railyard::core
