#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "geometry/aabb.h"

// World SpatialIndex subsystem
// Responsible for: dynamic R-tree broad-phase lookup from bounding boxes to track segment ids.
// Should NOT do: owning curve geometry, exact hit-testing, or draw ordering.
namespace railyard::world {

using SpatialValue = std::uint32_t;

struct SpatialIndexConfig {
    std::uint32_t maxEntries = 4;
};

struct SpatialQueryStats {
    std::uint32_t visitedNodeCount = 0;
    std::uint32_t candidateCount = 0;
};

class SegmentSpatialIndex {
public:
    SegmentSpatialIndex();
    explicit SegmentSpatialIndex(const SpatialIndexConfig& config);

    // Drops every entry when the effective node capacity changes.
    void setConfig(const SpatialIndexConfig& config);
    [[nodiscard]] const SpatialIndexConfig& config() const { return m_config; }
    [[nodiscard]] std::uint32_t minEntries() const { return (m_config.maxEntries + 1) / 2; }

    void clear();
    // A value already present is moved to the new bounds.
    void insert(const geometry::Aabb& bounds, SpatialValue value);
    bool removeByValue(SpatialValue value);

    // Values whose bounds intersect the query box (closed intervals).
    [[nodiscard]] std::vector<SpatialValue> search(
        const geometry::Aabb& query,
        SpatialQueryStats* outStats = nullptr
    ) const;
    [[nodiscard]] std::vector<SpatialValue> getAllObjects() const;

    [[nodiscard]] std::size_t size() const { return m_boundsByValue.size(); }
    [[nodiscard]] bool contains(SpatialValue value) const { return m_boundsByValue.count(value) != 0; }
    [[nodiscard]] std::uint32_t height() const;

private:
    struct Entry {
        geometry::Aabb bounds{};
        SpatialValue value = 0;
    };

    struct Node {
        geometry::Aabb bounds{};
        bool leaf = true;
        std::vector<Entry> entries;
        std::vector<std::unique_ptr<Node>> children;

        [[nodiscard]] std::size_t count() const { return leaf ? entries.size() : children.size(); }
    };

    std::unique_ptr<Node> insertEntry(Node& node, const Entry& entry);
    bool removeEntry(Node& node, const Entry& entry, std::vector<Entry>* outOrphans);
    void insertFromRoot(const Entry& entry);
    void searchNode(const Node& node, const geometry::Aabb& query, std::vector<SpatialValue>* outValues, SpatialQueryStats* outStats) const;
    std::unique_ptr<Node> splitNode(Node& node) const;

    static void refreshBounds(Node& node);
    static void collectEntries(const Node& node, std::vector<Entry>* outEntries);

    SpatialIndexConfig m_config{};
    std::unique_ptr<Node> m_root;
    std::unordered_map<SpatialValue, geometry::Aabb> m_boundsByValue;
};

} // namespace railyard::world
