#include "world/spatial_index.h"

#include <algorithm>
#include <limits>
#include <utility>

#include "core/log.h"

namespace railyard::world {
namespace {

constexpr std::uint32_t kMinMaxEntries = 2;
constexpr std::uint32_t kMaxMaxEntries = 64;

template <typename Item, typename BoundsFn>
std::pair<std::vector<Item>, std::vector<Item>> splitGroups(
    std::vector<Item> items,
    BoundsFn boundsOf,
    std::size_t minCount
) {
    std::size_t seedA = 0;
    std::size_t seedB = 1;
    double worstWaste = -std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < items.size(); ++i) {
        for (std::size_t j = i + 1; j < items.size(); ++j) {
            const geometry::Aabb& a = boundsOf(items[i]);
            const geometry::Aabb& b = boundsOf(items[j]);
            const double waste = a.merged(b).area() - a.area() - b.area();
            if (waste > worstWaste) {
                worstWaste = waste;
                seedA = i;
                seedB = j;
            }
        }
    }

    std::vector<Item> groupA;
    std::vector<Item> groupB;
    geometry::Aabb boundsA = boundsOf(items[seedA]);
    geometry::Aabb boundsB = boundsOf(items[seedB]);
    groupA.push_back(std::move(items[seedA]));
    groupB.push_back(std::move(items[seedB]));

    std::size_t remaining = items.size() - 2;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i == seedA || i == seedB) {
            continue;
        }
        const geometry::Aabb itemBounds = boundsOf(items[i]);
        bool toA = false;
        if (groupA.size() + remaining <= minCount) {
            toA = true;
        } else if (groupB.size() + remaining <= minCount) {
            toA = false;
        } else {
            const double growthA = boundsA.expansionArea(itemBounds);
            const double growthB = boundsB.expansionArea(itemBounds);
            if (growthA != growthB) {
                toA = growthA < growthB;
            } else if (boundsA.area() != boundsB.area()) {
                toA = boundsA.area() < boundsB.area();
            } else {
                toA = groupA.size() <= groupB.size();
            }
        }
        if (toA) {
            boundsA = boundsA.merged(itemBounds);
            groupA.push_back(std::move(items[i]));
        } else {
            boundsB = boundsB.merged(itemBounds);
            groupB.push_back(std::move(items[i]));
        }
        --remaining;
    }
    return {std::move(groupA), std::move(groupB)};
}

} // namespace

SegmentSpatialIndex::SegmentSpatialIndex()
    : SegmentSpatialIndex(SpatialIndexConfig{}) {}

SegmentSpatialIndex::SegmentSpatialIndex(const SpatialIndexConfig& config) {
    m_config.maxEntries = std::clamp<std::uint32_t>(config.maxEntries, kMinMaxEntries, kMaxMaxEntries);
    clear();
}

void SegmentSpatialIndex::setConfig(const SpatialIndexConfig& config) {
    SpatialIndexConfig clamped = config;
    clamped.maxEntries = std::clamp<std::uint32_t>(clamped.maxEntries, kMinMaxEntries, kMaxMaxEntries);
    if (clamped.maxEntries == m_config.maxEntries) {
        return;
    }
    m_config = clamped;
    clear();
}

void SegmentSpatialIndex::clear() {
    m_root = std::make_unique<Node>();
    m_boundsByValue.clear();
}

std::uint32_t SegmentSpatialIndex::height() const {
    std::uint32_t levels = 1;
    const Node* node = m_root.get();
    while (!node->leaf && !node->children.empty()) {
        node = node->children.front().get();
        ++levels;
    }
    return levels;
}

void SegmentSpatialIndex::refreshBounds(Node& node) {
    bool first = true;
    const auto include = [&](const geometry::Aabb& bounds) {
        node.bounds = first ? bounds : node.bounds.merged(bounds);
        first = false;
    };
    if (node.leaf) {
        for (const Entry& entry : node.entries) {
            include(entry.bounds);
        }
    } else {
        for (const std::unique_ptr<Node>& child : node.children) {
            include(child->bounds);
        }
    }
    if (first) {
        node.bounds = geometry::Aabb{};
    }
}

void SegmentSpatialIndex::collectEntries(const Node& node, std::vector<Entry>* outEntries) {
    if (node.leaf) {
        outEntries->insert(outEntries->end(), node.entries.begin(), node.entries.end());
        return;
    }
    for (const std::unique_ptr<Node>& child : node.children) {
        collectEntries(*child, outEntries);
    }
}

std::unique_ptr<SegmentSpatialIndex::Node> SegmentSpatialIndex::splitNode(Node& node) const {
    auto sibling = std::make_unique<Node>();
    sibling->leaf = node.leaf;
    const std::size_t minCount = minEntries();
    if (node.leaf) {
        auto [keep, moved] = splitGroups(
            std::move(node.entries),
            [](const Entry& entry) -> const geometry::Aabb& { return entry.bounds; },
            minCount);
        node.entries = std::move(keep);
        sibling->entries = std::move(moved);
    } else {
        auto [keep, moved] = splitGroups(
            std::move(node.children),
            [](const std::unique_ptr<Node>& child) -> const geometry::Aabb& { return child->bounds; },
            minCount);
        node.children = std::move(keep);
        sibling->children = std::move(moved);
    }
    refreshBounds(node);
    refreshBounds(*sibling);
    return sibling;
}

std::unique_ptr<SegmentSpatialIndex::Node> SegmentSpatialIndex::insertEntry(Node& node, const Entry& entry) {
    if (node.leaf) {
        node.entries.push_back(entry);
        refreshBounds(node);
        if (node.entries.size() > m_config.maxEntries) {
            return splitNode(node);
        }
        return nullptr;
    }

    // Least area enlargement, ties to the smaller child.
    std::size_t chosen = 0;
    double bestGrowth = std::numeric_limits<double>::max();
    double bestArea = std::numeric_limits<double>::max();
    for (std::size_t i = 0; i < node.children.size(); ++i) {
        const geometry::Aabb& childBounds = node.children[i]->bounds;
        const double growth = childBounds.expansionArea(entry.bounds);
        const double area = childBounds.area();
        if (growth < bestGrowth || (growth == bestGrowth && area < bestArea)) {
            bestGrowth = growth;
            bestArea = area;
            chosen = i;
        }
    }

    std::unique_ptr<Node> childSibling = insertEntry(*node.children[chosen], entry);
    if (childSibling != nullptr) {
        node.children.push_back(std::move(childSibling));
    }
    refreshBounds(node);
    if (node.children.size() > m_config.maxEntries) {
        return splitNode(node);
    }
    return nullptr;
}

void SegmentSpatialIndex::insertFromRoot(const Entry& entry) {
    std::unique_ptr<Node> sibling = insertEntry(*m_root, entry);
    if (sibling == nullptr) {
        return;
    }
    auto newRoot = std::make_unique<Node>();
    newRoot->leaf = false;
    newRoot->children.push_back(std::move(m_root));
    newRoot->children.push_back(std::move(sibling));
    refreshBounds(*newRoot);
    m_root = std::move(newRoot);
}

void SegmentSpatialIndex::insert(const geometry::Aabb& bounds, SpatialValue value) {
    if (contains(value)) {
        removeByValue(value);
    }
    m_boundsByValue[value] = bounds;
    insertFromRoot(Entry{bounds, value});
}

bool SegmentSpatialIndex::removeEntry(Node& node, const Entry& entry, std::vector<Entry>* outOrphans) {
    if (node.leaf) {
        const auto it = std::find_if(node.entries.begin(), node.entries.end(), [&entry](const Entry& candidate) {
            return candidate.value == entry.value;
        });
        if (it == node.entries.end()) {
            return false;
        }
        node.entries.erase(it);
        refreshBounds(node);
        return true;
    }

    for (std::size_t i = 0; i < node.children.size(); ++i) {
        Node& child = *node.children[i];
        if (!child.bounds.contains(entry.bounds)) {
            continue;
        }
        if (!removeEntry(child, entry, outOrphans)) {
            continue;
        }
        if (child.count() < minEntries()) {
            collectEntries(child, outOrphans);
            node.children.erase(node.children.begin() + static_cast<std::ptrdiff_t>(i));
        }
        refreshBounds(node);
        return true;
    }
    return false;
}

bool SegmentSpatialIndex::removeByValue(SpatialValue value) {
    const auto found = m_boundsByValue.find(value);
    if (found == m_boundsByValue.end()) {
        return false;
    }
    const Entry target{found->second, value};
    std::vector<Entry> orphans;
    if (!removeEntry(*m_root, target, &orphans)) {
        RY_LOGE("index") << "segment " << value << " registered but missing from the tree";
        m_boundsByValue.erase(found);
        return false;
    }
    m_boundsByValue.erase(found);

    while (!m_root->leaf && m_root->children.size() == 1) {
        std::unique_ptr<Node> onlyChild = std::move(m_root->children.front());
        m_root = std::move(onlyChild);
    }
    if (!m_root->leaf && m_root->children.empty()) {
        m_root = std::make_unique<Node>();
    }

    for (const Entry& orphan : orphans) {
        insertFromRoot(orphan);
    }
    return true;
}

void SegmentSpatialIndex::searchNode(
    const Node& node,
    const geometry::Aabb& query,
    std::vector<SpatialValue>* outValues,
    SpatialQueryStats* outStats
) const {
    if (outStats != nullptr) {
        ++outStats->visitedNodeCount;
    }
    if (node.leaf) {
        for (const Entry& entry : node.entries) {
            if (entry.bounds.intersects(query)) {
                outValues->push_back(entry.value);
            }
        }
        return;
    }
    for (const std::unique_ptr<Node>& child : node.children) {
        if (child->bounds.intersects(query)) {
            searchNode(*child, query, outValues, outStats);
        }
    }
}

std::vector<SpatialValue> SegmentSpatialIndex::search(const geometry::Aabb& query, SpatialQueryStats* outStats) const {
    std::vector<SpatialValue> result;
    if (outStats != nullptr) {
        *outStats = SpatialQueryStats{};
    }
    if (m_root->count() != 0) {
        searchNode(*m_root, query, &result, outStats);
    }
    if (outStats != nullptr) {
        outStats->candidateCount = static_cast<std::uint32_t>(result.size());
    }
    return result;
}

std::vector<SpatialValue> SegmentSpatialIndex::getAllObjects() const {
    std::vector<Entry> entries;
    entries.reserve(m_boundsByValue.size());
    collectEntries(*m_root, &entries);
    std::vector<SpatialValue> result;
    result.reserve(entries.size());
    for (const Entry& entry : entries) {
        result.push_back(entry.value);
    }
    return result;
}

} // namespace railyard::world
