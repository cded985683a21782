#pragma once

#include <algorithm>

#include "math/math.h"

// Geometry Aabb subsystem
// Responsible for: closed axis-aligned rectangles used for broad-phase tests.
// Should NOT do: curve math or spatial indexing policy.
namespace railyard::geometry {

struct Aabb {
    math::Vec2 min{};
    math::Vec2 max{};

    static constexpr Aabb fromPoint(const math::Vec2& point, double halfExtent) {
        return Aabb{
            math::Vec2{point.x - halfExtent, point.y - halfExtent},
            math::Vec2{point.x + halfExtent, point.y + halfExtent}};
    }

    [[nodiscard]] constexpr double width() const { return max.x - min.x; }
    [[nodiscard]] constexpr double height() const { return max.y - min.y; }
    [[nodiscard]] constexpr double area() const { return width() * height(); }

    // Closed intervals: touching boxes intersect.
    [[nodiscard]] constexpr bool intersects(const Aabb& other) const {
        return min.x <= other.max.x && max.x >= other.min.x &&
               min.y <= other.max.y && max.y >= other.min.y;
    }

    [[nodiscard]] constexpr bool contains(const Aabb& other) const {
        return min.x <= other.min.x && max.x >= other.max.x &&
               min.y <= other.min.y && max.y >= other.max.y;
    }

    [[nodiscard]] constexpr Aabb merged(const Aabb& other) const {
        return Aabb{
            math::Vec2{std::min(min.x, other.min.x), std::min(min.y, other.min.y)},
            math::Vec2{std::max(max.x, other.max.x), std::max(max.y, other.max.y)}};
    }

    [[nodiscard]] constexpr double expansionArea(const Aabb& other) const {
        return merged(other).area() - area();
    }

    [[nodiscard]] constexpr Aabb expanded(double margin) const {
        return Aabb{
            math::Vec2{min.x - margin, min.y - margin},
            math::Vec2{max.x + margin, max.y + margin}};
    }

    constexpr bool operator==(const Aabb&) const = default;
};

} // namespace railyard::geometry
