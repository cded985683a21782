#pragma once

#include <cmath>

// Math subsystem
// Responsible for: planar vector math shared by curves, the track graph, and trains.
// Should NOT do: curve evaluation, projection, or anything that knows about joints.
namespace railyard::math {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kTwoPi = 2.0 * kPi;
inline constexpr double kDefaultEpsilon = 1e-6;

inline double radians(double degreesValue) {
    return degreesValue * (kPi / 180.0);
}

inline double degrees(double radiansValue) {
    return radiansValue * (180.0 / kPi);
}

inline bool approximately(double a, double b, double epsilon = kDefaultEpsilon) {
    return std::abs(a - b) <= epsilon;
}

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double xIn, double yIn) : x(xIn), y(yIn) {}

    constexpr Vec2 operator+(const Vec2& rhs) const { return Vec2{x + rhs.x, y + rhs.y}; }
    constexpr Vec2 operator-(const Vec2& rhs) const { return Vec2{x - rhs.x, y - rhs.y}; }
    constexpr Vec2 operator-() const { return Vec2{-x, -y}; }
    constexpr Vec2 operator*(double scalar) const { return Vec2{x * scalar, y * scalar}; }
    constexpr Vec2 operator/(double scalar) const { return Vec2{x / scalar, y / scalar}; }

    Vec2& operator+=(const Vec2& rhs) {
        x += rhs.x;
        y += rhs.y;
        return *this;
    }

    Vec2& operator-=(const Vec2& rhs) {
        x -= rhs.x;
        y -= rhs.y;
        return *this;
    }

    Vec2& operator*=(double scalar) {
        x *= scalar;
        y *= scalar;
        return *this;
    }

    constexpr bool operator==(const Vec2&) const = default;
};

inline constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

inline constexpr double dot(const Vec2& a, const Vec2& b) {
    return (a.x * b.x) + (a.y * b.y);
}

// z component of the 3D cross product; positive when b is counter-clockwise of a.
inline constexpr double cross(const Vec2& a, const Vec2& b) {
    return (a.x * b.y) - (a.y * b.x);
}

inline constexpr double lengthSquared(const Vec2& v) {
    return dot(v, v);
}

inline double length(const Vec2& v) {
    return std::sqrt(lengthSquared(v));
}

inline double distance(const Vec2& a, const Vec2& b) {
    return length(b - a);
}

inline Vec2 normalize(const Vec2& v) {
    const double len = length(v);
    if (len <= 0.0) {
        return Vec2{};
    }
    return v / len;
}

inline constexpr Vec2 lerp(const Vec2& a, const Vec2& b, double t) {
    return a + ((b - a) * t);
}

// Left-hand normal: (1, 0) maps to (0, 1).
inline constexpr Vec2 perpendicular(const Vec2& v) {
    return Vec2{-v.y, v.x};
}

inline bool approximately(const Vec2& a, const Vec2& b, double epsilon = kDefaultEpsilon) {
    return approximately(a.x, b.x, epsilon) && approximately(a.y, b.y, epsilon);
}

// Signed angle rotating a onto b, in (-pi, pi].
inline double angleFromA2B(const Vec2& a, const Vec2& b) {
    return std::atan2(cross(a, b), dot(a, b));
}

inline double normalizeAngleZeroToTwoPi(double angle) {
    double result = std::fmod(angle, kTwoPi);
    if (result < 0.0) {
        result += kTwoPi;
    }
    return result;
}

// True when the two directions are less than 90 degrees apart.
inline bool sameDirection(const Vec2& a, const Vec2& b) {
    return dot(a, b) > 0.0;
}

} // namespace railyard::math
