#pragma once

#include <cmath>
#include <iosfwd>

namespace iml
{
    // a 2D point, or displacement, in pixels
    //
    // image-space and canvas-space both use this type: X grows rightwards and Y
    // grows downwards
    struct Vec2 final {
        constexpr Vec2() = default;
        constexpr Vec2(double x_, double y_) : x{x_}, y{y_} {}

        friend constexpr bool operator==(const Vec2&, const Vec2&) = default;

        constexpr Vec2& operator+=(const Vec2& rhs) { x += rhs.x; y += rhs.y; return *this; }
        constexpr Vec2& operator-=(const Vec2& rhs) { x -= rhs.x; y -= rhs.y; return *this; }
        constexpr Vec2& operator*=(double s) { x *= s; y *= s; return *this; }
        constexpr Vec2& operator/=(double s) { x /= s; y /= s; return *this; }

        double x = 0.0;
        double y = 0.0;
    };

    constexpr Vec2 operator+(Vec2 lhs, const Vec2& rhs) { return lhs += rhs; }
    constexpr Vec2 operator-(Vec2 lhs, const Vec2& rhs) { return lhs -= rhs; }
    constexpr Vec2 operator-(const Vec2& v) { return {-v.x, -v.y}; }
    constexpr Vec2 operator*(Vec2 v, double s) { return v *= s; }
    constexpr Vec2 operator*(double s, Vec2 v) { return v *= s; }
    constexpr Vec2 operator/(Vec2 v, double s) { return v /= s; }

    constexpr double dot(const Vec2& a, const Vec2& b) { return a.x*b.x + a.y*b.y; }

    // returns the z component of the 3D cross product of `a` and `b`
    constexpr double cross(const Vec2& a, const Vec2& b) { return a.x*b.y - a.y*b.x; }

    constexpr double length2(const Vec2& v) { return dot(v, v); }
    inline double length(const Vec2& v) { return std::hypot(v.x, v.y); }
    inline double distance(const Vec2& a, const Vec2& b) { return length(b - a); }

    constexpr Vec2 elementwise_min(const Vec2& a, const Vec2& b)
    {
        return {a.x < b.x ? a.x : b.x, a.y < b.y ? a.y : b.y};
    }

    constexpr Vec2 elementwise_max(const Vec2& a, const Vec2& b)
    {
        return {a.x > b.x ? a.x : b.x, a.y > b.y ? a.y : b.y};
    }

    inline bool is_finite(const Vec2& v) { return std::isfinite(v.x) and std::isfinite(v.y); }

    constexpr Vec2 midpoint(const Vec2& a, const Vec2& b) { return {0.5*(a.x + b.x), 0.5*(a.y + b.y)}; }

    std::ostream& operator<<(std::ostream&, const Vec2&);
}
