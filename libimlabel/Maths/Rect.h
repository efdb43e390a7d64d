#pragma once

#include <libimlabel/Maths/Vec2.h>

#include <cstddef>
#include <iosfwd>
#include <stdexcept>

namespace iml
{
    // an axis-aligned rectangle in 2D space
    //
    // always normalized: `p1()` is the top-left (minimum) corner and `p2()` is the
    // bottom-right (maximum) corner, regardless of the order in which corners
    // were provided
    class Rect final {
    public:
        static constexpr Rect from_corners(const Vec2& a, const Vec2& b)
        {
            return Rect{elementwise_min(a, b), elementwise_max(a, b)};
        }

        static constexpr Rect from_point(const Vec2& p)
        {
            return Rect{p, p};
        }

        constexpr Rect() = default;

        friend constexpr bool operator==(const Rect&, const Rect&) = default;

        constexpr const Vec2& p1() const { return p1_; }
        constexpr const Vec2& p2() const { return p2_; }

        constexpr double left() const { return p1_.x; }
        constexpr double top() const { return p1_.y; }
        constexpr double right() const { return p2_.x; }
        constexpr double bottom() const { return p2_.y; }

        constexpr double width() const { return p2_.x - p1_.x; }
        constexpr double height() const { return p2_.y - p1_.y; }
        constexpr Vec2 dimensions() const { return p2_ - p1_; }
        constexpr double area() const { return width() * height(); }
        constexpr Vec2 origin() const { return midpoint(p1_, p2_); }

        // returns the `i`th corner, ordered clockwise (in Y-down space) from the
        // top-left: 0 = top-left, 1 = top-right, 2 = bottom-right, 3 = bottom-left
        constexpr Vec2 corner(size_t i) const
        {
            switch (i) {
            case 0: return p1_;
            case 1: return {p2_.x, p1_.y};
            case 2: return p2_;
            case 3: return {p1_.x, p2_.y};
            default: throw std::out_of_range{"corner index out of range: a rectangle has four corners"};
            }
        }

        // returns `true` if `p` lies inside the rectangle or on its boundary
        constexpr bool contains(const Vec2& p) const
        {
            return p1_.x <= p.x and p.x <= p2_.x and p1_.y <= p.y and p.y <= p2_.y;
        }

        constexpr Rect with_origin_translated(const Vec2& delta) const
        {
            return Rect{p1_ + delta, p2_ + delta};
        }

    private:
        constexpr Rect(const Vec2& p1, const Vec2& p2) : p1_{p1}, p2_{p2} {}

        Vec2 p1_;
        Vec2 p2_;
    };

    inline constexpr size_t c_num_rect_corners = 4;

    std::ostream& operator<<(std::ostream&, const Rect&);
}
