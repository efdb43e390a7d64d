#pragma once

#include <libimlabel/Maths/Vec2.h>

#include <iosfwd>

namespace iml
{
    // a circle in 2D space
    struct Circle final {
        friend constexpr bool operator==(const Circle&, const Circle&) = default;

        Vec2 origin{};
        double radius = 0.0;
    };

    std::ostream& operator<<(std::ostream&, const Circle&);
}
