#pragma once

#include <libimlabel/Maths/Vec2.h>

#include <iosfwd>
#include <vector>

namespace iml
{
    // a closed polygon in 2D space
    //
    // the last vertex implicitly connects back to the first one, so edge `i`
    // runs from `vertices[i]` to `vertices[(i+1) % vertices.size()]`
    struct Polygon final {
        friend bool operator==(const Polygon&, const Polygon&) = default;

        std::vector<Vec2> vertices;
    };

    std::ostream& operator<<(std::ostream&, const Polygon&);
}
