#include "Vec2.h"

#include <ostream>

std::ostream& iml::operator<<(std::ostream& out, const Vec2& v)
{
    return out << "Vec2(" << v.x << ", " << v.y << ')';
}
