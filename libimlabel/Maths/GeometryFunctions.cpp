#include "GeometryFunctions.h"

#include <libimlabel/Maths/Circle.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>

#include <algorithm>
#include <cmath>
#include <numbers>
#include <ostream>
#include <string_view>

using namespace iml;

std::ostream& iml::operator<<(std::ostream& out, const Rect& rect)
{
    return out << "Rect(p1 = " << rect.p1() << ", p2 = " << rect.p2() << ')';
}

std::ostream& iml::operator<<(std::ostream& out, const Circle& circle)
{
    return out << "Circle(origin = " << circle.origin << ", radius = " << circle.radius << ')';
}

std::ostream& iml::operator<<(std::ostream& out, const Polygon& polygon)
{
    out << "Polygon(";
    std::string_view delimiter;
    for (const Vec2& v : polygon.vertices) {
        out << delimiter << v;
        delimiter = ", ";
    }
    return out << ')';
}

Vec2 iml::closest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b)
{
    const Vec2 ab = b - a;
    const double len2 = length2(ab);
    if (len2 == 0.0) {
        return a;  // degenerate segment
    }
    const double t = std::clamp(dot(p - a, ab) / len2, 0.0, 1.0);
    return a + t*ab;
}

double iml::distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b)
{
    return distance(p, closest_point_on_segment(p, a, b));
}

bool iml::is_on_segment(const Vec2& p, const Vec2& a, const Vec2& b, double epsilon)
{
    return distance_to_segment(p, a, b) <= epsilon;
}

bool iml::contains(const Circle& circle, const Vec2& p)
{
    return distance(circle.origin, p) <= circle.radius;
}

bool iml::polygon_contains(std::span<const Vec2> vertices, const Vec2& p)
{
    const size_t n = vertices.size();
    if (n == 0) {
        return false;
    }

    // boundary points are inside
    for (size_t i = 0; i < n; ++i) {
        if (is_on_segment(p, vertices[i], vertices[(i+1) % n])) {
            return true;
        }
    }

    // even-odd ray casting towards +X
    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Vec2& vi = vertices[i];
        const Vec2& vj = vertices[j];
        if ((vi.y > p.y) != (vj.y > p.y)) {
            const double x_intersect = vj.x + (p.y - vj.y) * (vi.x - vj.x) / (vi.y - vj.y);
            if (p.x < x_intersect) {
                inside = not inside;
            }
        }
    }
    return inside;
}

bool iml::contains(const Polygon& polygon, const Vec2& p)
{
    return polygon_contains(polygon.vertices, p);
}

double iml::polygon_area(std::span<const Vec2> vertices)
{
    const size_t n = vertices.size();
    if (n < 3) {
        return 0.0;
    }

    double twice_signed_area = 0.0;
    for (size_t i = 0; i < n; ++i) {
        twice_signed_area += cross(vertices[i], vertices[(i+1) % n]);
    }
    return 0.5 * std::abs(twice_signed_area);
}

double iml::area_of(const Polygon& polygon)
{
    return polygon_area(polygon.vertices);
}

double iml::area_of(const Circle& circle)
{
    return std::numbers::pi * circle.radius * circle.radius;
}

double iml::area_of(const Rect& rect)
{
    return rect.area();
}

std::optional<Rect> iml::bounding_rect_of(std::span<const Vec2> points)
{
    if (points.empty()) {
        return std::nullopt;
    }

    Vec2 min = points.front();
    Vec2 max = points.front();
    for (const Vec2& p : points.subspan(1)) {
        min = elementwise_min(min, p);
        max = elementwise_max(max, p);
    }
    return Rect::from_corners(min, max);
}

Rect iml::bounding_rect_of(const Circle& circle)
{
    const Vec2 half_extents{circle.radius, circle.radius};
    return Rect::from_corners(circle.origin - half_extents, circle.origin + half_extents);
}

std::vector<Vec2> iml::regular_polygon_vertices_of(const Circle& circle, size_t num_sides)
{
    std::vector<Vec2> rv;
    rv.reserve(num_sides);
    for (size_t i = 0; i < num_sides; ++i) {
        const double theta = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(num_sides);
        rv.push_back({
            circle.origin.x + circle.radius * std::cos(theta),
            circle.origin.y + circle.radius * std::sin(theta),
        });
    }
    return rv;
}

std::optional<size_t> iml::nearest_edge_within(std::span<const Vec2> vertices, const Vec2& p, double tolerance)
{
    const size_t n = vertices.size();
    if (n < 2) {
        return std::nullopt;
    }

    std::optional<size_t> best;
    double best_distance = tolerance;
    for (size_t i = 0; i < n; ++i) {
        const double d = distance_to_segment(p, vertices[i], vertices[(i+1) % n]);
        if (d <= tolerance and (not best or d < best_distance)) {
            best = i;
            best_distance = d;
        }
    }
    return best;
}

std::optional<size_t> iml::nearest_vertex_within(std::span<const Vec2> vertices, const Vec2& p, double tolerance)
{
    std::optional<size_t> best;
    double best_distance = tolerance;
    for (size_t i = 0; i < vertices.size(); ++i) {
        const double d = distance(p, vertices[i]);
        if (d <= tolerance and (not best or d < best_distance)) {
            best = i;
            best_distance = d;
        }
    }
    return best;
}
