#pragma once

#include <libimlabel/Maths/Circle.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace iml
{
    // returns the shortest distance between `p` and the line segment `[a, b]`
    double distance_to_segment(const Vec2& p, const Vec2& a, const Vec2& b);

    // returns the point on the line segment `[a, b]` that is closest to `p`
    Vec2 closest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b);

    // returns `true` if `p` lies within `epsilon` of the line segment `[a, b]`
    bool is_on_segment(const Vec2& p, const Vec2& a, const Vec2& b, double epsilon = 1e-9);

    // returns `true` if `p` lies inside the circle or on its circumference
    bool contains(const Circle&, const Vec2& p);

    // returns `true` if `p` lies inside the closed polygon formed by `vertices`
    //
    // points that lie on an edge (or vertex) of the polygon are considered inside
    bool polygon_contains(std::span<const Vec2> vertices, const Vec2& p);
    bool contains(const Polygon&, const Vec2& p);

    // returns the (unsigned) area enclosed by `vertices`, computed with the
    // shoelace formula
    double polygon_area(std::span<const Vec2> vertices);
    double area_of(const Polygon&);
    double area_of(const Circle&);
    double area_of(const Rect&);

    // returns the smallest axis-aligned rectangle that contains all of `points`,
    // or `std::nullopt` if `points` is empty
    std::optional<Rect> bounding_rect_of(std::span<const Vec2> points);
    Rect bounding_rect_of(const Circle&);

    // returns `num_sides` vertices evenly spaced around the circumference of the
    // circle, starting at angle 0 (i.e. `origin + {radius, 0}`)
    std::vector<Vec2> regular_polygon_vertices_of(const Circle&, size_t num_sides);

    // returns the index of the edge of the closed loop formed by `vertices` that is
    // closest to `p`, if that edge is within `tolerance` of `p`
    //
    // edge `i` runs from `vertices[i]` to `vertices[(i+1) % vertices.size()]`; ties
    // are resolved in favor of the lowest index
    std::optional<size_t> nearest_edge_within(std::span<const Vec2> vertices, const Vec2& p, double tolerance);

    // returns the index of the vertex in `vertices` that is closest to `p`, if it
    // is within `tolerance` of `p`
    std::optional<size_t> nearest_vertex_within(std::span<const Vec2> vertices, const Vec2& p, double tolerance);
}
