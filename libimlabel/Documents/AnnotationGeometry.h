#pragma once

#include <libimlabel/Documents/AnnotationKind.h>
#include <libimlabel/Maths/Circle.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>

#include <cstddef>
#include <iosfwd>
#include <string>
#include <variant>
#include <vector>

namespace iml
{
    // the image-space geometry of an annotation: a tagged union over the four
    // supported primitives
    //
    // the alternatives are ordered the same way as `AnnotationKind`
    using AnnotationGeometry = std::variant<Vec2, Rect, Circle, Polygon>;

    AnnotationKind kind_of(const AnnotationGeometry&);

    // throws `InvalidGeometry` if the geometry violates its kind's invariants:
    //
    // - all coordinates (and the radius) must be finite
    // - a circle's radius must be >= 0
    // - a polygon must have at least 3 vertices
    void validate(const AnnotationGeometry&);

    // returns `true` if `validate` would not throw
    bool is_valid(const AnnotationGeometry&);

    // returns the draggable handles of the geometry, in handle-index order:
    //
    // - point: 0 = the point
    // - rectangle: 0 = top-left, 1 = top-right, 2 = bottom-right, 3 = bottom-left
    // - circle: 0 = center, 1 = radius handle at (cx + r, cy)
    // - polygon: its vertices
    std::vector<Vec2> vertex_handles_of(const AnnotationGeometry&);
    size_t num_vertex_handles(const AnnotationGeometry&);

    // returns the closed outline whose edges can be picked (rectangle corners or
    // polygon vertices), or an empty vector for points and circles
    std::vector<Vec2> edge_loop_of(const AnnotationGeometry&);

    // returns `true` if `p` lies within the body (interior or boundary) of the
    // geometry; points have no body
    bool body_contains(const AnnotationGeometry&, const Vec2& p);

    Rect bounding_rect_of(const AnnotationGeometry&);

    // rectangle: w*h, circle: pi*r^2, polygon: shoelace area, point: 0
    double area_of(const AnnotationGeometry&);

    // returns a short, human-readable description (e.g. "Rectangle (10, 10) - (100, 100)")
    std::string to_summary_string(const AnnotationGeometry&);

    std::ostream& operator<<(std::ostream&, const AnnotationGeometry&);
}
