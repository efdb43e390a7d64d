#pragma once

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Maths/Vec2.h>
#include <libimlabel/Utils/Exceptions.h>

#include <cstddef>
#include <vector>

namespace iml
{
    // how annotation kinds that a format cannot represent natively (points and
    // circles in COCO and Pascal VOC) are converted into polygons and boxes
    struct ApproximationPolicy final {
        friend bool operator==(const ApproximationPolicy&, const ApproximationPolicy&) = default;

        // if `false`, exporting a point or circle throws `UnsupportedKind`
        bool allow_approximation = true;

        // number of vertices in the regular polygon that approximates a circle
        size_t circle_polygon_sides = 16;

        // side length of the axis-aligned square that approximates a point
        double point_box_size = 2.0;
    };

    // an annotation, as seen by a polygon/box-based export format
    struct ExportShape final {
        std::vector<Vec2> outline;  // closed polygon
        Rect bounds;                // bounding box of `outline`
        double area = 0.0;          // area enclosed by `outline`
        bool is_approximation = false;
    };

    // returns the export shape of `geometry` under `policy`:
    //
    // - rectangle: its four corners, clockwise from the top-left
    // - polygon: its vertices, unchanged
    // - point: a `point_box_size` square centered on the point, clockwise from the top-left
    // - circle: a regular `circle_polygon_sides`-gon inscribed in the circle, starting
    //   at (cx + r, cy) and proceeding with increasing angle
    //
    // throws `UnsupportedKind`, reported at `location`, if the geometry needs to be
    // approximated and the policy forbids it, and `std::invalid_argument` if the policy
    // has fewer than 3 circle sides or a non-positive point box size
    ExportShape to_export_shape(
        const AnnotationGeometry&,
        const ApproximationPolicy&,
        const CodecErrorLocation& location = {}
    );
}
