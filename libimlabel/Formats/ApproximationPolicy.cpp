#include "ApproximationPolicy.h"

#include <libimlabel/Maths/GeometryFunctions.h>
#include <libimlabel/Utils/Overload.h>

#include <cmath>
#include <span>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

using namespace iml;

namespace
{
    ExportShape make_shape(std::vector<Vec2> outline, bool is_approximation)
    {
        ExportShape rv;
        rv.bounds = bounding_rect_of(std::span<const Vec2>{outline}).value_or(Rect{});
        rv.area = polygon_area(outline);
        rv.outline = std::move(outline);
        rv.is_approximation = is_approximation;
        return rv;
    }

    void validate_policy(const ApproximationPolicy& policy)
    {
        if (policy.circle_polygon_sides < 3) {
            throw std::invalid_argument{"circle_polygon_sides: a circle must be approximated with at least 3 sides"};
        }
        if (not std::isfinite(policy.point_box_size) or policy.point_box_size <= 0.0) {
            throw std::invalid_argument{"point_box_size: must be a positive number"};
        }
    }

    void assert_approximation_allowed(
        const AnnotationGeometry& geometry,
        const ApproximationPolicy& policy,
        const CodecErrorLocation& location)
    {
        if (not policy.allow_approximation) {
            std::stringstream ss;
            ss << kind_of(geometry) << " annotations can only be exported as an approximation, and approximation is disabled";
            throw UnsupportedKind{location, std::move(ss).str()};
        }
    }
}

ExportShape iml::to_export_shape(
    const AnnotationGeometry& geometry,
    const ApproximationPolicy& policy,
    const CodecErrorLocation& location)
{
    validate_policy(policy);

    return std::visit(Overload{
        [&](const Vec2& point)
        {
            assert_approximation_allowed(geometry, policy, location);
            const double half = 0.5 * policy.point_box_size;
            const Rect box = Rect::from_corners(point - Vec2{half, half}, point + Vec2{half, half});
            return make_shape({box.corner(0), box.corner(1), box.corner(2), box.corner(3)}, true);
        },
        [](const Rect& rect)
        {
            return make_shape({rect.corner(0), rect.corner(1), rect.corner(2), rect.corner(3)}, false);
        },
        [&](const Circle& circle)
        {
            assert_approximation_allowed(geometry, policy, location);
            return make_shape(regular_polygon_vertices_of(circle, policy.circle_polygon_sides), true);
        },
        [](const Polygon& polygon)
        {
            return make_shape(polygon.vertices, false);
        },
    }, geometry);
}
