#include "AnnotationGeometry.h"

#include <libimlabel/Maths/GeometryFunctions.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/Overload.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <span>
#include <sstream>
#include <utility>

using namespace iml;

namespace
{
    void assert_finite(const Vec2& p, const char* what)
    {
        if (not is_finite(p)) {
            std::stringstream ss;
            ss << what << ' ' << p << " has a non-finite coordinate";
            throw InvalidGeometry{std::move(ss).str()};
        }
    }
}

AnnotationKind iml::kind_of(const AnnotationGeometry& geometry)
{
    static_assert(std::variant_size_v<AnnotationGeometry> == static_cast<size_t>(AnnotationKind::NUM_OPTIONS));
    return static_cast<AnnotationKind>(geometry.index());
}

void iml::validate(const AnnotationGeometry& geometry)
{
    std::visit(Overload{
        [](const Vec2& point)
        {
            assert_finite(point, "point");
        },
        [](const Rect& rect)
        {
            assert_finite(rect.p1(), "rectangle corner");
            assert_finite(rect.p2(), "rectangle corner");
        },
        [](const Circle& circle)
        {
            assert_finite(circle.origin, "circle center");
            if (not std::isfinite(circle.radius) or circle.radius < 0.0) {
                std::stringstream ss;
                ss << circle.radius << ": is not a valid circle radius: it must be a finite number >= 0";
                throw InvalidGeometry{std::move(ss).str()};
            }
        },
        [](const Polygon& polygon)
        {
            if (polygon.vertices.size() < 3) {
                std::stringstream ss;
                ss << "a polygon must have at least 3 vertices (got " << polygon.vertices.size() << ')';
                throw InvalidGeometry{std::move(ss).str()};
            }
            for (const Vec2& v : polygon.vertices) {
                assert_finite(v, "polygon vertex");
            }
        },
    }, geometry);
}

bool iml::is_valid(const AnnotationGeometry& geometry)
{
    try {
        validate(geometry);
        return true;
    }
    catch (const InvalidGeometry&) {
        return false;
    }
}

std::vector<Vec2> iml::vertex_handles_of(const AnnotationGeometry& geometry)
{
    return std::visit(Overload{
        [](const Vec2& point) -> std::vector<Vec2>
        {
            return {point};
        },
        [](const Rect& rect) -> std::vector<Vec2>
        {
            return {rect.corner(0), rect.corner(1), rect.corner(2), rect.corner(3)};
        },
        [](const Circle& circle) -> std::vector<Vec2>
        {
            return {circle.origin, circle.origin + Vec2{circle.radius, 0.0}};
        },
        [](const Polygon& polygon) -> std::vector<Vec2>
        {
            return polygon.vertices;
        },
    }, geometry);
}

size_t iml::num_vertex_handles(const AnnotationGeometry& geometry)
{
    return std::visit(Overload{
        [](const Vec2&) -> size_t { return 1; },
        [](const Rect&) -> size_t { return c_num_rect_corners; },
        [](const Circle&) -> size_t { return 2; },
        [](const Polygon& polygon) -> size_t { return polygon.vertices.size(); },
    }, geometry);
}

std::vector<Vec2> iml::edge_loop_of(const AnnotationGeometry& geometry)
{
    return std::visit(Overload{
        [](const Vec2&) -> std::vector<Vec2> { return {}; },
        [](const Circle&) -> std::vector<Vec2> { return {}; },
        [&geometry](const Rect&) -> std::vector<Vec2> { return vertex_handles_of(geometry); },
        [](const Polygon& polygon) -> std::vector<Vec2> { return polygon.vertices; },
    }, geometry);
}

bool iml::body_contains(const AnnotationGeometry& geometry, const Vec2& p)
{
    return std::visit(Overload{
        [](const Vec2&) { return false; },
        [&p](const Rect& rect) { return rect.contains(p); },
        [&p](const Circle& circle) { return contains(circle, p); },
        [&p](const Polygon& polygon) { return contains(polygon, p); },
    }, geometry);
}

Rect iml::bounding_rect_of(const AnnotationGeometry& geometry)
{
    return std::visit(Overload{
        [](const Vec2& point) { return Rect::from_point(point); },
        [](const Rect& rect) { return rect; },
        [](const Circle& circle) { return bounding_rect_of(circle); },
        [](const Polygon& polygon) { return bounding_rect_of(std::span<const Vec2>{polygon.vertices}).value_or(Rect{}); },
    }, geometry);
}

double iml::area_of(const AnnotationGeometry& geometry)
{
    return std::visit(Overload{
        [](const Vec2&) { return 0.0; },
        [](const Rect& rect) { return area_of(rect); },
        [](const Circle& circle) { return area_of(circle); },
        [](const Polygon& polygon) { return area_of(polygon); },
    }, geometry);
}

std::string iml::to_summary_string(const AnnotationGeometry& geometry)
{
    std::stringstream ss;
    ss << kind_of(geometry) << ' ';
    std::visit(Overload{
        [&ss](const Vec2& point)
        {
            ss << '(' << point.x << ", " << point.y << ')';
        },
        [&ss](const Rect& rect)
        {
            ss << '(' << rect.left() << ", " << rect.top() << ") - (" << rect.right() << ", " << rect.bottom() << ')';
        },
        [&ss](const Circle& circle)
        {
            ss << "center (" << circle.origin.x << ", " << circle.origin.y << ") radius " << circle.radius;
        },
        [&ss](const Polygon& polygon)
        {
            ss << polygon.vertices.size() << " vertices";
        },
    }, geometry);
    return std::move(ss).str();
}

std::ostream& iml::operator<<(std::ostream& out, const AnnotationGeometry& geometry)
{
    std::visit([&out](const auto& alternative) { out << alternative; }, geometry);
    return out;
}
