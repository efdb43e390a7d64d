#include "VertexEditing.h"

#include <libimlabel/Documents/Project.h>
#include <libimlabel/Maths/Circle.h>
#include <libimlabel/Maths/Polygon.h>
#include <libimlabel/Maths/Rect.h>
#include <libimlabel/Utils/Exceptions.h>
#include <libimlabel/Utils/Overload.h>

#include <cstddef>
#include <sstream>
#include <utility>
#include <variant>

using namespace iml;

namespace
{
    void assert_vertex_index_in_bounds(const AnnotationGeometry& geometry, size_t vertex_index)
    {
        const size_t n = num_vertex_handles(geometry);
        if (vertex_index >= n) {
            std::stringstream ss;
            ss << vertex_index << ": vertex index is out of bounds (a " << kind_of(geometry) << " with this geometry has " << n << " vertices)";
            throw NotFound{std::move(ss).str()};
        }
    }

    const Polygon& polygon_or_throw(const AnnotationGeometry& geometry, const char* operation)
    {
        if (const auto* polygon = std::get_if<Polygon>(&geometry)) {
            return *polygon;
        }
        std::stringstream ss;
        ss << "cannot " << operation << " a " << kind_of(geometry) << ": only polygons support this";
        throw InvalidGeometry{std::move(ss).str()};
    }
}

AnnotationGeometry iml::with_vertex_moved(const AnnotationGeometry& geometry, size_t vertex_index, const Vec2& new_point)
{
    assert_vertex_index_in_bounds(geometry, vertex_index);

    return std::visit(Overload{
        [&new_point](const Vec2&) -> AnnotationGeometry
        {
            return new_point;
        },
        [&new_point, vertex_index](const Rect& rect) -> AnnotationGeometry
        {
            const Vec2 fixed_corner = rect.corner((vertex_index + 2) % c_num_rect_corners);
            return Rect::from_corners(new_point, fixed_corner);
        },
        [&new_point, vertex_index](const Circle& circle) -> AnnotationGeometry
        {
            if (vertex_index == 0) {
                return Circle{.origin = new_point, .radius = circle.radius};
            }
            return Circle{.origin = circle.origin, .radius = distance(circle.origin, new_point)};
        },
        [&new_point, vertex_index](const Polygon& polygon) -> AnnotationGeometry
        {
            Polygon copy = polygon;
            copy.vertices[vertex_index] = new_point;
            return copy;
        },
    }, geometry);
}

AnnotationGeometry iml::with_vertex_inserted(const AnnotationGeometry& geometry, size_t edge_index, const Vec2& new_point)
{
    const Polygon& polygon = polygon_or_throw(geometry, "insert a vertex into");
    if (edge_index >= polygon.vertices.size()) {
        std::stringstream ss;
        ss << edge_index << ": edge index is out of bounds (the polygon has " << polygon.vertices.size() << " edges)";
        throw NotFound{std::move(ss).str()};
    }

    Polygon copy = polygon;
    copy.vertices.insert(copy.vertices.begin() + static_cast<std::ptrdiff_t>(edge_index + 1), new_point);
    return copy;
}

AnnotationGeometry iml::with_vertex_deleted(const AnnotationGeometry& geometry, size_t vertex_index)
{
    const Polygon& polygon = polygon_or_throw(geometry, "delete a vertex from");
    assert_vertex_index_in_bounds(geometry, vertex_index);
    if (polygon.vertices.size() <= 3) {
        throw InvalidGeometry{"cannot delete a vertex from a polygon that only has 3 vertices: a polygon must have at least 3 vertices"};
    }

    Polygon copy = polygon;
    copy.vertices.erase(copy.vertices.begin() + static_cast<std::ptrdiff_t>(vertex_index));
    return copy;
}

AnnotationGeometry iml::with_translation(const AnnotationGeometry& geometry, const Vec2& delta)
{
    return std::visit(Overload{
        [&delta](const Vec2& point) -> AnnotationGeometry
        {
            return point + delta;
        },
        [&delta](const Rect& rect) -> AnnotationGeometry
        {
            return rect.with_origin_translated(delta);
        },
        [&delta](const Circle& circle) -> AnnotationGeometry
        {
            return Circle{.origin = circle.origin + delta, .radius = circle.radius};
        },
        [&delta](const Polygon& polygon) -> AnnotationGeometry
        {
            Polygon copy = polygon;
            for (Vec2& v : copy.vertices) {
                v += delta;
            }
            return copy;
        },
    }, geometry);
}

void iml::move_vertex(Project& project, AnnotationID id, size_t vertex_index, const Vec2& new_image_point)
{
    project.set_geometry(id, with_vertex_moved(project.get_annotation(id).geometry, vertex_index, new_image_point));
}

void iml::insert_vertex(Project& project, AnnotationID id, size_t edge_index, const Vec2& image_point)
{
    project.set_geometry(id, with_vertex_inserted(project.get_annotation(id).geometry, edge_index, image_point));
}

void iml::delete_vertex(Project& project, AnnotationID id, size_t vertex_index)
{
    project.set_geometry(id, with_vertex_deleted(project.get_annotation(id).geometry, vertex_index));
}

void iml::translate_annotation(Project& project, AnnotationID id, const Vec2& image_delta)
{
    project.set_geometry(id, with_translation(project.get_annotation(id).geometry, image_delta));
}
