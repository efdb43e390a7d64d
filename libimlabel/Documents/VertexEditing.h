#pragma once

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Maths/Vec2.h>

#include <cstddef>

namespace iml { class Project; }

// vertex-level editing of annotation geometry
//
// the `with_*` functions are pure: they return edited copies of geometry. The
// `Project`-level functions apply the same edits to an annotation in a project,
// re-validating the result, and leave the project unchanged if anything throws.
namespace iml
{
    // returns a copy of `geometry` with the handle at `vertex_index` (see
    // `vertex_handles_of`) relocated to `new_point`:
    //
    // - point: the point moves
    // - rectangle: the corner moves, the diagonally-opposite corner stays fixed,
    //   and the result is re-normalized
    // - circle: handle 0 (center) translates the circle, handle 1 sets the radius
    //   to the distance from the center
    // - polygon: exactly that vertex moves
    //
    // throws `NotFound` if `vertex_index` is not a handle of the geometry
    AnnotationGeometry with_vertex_moved(const AnnotationGeometry&, size_t vertex_index, const Vec2& new_point);

    // returns a copy of a polygon with `new_point` inserted between the vertices
    // of edge `edge_index` (i.e. at position `edge_index + 1`)
    //
    // throws `InvalidGeometry` if `geometry` is not a polygon, or `NotFound` if
    // the edge does not exist
    AnnotationGeometry with_vertex_inserted(const AnnotationGeometry&, size_t edge_index, const Vec2& new_point);

    // returns a copy of a polygon with the vertex at `vertex_index` removed
    //
    // throws `InvalidGeometry` if `geometry` is not a polygon or if the polygon
    // would drop below 3 vertices, or `NotFound` if the vertex does not exist
    AnnotationGeometry with_vertex_deleted(const AnnotationGeometry&, size_t vertex_index);

    // returns a copy of `geometry` translated by `delta`
    AnnotationGeometry with_translation(const AnnotationGeometry&, const Vec2& delta);

    void move_vertex(Project&, AnnotationID, size_t vertex_index, const Vec2& new_image_point);
    void insert_vertex(Project&, AnnotationID, size_t edge_index, const Vec2& image_point);
    void delete_vertex(Project&, AnnotationID, size_t vertex_index);
    void translate_annotation(Project&, AnnotationID, const Vec2& image_delta);
}
