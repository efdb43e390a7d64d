#include "HitTesting.h"

#include <libimlabel/Documents/AnnotationGeometry.h>
#include <libimlabel/Maths/GeometryFunctions.h>

#include <cstddef>
#include <optional>
#include <ostream>
#include <vector>

using namespace iml;

std::ostream& iml::operator<<(std::ostream& out, const AnnotationHit& hit)
{
    out << "AnnotationHit(id = " << hit.id;
    if (hit.vertex_index) {
        out << ", vertex_index = " << *hit.vertex_index;
    }
    return out << ')';
}

std::optional<AnnotationHit> iml::hit_test(
    const Vec2& canvas_point,
    const ViewportState& viewport,
    std::span<const Annotation> annotations,
    double tolerance)
{
    const Vec2 p = to_image(canvas_point, viewport);
    const double image_tolerance = to_image_distance(tolerance, viewport);

    // vertex handles: nearest wins, iterate top-down so that ties go to the topmost
    std::optional<AnnotationHit> best_vertex;
    double best_vertex_distance = image_tolerance;
    for (auto it = annotations.rbegin(); it != annotations.rend(); ++it) {
        const std::vector<Vec2> handles = vertex_handles_of(it->geometry);
        const std::optional<size_t> nearest = nearest_vertex_within(handles, p, image_tolerance);
        if (not nearest) {
            continue;
        }
        const double d = distance(p, handles[*nearest]);
        if (not best_vertex or d < best_vertex_distance) {
            best_vertex = AnnotationHit{.id = it->id, .vertex_index = *nearest};
            best_vertex_distance = d;
        }
    }
    if (best_vertex) {
        return best_vertex;
    }

    // bodies: topmost wins
    for (auto it = annotations.rbegin(); it != annotations.rend(); ++it) {
        if (body_contains(it->geometry, p)) {
            return AnnotationHit{.id = it->id, .vertex_index = std::nullopt};
        }
    }
    return std::nullopt;
}

std::optional<EdgeHit> iml::hit_test_edge(
    const Vec2& canvas_point,
    const ViewportState& viewport,
    std::span<const Annotation> annotations,
    double tolerance)
{
    const Vec2 p = to_image(canvas_point, viewport);
    const double image_tolerance = to_image_distance(tolerance, viewport);

    std::optional<EdgeHit> best;
    double best_distance = image_tolerance;
    for (auto it = annotations.rbegin(); it != annotations.rend(); ++it) {
        const std::vector<Vec2> loop = edge_loop_of(it->geometry);
        const std::optional<size_t> edge = nearest_edge_within(loop, p, image_tolerance);
        if (not edge) {
            continue;
        }
        const Vec2& a = loop[*edge];
        const Vec2& b = loop[(*edge + 1) % loop.size()];
        const Vec2 closest = closest_point_on_segment(p, a, b);
        const double d = distance(p, closest);
        if (not best or d < best_distance) {
            best = EdgeHit{.id = it->id, .edge_index = *edge, .closest_image_point = closest};
            best_distance = d;
        }
    }
    return best;
}
