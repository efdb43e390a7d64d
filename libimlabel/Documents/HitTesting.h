#pragma once

#include <libimlabel/Documents/Annotation.h>
#include <libimlabel/Documents/AnnotationID.h>
#include <libimlabel/Maths/Vec2.h>
#include <libimlabel/Maths/Viewport.h>

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <span>

namespace iml
{
    // the result of resolving a pointer location to an annotation
    struct AnnotationHit final {
        friend bool operator==(const AnnotationHit&, const AnnotationHit&) = default;

        AnnotationID id;
        std::optional<size_t> vertex_index;  // set if a vertex handle was hit, rather than the body
    };

    std::ostream& operator<<(std::ostream&, const AnnotationHit&);

    // the result of resolving a pointer location to an edge of an annotation
    struct EdgeHit final {
        friend bool operator==(const EdgeHit&, const EdgeHit&) = default;

        AnnotationID id;
        size_t edge_index = 0;
        Vec2 closest_image_point{};  // closest point on the edge, in image-space
    };

    // returns the annotation (and, possibly, vertex handle) targeted by
    // `canvas_point`, or `std::nullopt` if nothing is targeted
    //
    // `tolerance` is in canvas pixels and is converted to image-space with the
    // viewport's zoom. Resolution order:
    //
    // 1. a vertex handle (see `vertex_handles_of`) within tolerance beats any body hit
    // 2. among vertex candidates, the nearest wins (ties go to the topmost annotation)
    // 3. among body hits, the topmost (last in `annotations`) annotation wins
    std::optional<AnnotationHit> hit_test(
        const Vec2& canvas_point,
        const ViewportState&,
        std::span<const Annotation> annotations,
        double tolerance
    );

    // returns the edge of a polygon or rectangle nearest to `canvas_point`, if one
    // is within `tolerance` canvas pixels (ties go to the topmost annotation)
    std::optional<EdgeHit> hit_test_edge(
        const Vec2& canvas_point,
        const ViewportState&,
        std::span<const Annotation> annotations,
        double tolerance
    );
}
