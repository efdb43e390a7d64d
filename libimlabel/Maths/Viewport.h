#pragma once

#include <libimlabel/Maths/Vec2.h>

#include <iosfwd>

namespace iml
{
    // the zoom/pan state that maps image-space to canvas-space:
    //
    //     canvas = image * zoom + pan_offset
    //
    // ephemeral: it is held per displayed image by the caller and is not part
    // of a `Project`
    struct ViewportState final {
        friend constexpr bool operator==(const ViewportState&, const ViewportState&) = default;

        double zoom = 1.0;
        Vec2 pan_offset{};
    };

    std::ostream& operator<<(std::ostream&, const ViewportState&);

    // configurable limits and step sizes for zooming a `ViewportState`
    struct ViewportParameters final {
        double min_zoom = 0.1;
        double max_zoom = 5.0;
        double zoom_step = 1.2;        // multiplier for a stepped zoom in/out
        double wheel_zoom_step = 1.1;  // multiplier for one mouse-wheel notch
        double fit_margin = 0.9;       // fraction of the canvas an image occupies after "fit"
    };

    // returns `image_point` in canvas-space
    Vec2 to_canvas(const Vec2& image_point, const ViewportState&);

    // returns `canvas_point` in image-space (exact inverse of `to_canvas`)
    //
    // throws `InvalidZoom` if the viewport's zoom is not a positive finite number
    Vec2 to_image(const Vec2& canvas_point, const ViewportState&);

    // returns a distance in canvas pixels converted to image-space units
    double to_image_distance(double canvas_distance, const ViewportState&);

    // returns a new viewport with `new_zoom` that keeps `focal_canvas_point` at
    // the same canvas position
    //
    // throws `InvalidZoom` if `new_zoom` is not positive and finite, or lies
    // outside of `[parameters.min_zoom, parameters.max_zoom]`
    ViewportState zoom_at(
        const ViewportState&,
        const Vec2& focal_canvas_point,
        double new_zoom,
        const ViewportParameters& parameters = {}
    );

    // stepped zoom anchored on `focal_canvas_point`, clamped to the zoom bounds
    ViewportState zoom_in(const ViewportState&, const Vec2& focal_canvas_point, const ViewportParameters& = {});
    ViewportState zoom_out(const ViewportState&, const Vec2& focal_canvas_point, const ViewportParameters& = {});

    // mouse-wheel zoom anchored on the pointer: positive `notches` zoom in,
    // negative ones zoom out, clamped to the zoom bounds
    ViewportState wheel_zoom(
        const ViewportState&,
        const Vec2& pointer_canvas_point,
        int notches,
        const ViewportParameters& = {}
    );

    ViewportState pan_by(const ViewportState&, const Vec2& canvas_delta);

    // returns the 100 % zoom, unpanned, viewport
    constexpr ViewportState reset_viewport() { return ViewportState{}; }

    // returns a viewport that centers an image with `image_dimensions` in a canvas
    // of `canvas_dimensions`, scaled to occupy `fit_margin` of the canvas
    //
    // throws `InvalidZoom` if either set of dimensions is non-positive
    ViewportState fit_to_canvas(
        const Vec2& image_dimensions,
        const Vec2& canvas_dimensions,
        const ViewportParameters& = {}
    );

    // returns `true` if a drag from `start_canvas_point` to `end_canvas_point` is
    // long enough to count as a deliberate shape-drawing gesture
    bool exceeds_drag_threshold(const Vec2& start_canvas_point, const Vec2& end_canvas_point, double min_drag_distance);
}
