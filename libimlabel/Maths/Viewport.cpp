#include "Viewport.h"

#include <libimlabel/Utils/Exceptions.h>

#include <algorithm>
#include <cmath>
#include <ostream>
#include <sstream>
#include <utility>

using namespace iml;

namespace
{
    bool is_positive_finite(double v)
    {
        return std::isfinite(v) and v > 0.0;
    }

    void assert_zoom_is_valid(double zoom)
    {
        if (not is_positive_finite(zoom)) {
            std::stringstream ss;
            ss << zoom << ": is not a valid zoom factor: it must be a finite number greater than zero";
            throw InvalidZoom{std::move(ss).str()};
        }
    }

    double clamp_to_bounds(double zoom, const ViewportParameters& parameters)
    {
        return std::clamp(zoom, parameters.min_zoom, parameters.max_zoom);
    }
}

std::ostream& iml::operator<<(std::ostream& out, const ViewportState& viewport)
{
    return out << "ViewportState(zoom = " << viewport.zoom << ", pan_offset = " << viewport.pan_offset << ')';
}

Vec2 iml::to_canvas(const Vec2& image_point, const ViewportState& viewport)
{
    return image_point*viewport.zoom + viewport.pan_offset;
}

Vec2 iml::to_image(const Vec2& canvas_point, const ViewportState& viewport)
{
    assert_zoom_is_valid(viewport.zoom);
    return (canvas_point - viewport.pan_offset) / viewport.zoom;
}

double iml::to_image_distance(double canvas_distance, const ViewportState& viewport)
{
    assert_zoom_is_valid(viewport.zoom);
    return canvas_distance / viewport.zoom;
}

ViewportState iml::zoom_at(
    const ViewportState& viewport,
    const Vec2& focal_canvas_point,
    double new_zoom,
    const ViewportParameters& parameters)
{
    assert_zoom_is_valid(new_zoom);
    if (new_zoom < parameters.min_zoom or new_zoom > parameters.max_zoom) {
        std::stringstream ss;
        ss << new_zoom << ": zoom factor is outside of the allowed range [" << parameters.min_zoom << ", " << parameters.max_zoom << ']';
        throw InvalidZoom{std::move(ss).str()};
    }

    const Vec2 focal_image_point = to_image(focal_canvas_point, viewport);
    return ViewportState{
        .zoom = new_zoom,
        .pan_offset = focal_canvas_point - focal_image_point*new_zoom,
    };
}

ViewportState iml::zoom_in(const ViewportState& viewport, const Vec2& focal_canvas_point, const ViewportParameters& parameters)
{
    return zoom_at(viewport, focal_canvas_point, clamp_to_bounds(viewport.zoom * parameters.zoom_step, parameters), parameters);
}

ViewportState iml::zoom_out(const ViewportState& viewport, const Vec2& focal_canvas_point, const ViewportParameters& parameters)
{
    return zoom_at(viewport, focal_canvas_point, clamp_to_bounds(viewport.zoom / parameters.zoom_step, parameters), parameters);
}

ViewportState iml::wheel_zoom(
    const ViewportState& viewport,
    const Vec2& pointer_canvas_point,
    int notches,
    const ViewportParameters& parameters)
{
    const double factor = std::pow(parameters.wheel_zoom_step, static_cast<double>(notches));
    return zoom_at(viewport, pointer_canvas_point, clamp_to_bounds(viewport.zoom * factor, parameters), parameters);
}

ViewportState iml::pan_by(const ViewportState& viewport, const Vec2& canvas_delta)
{
    return ViewportState{
        .zoom = viewport.zoom,
        .pan_offset = viewport.pan_offset + canvas_delta,
    };
}

ViewportState iml::fit_to_canvas(
    const Vec2& image_dimensions,
    const Vec2& canvas_dimensions,
    const ViewportParameters& parameters)
{
    if (not (is_positive_finite(image_dimensions.x) and is_positive_finite(image_dimensions.y) and
             is_positive_finite(canvas_dimensions.x) and is_positive_finite(canvas_dimensions.y))) {
        throw InvalidZoom{"cannot fit an image to a canvas when either of them has non-positive dimensions"};
    }

    const double scale = parameters.fit_margin * std::min(
        canvas_dimensions.x / image_dimensions.x,
        canvas_dimensions.y / image_dimensions.y
    );
    const double zoom = clamp_to_bounds(scale, parameters);

    return ViewportState{
        .zoom = zoom,
        .pan_offset = 0.5*(canvas_dimensions - image_dimensions*zoom),
    };
}

bool iml::exceeds_drag_threshold(const Vec2& start_canvas_point, const Vec2& end_canvas_point, double min_drag_distance)
{
    return distance(start_canvas_point, end_canvas_point) >= min_drag_distance;
}
