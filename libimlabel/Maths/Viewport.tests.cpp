#include "Viewport.h"

#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <array>
#include <limits>

using namespace iml;

namespace
{
    void assert_near(const Vec2& a, const Vec2& b, double eps = 1e-9)
    {
        ASSERT_NEAR(a.x, b.x, eps);
        ASSERT_NEAR(a.y, b.y, eps);
    }
}

TEST(Viewport, to_canvas_applies_zoom_then_pan)
{
    const ViewportState v{.zoom = 2.0, .pan_offset = {10.0, -5.0}};
    ASSERT_EQ(to_canvas({3.0, 4.0}, v), Vec2(16.0, 3.0));
}

TEST(Viewport, to_image_is_inverse_of_to_canvas)
{
    const auto viewports = std::to_array<ViewportState>({
        {.zoom = 1.0, .pan_offset = {0.0, 0.0}},
        {.zoom = 0.1, .pan_offset = {-300.0, 12.5}},
        {.zoom = 3.7, .pan_offset = {1234.5, -987.25}},
        {.zoom = 5.0, .pan_offset = {0.333, 0.777}},
    });
    const auto points = std::to_array<Vec2>({{0.0, 0.0}, {10.0, 10.0}, {-42.5, 1e4}, {0.1, 0.2}});

    for (const auto& v : viewports) {
        for (const auto& p : points) {
            assert_near(to_image(to_canvas(p, v), v), p, 1e-7);
        }
    }
}

TEST(Viewport, to_image_throws_on_non_positive_zoom)
{
    ASSERT_THROW({ [[maybe_unused]] auto p = to_image({1.0, 1.0}, {.zoom = 0.0}); }, InvalidZoom);
    ASSERT_THROW({ [[maybe_unused]] auto p = to_image({1.0, 1.0}, {.zoom = -1.0}); }, InvalidZoom);
}

TEST(Viewport, zoom_at_keeps_focal_point_stationary)
{
    const ViewportState old_v{.zoom = 1.5, .pan_offset = {20.0, 30.0}};
    const Vec2 focal{200.0, 150.0};

    const ViewportState new_v = zoom_at(old_v, focal, 3.0);

    ASSERT_EQ(new_v.zoom, 3.0);
    assert_near(to_canvas(to_image(focal, old_v), new_v), focal);
}

TEST(Viewport, zoom_at_uses_anchoring_formula)
{
    const ViewportState old_v{.zoom = 1.0, .pan_offset = {0.0, 0.0}};
    const ViewportState new_v = zoom_at(old_v, {100.0, 100.0}, 2.0);
    assert_near(new_v.pan_offset, {-100.0, -100.0});
}

TEST(Viewport, zoom_at_throws_on_invalid_or_out_of_bounds_zoom)
{
    const ViewportState v;
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, 0.0); }, InvalidZoom);
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, -2.0); }, InvalidZoom);
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, std::numeric_limits<double>::quiet_NaN()); }, InvalidZoom);
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, 5.01); }, InvalidZoom);
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, 0.09); }, InvalidZoom);
    ASSERT_NO_THROW({ [[maybe_unused]] auto r = zoom_at(v, {}, 5.0); });
}

TEST(Viewport, zoom_at_respects_custom_bounds)
{
    const ViewportParameters params{.min_zoom = 0.5, .max_zoom = 20.0};
    ASSERT_NO_THROW({ [[maybe_unused]] auto r = zoom_at({}, {}, 10.0, params); });
    ASSERT_THROW({ [[maybe_unused]] auto r = zoom_at({}, {}, 0.4, params); }, InvalidZoom);
}

TEST(Viewport, zoom_in_and_out_step_by_configured_factor)
{
    const ViewportState zoomed_in = zoom_in({}, {50.0, 50.0});
    ASSERT_DOUBLE_EQ(zoomed_in.zoom, 1.2);

    const ViewportState zoomed_back = zoom_out(zoomed_in, {50.0, 50.0});
    ASSERT_DOUBLE_EQ(zoomed_back.zoom, 1.0);
    assert_near(zoomed_back.pan_offset, {0.0, 0.0});
}

TEST(Viewport, zoom_in_clamps_at_max_zoom)
{
    const ViewportState v = zoom_in({.zoom = 4.9}, {});
    ASSERT_EQ(v.zoom, 5.0);
    ASSERT_EQ(zoom_in(v, {}).zoom, 5.0);
}

TEST(Viewport, zoom_out_clamps_at_min_zoom)
{
    ASSERT_EQ(zoom_out({.zoom = 0.11}, {}).zoom, 0.1);
}

TEST(Viewport, wheel_zoom_anchors_on_pointer)
{
    const ViewportState old_v{.zoom = 1.0, .pan_offset = {5.0, 5.0}};
    const Vec2 pointer{320.0, 240.0};
    const ViewportState new_v = wheel_zoom(old_v, pointer, 2);

    ASSERT_NEAR(new_v.zoom, 1.21, 1e-12);
    assert_near(to_canvas(to_image(pointer, old_v), new_v), pointer);
}

TEST(Viewport, pan_by_translates_offset_only)
{
    const ViewportState v = pan_by({.zoom = 2.0, .pan_offset = {1.0, 1.0}}, {10.0, -3.0});
    ASSERT_EQ(v, (ViewportState{.zoom = 2.0, .pan_offset = {11.0, -2.0}}));
}

TEST(Viewport, reset_viewport_is_identity)
{
    ASSERT_EQ(reset_viewport(), (ViewportState{.zoom = 1.0, .pan_offset = {0.0, 0.0}}));
}

TEST(Viewport, fit_to_canvas_scales_with_margin_and_centers)
{
    const ViewportState v = fit_to_canvas({1000.0, 500.0}, {800.0, 600.0});

    ASSERT_DOUBLE_EQ(v.zoom, 0.72);  // 0.9 * min(0.8, 1.2)
    assert_near(to_canvas({500.0, 250.0}, v), {400.0, 300.0});
}

TEST(Viewport, fit_to_canvas_throws_on_empty_image)
{
    ASSERT_THROW({ [[maybe_unused]] auto v = fit_to_canvas({0.0, 10.0}, {800.0, 600.0}); }, InvalidZoom);
}

TEST(Viewport, to_image_distance_divides_by_zoom)
{
    ASSERT_DOUBLE_EQ(to_image_distance(10.0, {.zoom = 2.0}), 5.0);
    ASSERT_DOUBLE_EQ(to_image_distance(10.0, {.zoom = 0.5}), 20.0);
}

TEST(Viewport, exceeds_drag_threshold_is_inclusive)
{
    ASSERT_FALSE(exceeds_drag_threshold({0.0, 0.0}, {3.0, 3.0}, 5.0));
    ASSERT_TRUE(exceeds_drag_threshold({0.0, 0.0}, {3.0, 4.0}, 5.0));
}
