#include "HitTesting.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

using namespace iml;

namespace
{
    Annotation make_annotation(int64_t id, AnnotationGeometry geometry)
    {
        return Annotation{.id = AnnotationID{id}, .geometry = std::move(geometry), .label = std::nullopt, .color_override = std::nullopt};
    }

    const Polygon c_square{{{0.0, 0.0}, {100.0, 0.0}, {100.0, 100.0}, {0.0, 100.0}}};
}

TEST(hit_test, returns_nullopt_when_nothing_is_hit)
{
    const std::vector<Annotation> annotations = {make_annotation(1, c_square)};
    ASSERT_EQ(hit_test({500.0, 500.0}, {}, annotations, 5.0), std::nullopt);
}

TEST(hit_test, exactly_on_polygon_vertex_returns_vertex_not_body)
{
    const std::vector<Annotation> annotations = {make_annotation(1, c_square)};
    const auto hit = hit_test({100.0, 100.0}, {}, annotations, 5.0);
    ASSERT_EQ(hit, (AnnotationHit{.id = AnnotationID{1}, .vertex_index = 2}));
}

TEST(hit_test, inside_polygon_returns_body_hit)
{
    const std::vector<Annotation> annotations = {make_annotation(1, c_square)};
    const auto hit = hit_test({50.0, 50.0}, {}, annotations, 5.0);
    ASSERT_EQ(hit, (AnnotationHit{.id = AnnotationID{1}, .vertex_index = std::nullopt}));
}

TEST(hit_test, vertex_of_lower_annotation_beats_body_of_upper_annotation)
{
    const std::vector<Annotation> annotations = {
        make_annotation(1, Vec2{50.0, 50.0}),
        make_annotation(2, c_square),
    };
    const auto hit = hit_test({52.0, 50.0}, {}, annotations, 5.0);
    ASSERT_EQ(hit, (AnnotationHit{.id = AnnotationID{1}, .vertex_index = 0}));
}

TEST(hit_test, nearest_vertex_wins)
{
    const std::vector<Annotation> annotations = {
        make_annotation(1, Vec2{10.0, 10.0}),
        make_annotation(2, Vec2{14.0, 10.0}),
    };
    ASSERT_EQ(hit_test({11.0, 10.0}, {}, annotations, 5.0)->id, AnnotationID{1});
    ASSERT_EQ(hit_test({13.0, 10.0}, {}, annotations, 5.0)->id, AnnotationID{2});
}

TEST(hit_test, equidistant_vertices_resolve_to_topmost)
{
    const std::vector<Annotation> annotations = {
        make_annotation(1, Vec2{10.0, 10.0}),
        make_annotation(2, Vec2{10.0, 10.0}),
    };
    ASSERT_EQ(hit_test({10.0, 10.0}, {}, annotations, 5.0)->id, AnnotationID{2});
}

TEST(hit_test, overlapping_bodies_resolve_to_most_recent)
{
    const std::vector<Annotation> annotations = {
        make_annotation(1, Rect::from_corners({0.0, 0.0}, {100.0, 100.0})),
        make_annotation(2, Circle{.origin = {50.0, 50.0}, .radius = 20.0}),
    };
    ASSERT_EQ(hit_test({50.0, 45.0}, {}, annotations, 5.0), (AnnotationHit{.id = AnnotationID{2}, .vertex_index = std::nullopt}));
    ASSERT_EQ(hit_test({90.0, 50.0}, {}, annotations, 5.0), (AnnotationHit{.id = AnnotationID{1}, .vertex_index = std::nullopt}));
}

TEST(hit_test, polygon_boundary_counts_as_body)
{
    const std::vector<Annotation> annotations = {make_annotation(1, c_square)};
    ASSERT_EQ(hit_test({50.0, 0.0}, {}, annotations, 1.0), (AnnotationHit{.id = AnnotationID{1}, .vertex_index = std::nullopt}));
}

TEST(hit_test, circle_radius_handle_is_vertex_one)
{
    const std::vector<Annotation> annotations = {make_annotation(1, Circle{.origin = {50.0, 50.0}, .radius = 20.0})};
    ASSERT_EQ(hit_test({70.0, 51.0}, {}, annotations, 5.0), (AnnotationHit{.id = AnnotationID{1}, .vertex_index = 1}));
}

TEST(hit_test, tolerance_is_constant_in_canvas_pixels)
{
    const std::vector<Annotation> annotations = {make_annotation(1, Vec2{10.0, 10.0})};

    // at 4x zoom the vertex is at canvas (40, 40): 4 canvas px away is within tolerance
    const ViewportState zoomed_in{.zoom = 4.0, .pan_offset = {}};
    ASSERT_TRUE(hit_test({44.0, 40.0}, zoomed_in, annotations, 5.0).has_value());
    ASSERT_FALSE(hit_test({46.0, 40.0}, zoomed_in, annotations, 5.0).has_value());

    // at 0.5x zoom the vertex is at canvas (5, 5)
    const ViewportState zoomed_out{.zoom = 0.5, .pan_offset = {}};
    ASSERT_TRUE(hit_test({9.0, 5.0}, zoomed_out, annotations, 5.0).has_value());
    ASSERT_FALSE(hit_test({11.0, 5.0}, zoomed_out, annotations, 5.0).has_value());
}

TEST(hit_test, accounts_for_pan_offset)
{
    const std::vector<Annotation> annotations = {make_annotation(1, Vec2{10.0, 10.0})};
    const ViewportState panned{.zoom = 1.0, .pan_offset = {100.0, 200.0}};
    ASSERT_EQ(hit_test({110.0, 210.0}, panned, annotations, 5.0), (AnnotationHit{.id = AnnotationID{1}, .vertex_index = 0}));
}

TEST(hit_test_edge, finds_polygon_edge_near_pointer)
{
    const std::vector<Annotation> annotations = {make_annotation(1, c_square)};
    const auto hit = hit_test_edge({50.0, 2.0}, {}, annotations, 5.0);

    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(hit->id, AnnotationID{1});
    ASSERT_EQ(hit->edge_index, 0);
    ASSERT_EQ(hit->closest_image_point, Vec2(50.0, 0.0));
}

TEST(hit_test_edge, ignores_points_and_circles)
{
    const std::vector<Annotation> annotations = {
        make_annotation(1, Vec2{50.0, 2.0}),
        make_annotation(2, Circle{.origin = {50.0, 50.0}, .radius = 48.0}),
    };
    ASSERT_EQ(hit_test_edge({50.0, 2.0}, {}, annotations, 5.0), std::nullopt);
}
