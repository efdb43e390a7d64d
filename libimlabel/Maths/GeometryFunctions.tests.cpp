#include "GeometryFunctions.h"

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <numbers>
#include <vector>

using namespace iml;

namespace
{
    const std::vector<Vec2> c_square = {{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}};
}

TEST(distance_to_segment, returns_perpendicular_distance_within_segment)
{
    ASSERT_DOUBLE_EQ(distance_to_segment({5.0, 3.0}, {0.0, 0.0}, {10.0, 0.0}), 3.0);
}

TEST(distance_to_segment, returns_distance_to_nearest_endpoint_outside_segment)
{
    ASSERT_DOUBLE_EQ(distance_to_segment({13.0, 4.0}, {0.0, 0.0}, {10.0, 0.0}), 5.0);
}

TEST(distance_to_segment, handles_degenerate_segment)
{
    ASSERT_DOUBLE_EQ(distance_to_segment({3.0, 4.0}, {0.0, 0.0}, {0.0, 0.0}), 5.0);
}

TEST(polygon_contains, returns_true_for_interior_point)
{
    ASSERT_TRUE(polygon_contains(c_square, {5.0, 5.0}));
}

TEST(polygon_contains, returns_false_for_exterior_point)
{
    ASSERT_FALSE(polygon_contains(c_square, {15.0, 5.0}));
    ASSERT_FALSE(polygon_contains(c_square, {-0.5, 5.0}));
}

TEST(polygon_contains, points_on_edges_and_vertices_are_inside)
{
    ASSERT_TRUE(polygon_contains(c_square, {10.0, 5.0}));
    ASSERT_TRUE(polygon_contains(c_square, {5.0, 0.0}));
    ASSERT_TRUE(polygon_contains(c_square, {0.0, 0.0}));
    ASSERT_TRUE(polygon_contains(c_square, {10.0, 10.0}));
}

TEST(polygon_contains, handles_concave_polygons)
{
    // a "U" shape, open at the top
    const std::vector<Vec2> u = {{0.0, 0.0}, {3.0, 0.0}, {3.0, 8.0}, {7.0, 8.0}, {7.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}};
    ASSERT_FALSE(polygon_contains(u, {5.0, 4.0}));
    ASSERT_TRUE(polygon_contains(u, {1.0, 4.0}));
    ASSERT_TRUE(polygon_contains(u, {5.0, 9.0}));
}

TEST(contains, circle_includes_circumference)
{
    const Circle c{.origin = {0.0, 0.0}, .radius = 5.0};
    ASSERT_TRUE(contains(c, {3.0, 4.0}));
    ASSERT_TRUE(contains(c, {0.0, 0.0}));
    ASSERT_FALSE(contains(c, {4.0, 4.0}));
}

TEST(polygon_area, computes_area_with_shoelace_formula)
{
    ASSERT_DOUBLE_EQ(polygon_area(c_square), 100.0);
}

TEST(polygon_area, is_independent_of_winding_order)
{
    const std::vector<Vec2> reversed(c_square.rbegin(), c_square.rend());
    ASSERT_DOUBLE_EQ(polygon_area(reversed), 100.0);
}

TEST(polygon_area, returns_zero_for_fewer_than_three_vertices)
{
    ASSERT_EQ(polygon_area(std::span<const Vec2>{c_square}.first(2)), 0.0);
}

TEST(area_of, circle_is_pi_r_squared)
{
    ASSERT_DOUBLE_EQ(area_of(Circle{.origin = {1.0, 1.0}, .radius = 2.0}), 4.0 * std::numbers::pi);
}

TEST(bounding_rect_of, returns_nullopt_for_no_points)
{
    ASSERT_EQ(bounding_rect_of(std::span<const Vec2>{}), std::nullopt);
}

TEST(bounding_rect_of, returns_tight_bounds_of_points)
{
    const std::array<Vec2, 3> pts = {Vec2{5.0, 1.0}, Vec2{-2.0, 7.0}, Vec2{3.0, 3.0}};
    ASSERT_EQ(bounding_rect_of(pts), Rect::from_corners({-2.0, 1.0}, {5.0, 7.0}));
}

TEST(bounding_rect_of, circle_bounds_are_center_plus_minus_radius)
{
    ASSERT_EQ(bounding_rect_of(Circle{.origin = {50.0, 50.0}, .radius = 10.0}), Rect::from_corners({40.0, 40.0}, {60.0, 60.0}));
}

TEST(regular_polygon_vertices_of, starts_at_angle_zero_and_lies_on_circle)
{
    const Circle c{.origin = {50.0, 50.0}, .radius = 10.0};
    const auto verts = regular_polygon_vertices_of(c, 16);

    ASSERT_EQ(verts.size(), 16);
    ASSERT_DOUBLE_EQ(verts.front().x, 60.0);
    ASSERT_DOUBLE_EQ(verts.front().y, 50.0);
    for (const Vec2& v : verts) {
        ASSERT_NEAR(distance(v, c.origin), 10.0, 1e-9);
    }
}

TEST(nearest_edge_within, finds_closest_edge_including_closing_edge)
{
    ASSERT_EQ(nearest_edge_within(c_square, {5.0, 1.0}, 2.0), 0);
    ASSERT_EQ(nearest_edge_within(c_square, {9.0, 5.0}, 2.0), 1);
    ASSERT_EQ(nearest_edge_within(c_square, {1.0, 5.0}, 2.0), 3);
}

TEST(nearest_edge_within, returns_nullopt_if_nothing_within_tolerance)
{
    ASSERT_EQ(nearest_edge_within(c_square, {5.0, 5.0}, 2.0), std::nullopt);
}

TEST(nearest_vertex_within, picks_closest_vertex)
{
    ASSERT_EQ(nearest_vertex_within(c_square, {9.0, 9.5}, 3.0), 2);
    ASSERT_EQ(nearest_vertex_within(c_square, {5.0, 5.0}, 3.0), std::nullopt);
}
