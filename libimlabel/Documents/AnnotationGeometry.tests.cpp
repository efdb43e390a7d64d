#include "AnnotationGeometry.h"

#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <numbers>
#include <vector>

using namespace iml;

namespace
{
    const Polygon c_triangle{{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}}};
}

TEST(AnnotationGeometry, kind_of_matches_alternative)
{
    ASSERT_EQ(kind_of(AnnotationGeometry{Vec2{1.0, 2.0}}), AnnotationKind::Point);
    ASSERT_EQ(kind_of(AnnotationGeometry{Rect::from_corners({0.0, 0.0}, {1.0, 1.0})}), AnnotationKind::Rectangle);
    ASSERT_EQ(kind_of(AnnotationGeometry{Circle{.origin = {}, .radius = 1.0}}), AnnotationKind::Circle);
    ASSERT_EQ(kind_of(AnnotationGeometry{c_triangle}), AnnotationKind::Polygon);
}

TEST(AnnotationGeometry, validate_rejects_polygon_with_fewer_than_three_vertices)
{
    ASSERT_THROW(validate(Polygon{{{0.0, 0.0}, {1.0, 1.0}}}), InvalidGeometry);
    ASSERT_NO_THROW(validate(c_triangle));
}

TEST(AnnotationGeometry, validate_rejects_negative_radius)
{
    ASSERT_THROW(validate(Circle{.origin = {}, .radius = -1.0}), InvalidGeometry);
    ASSERT_NO_THROW(validate(Circle{.origin = {}, .radius = 0.0}));
}

TEST(AnnotationGeometry, validate_rejects_non_finite_coordinates)
{
    const double nan = std::numeric_limits<double>::quiet_NaN();
    ASSERT_THROW(validate(Vec2{nan, 0.0}), InvalidGeometry);
    ASSERT_THROW(validate(Circle{.origin = {}, .radius = std::numeric_limits<double>::infinity()}), InvalidGeometry);
    ASSERT_FALSE(is_valid(Polygon{{{0.0, 0.0}, {1.0, nan}, {2.0, 2.0}}}));
}

TEST(AnnotationGeometry, vertex_handles_of_rectangle_are_corners_clockwise_from_top_left)
{
    const auto handles = vertex_handles_of(Rect::from_corners({10.0, 20.0}, {30.0, 40.0}));
    const std::vector<Vec2> expected = {{10.0, 20.0}, {30.0, 20.0}, {30.0, 40.0}, {10.0, 40.0}};
    ASSERT_EQ(handles, expected);
}

TEST(AnnotationGeometry, vertex_handles_of_circle_are_center_and_radius_handle)
{
    const auto handles = vertex_handles_of(Circle{.origin = {50.0, 50.0}, .radius = 10.0});
    const std::vector<Vec2> expected = {{50.0, 50.0}, {60.0, 50.0}};
    ASSERT_EQ(handles, expected);
    ASSERT_EQ(num_vertex_handles(Circle{}), 2);
}

TEST(AnnotationGeometry, body_contains_follows_each_kind)
{
    ASSERT_FALSE(body_contains(Vec2{1.0, 1.0}, {1.0, 1.0}));
    ASSERT_TRUE(body_contains(Rect::from_corners({0.0, 0.0}, {10.0, 10.0}), {10.0, 5.0}));
    ASSERT_TRUE(body_contains(Circle{.origin = {0.0, 0.0}, .radius = 5.0}, {0.0, 5.0}));
    ASSERT_TRUE(body_contains(c_triangle, {5.0, 5.0}));  // on the hypotenuse
    ASSERT_FALSE(body_contains(c_triangle, {6.0, 6.0}));
}

TEST(AnnotationGeometry, area_of_each_kind)
{
    ASSERT_EQ(area_of(AnnotationGeometry{Vec2{1.0, 1.0}}), 0.0);
    ASSERT_EQ(area_of(AnnotationGeometry{Rect::from_corners({10.0, 10.0}, {100.0, 100.0})}), 8100.0);
    ASSERT_DOUBLE_EQ(area_of(AnnotationGeometry{Circle{.origin = {}, .radius = 2.0}}), 4.0*std::numbers::pi);
    ASSERT_DOUBLE_EQ(area_of(AnnotationGeometry{c_triangle}), 50.0);
}

TEST(AnnotationGeometry, bounding_rect_of_each_kind)
{
    ASSERT_EQ(bounding_rect_of(AnnotationGeometry{Vec2{3.0, 4.0}}), Rect::from_point({3.0, 4.0}));
    ASSERT_EQ(bounding_rect_of(AnnotationGeometry{c_triangle}), Rect::from_corners({0.0, 0.0}, {10.0, 10.0}));
    ASSERT_EQ(bounding_rect_of(AnnotationGeometry{Circle{.origin = {5.0, 5.0}, .radius = 5.0}}), Rect::from_corners({0.0, 0.0}, {10.0, 10.0}));
}

TEST(AnnotationGeometry, edge_loop_of_is_empty_for_points_and_circles)
{
    ASSERT_TRUE(edge_loop_of(Vec2{}).empty());
    ASSERT_TRUE(edge_loop_of(Circle{}).empty());
    ASSERT_EQ(edge_loop_of(c_triangle).size(), 3);
    ASSERT_EQ(edge_loop_of(Rect{}).size(), 4);
}

TEST(AnnotationGeometry, to_summary_string_describes_geometry)
{
    ASSERT_EQ(to_summary_string(Rect::from_corners({10.0, 10.0}, {100.0, 100.0})), "Rectangle (10, 10) - (100, 100)");
    ASSERT_EQ(to_summary_string(c_triangle), "Polygon 3 vertices");
}
