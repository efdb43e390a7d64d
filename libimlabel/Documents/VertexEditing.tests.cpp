#include "VertexEditing.h"

#include <libimlabel/Documents/Project.h>
#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <variant>
#include <vector>

using namespace iml;

namespace
{
    const Polygon c_square{{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}}};
    const Polygon c_triangle{{{0.0, 0.0}, {10.0, 0.0}, {0.0, 10.0}}};
}

TEST(with_vertex_moved, moves_exactly_one_polygon_vertex)
{
    const auto result = std::get<Polygon>(with_vertex_moved(c_square, 2, {20.0, 20.0}));
    const std::vector<Vec2> expected = {{0.0, 0.0}, {10.0, 0.0}, {20.0, 20.0}, {0.0, 10.0}};
    ASSERT_EQ(result.vertices, expected);
}

TEST(with_vertex_moved, rectangle_corner_keeps_opposite_corner_fixed)
{
    const Rect r = Rect::from_corners({10.0, 10.0}, {100.0, 100.0});
    const auto moved = std::get<Rect>(with_vertex_moved(r, 1, {150.0, 0.0}));  // drag top-right
    ASSERT_EQ(moved, Rect::from_corners({10.0, 0.0}, {150.0, 100.0}));
}

TEST(with_vertex_moved, rectangle_corner_dragged_past_opposite_corner_is_renormalized)
{
    const Rect r = Rect::from_corners({10.0, 10.0}, {100.0, 100.0});
    const auto moved = std::get<Rect>(with_vertex_moved(r, 0, {200.0, 150.0}));  // drag top-left past bottom-right
    ASSERT_EQ(moved.p1(), Vec2(100.0, 100.0));
    ASSERT_EQ(moved.p2(), Vec2(200.0, 150.0));
}

TEST(with_vertex_moved, circle_center_handle_translates_circle)
{
    const auto moved = std::get<Circle>(with_vertex_moved(Circle{.origin = {50.0, 50.0}, .radius = 10.0}, 0, {60.0, 70.0}));
    ASSERT_EQ(moved, (Circle{.origin = {60.0, 70.0}, .radius = 10.0}));
}

TEST(with_vertex_moved, circle_radius_handle_sets_radius_to_distance_from_center)
{
    const auto moved = std::get<Circle>(with_vertex_moved(Circle{.origin = {0.0, 0.0}, .radius = 10.0}, 1, {3.0, 4.0}));
    ASSERT_EQ(moved, (Circle{.origin = {0.0, 0.0}, .radius = 5.0}));
}

TEST(with_vertex_moved, point_moves_to_new_location)
{
    ASSERT_EQ(std::get<Vec2>(with_vertex_moved(Vec2{1.0, 1.0}, 0, {5.0, 6.0})), Vec2(5.0, 6.0));
}

TEST(with_vertex_moved, throws_not_found_for_nonexistent_handle)
{
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_moved(c_square, 4, {}); }, NotFound);
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_moved(Circle{}, 2, {}); }, NotFound);
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_moved(Vec2{}, 1, {}); }, NotFound);
}

TEST(with_vertex_inserted, splits_the_given_edge)
{
    const auto result = std::get<Polygon>(with_vertex_inserted(c_square, 1, {12.0, 5.0}));
    const std::vector<Vec2> expected = {{0.0, 0.0}, {10.0, 0.0}, {12.0, 5.0}, {10.0, 10.0}, {0.0, 10.0}};
    ASSERT_EQ(result.vertices, expected);
}

TEST(with_vertex_inserted, splitting_closing_edge_appends_vertex)
{
    const auto result = std::get<Polygon>(with_vertex_inserted(c_square, 3, {-2.0, 5.0}));
    ASSERT_EQ(result.vertices.size(), 5);
    ASSERT_EQ(result.vertices.back(), Vec2(-2.0, 5.0));
}

TEST(with_vertex_inserted, throws_for_non_polygons_and_bad_edges)
{
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_inserted(Rect{}, 0, {}); }, InvalidGeometry);
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_inserted(c_square, 4, {}); }, NotFound);
}

TEST(with_vertex_deleted, removes_the_vertex)
{
    const auto result = std::get<Polygon>(with_vertex_deleted(c_square, 0));
    const std::vector<Vec2> expected = {{10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}};
    ASSERT_EQ(result.vertices, expected);
}

TEST(with_vertex_deleted, throws_invalid_geometry_when_only_three_vertices_remain)
{
    ASSERT_THROW({ [[maybe_unused]] auto g = with_vertex_deleted(c_triangle, 0); }, InvalidGeometry);
}

TEST(with_translation, translates_every_kind)
{
    const Vec2 d{5.0, -5.0};
    ASSERT_EQ(std::get<Vec2>(with_translation(Vec2{1.0, 1.0}, d)), Vec2(6.0, -4.0));
    ASSERT_EQ(std::get<Rect>(with_translation(Rect::from_corners({0.0, 0.0}, {1.0, 1.0}), d)), Rect::from_corners({5.0, -5.0}, {6.0, -4.0}));
    ASSERT_EQ(std::get<Circle>(with_translation(Circle{.origin = {}, .radius = 3.0}, d)), (Circle{.origin = d, .radius = 3.0}));
    ASSERT_EQ(std::get<Polygon>(with_translation(c_triangle, d)).vertices.front(), d);
}

TEST(delete_vertex, leaves_polygon_unchanged_when_it_would_drop_below_three_vertices)
{
    Project project;
    const size_t image = project.add_image("a.png");
    const AnnotationID id = project.create_annotation(image, c_triangle);

    ASSERT_THROW(delete_vertex(project, id, 1), InvalidGeometry);
    ASSERT_EQ(project.get_annotation(id).geometry, AnnotationGeometry{c_triangle});
}

TEST(move_vertex, only_changes_the_targeted_annotation)
{
    Project project;
    const size_t image = project.add_image("a.png");
    const AnnotationID a = project.create_annotation(image, c_square);
    const AnnotationID b = project.create_annotation(image, c_square);

    move_vertex(project, a, 0, {-5.0, -5.0});

    ASSERT_EQ(std::get<Polygon>(project.get_annotation(a).geometry).vertices.front(), Vec2(-5.0, -5.0));
    ASSERT_EQ(project.get_annotation(b).geometry, AnnotationGeometry{c_square});
}

TEST(insert_vertex, throws_not_found_for_unknown_annotation)
{
    Project project;
    project.add_image("a.png");
    ASSERT_THROW(insert_vertex(project, AnnotationID{42}, 0, {}), NotFound);
}

TEST(translate_annotation, moves_the_whole_shape)
{
    Project project;
    const size_t image = project.add_image("a.png");
    const AnnotationID id = project.create_annotation(image, Rect::from_corners({0.0, 0.0}, {10.0, 10.0}));

    translate_annotation(project, id, {5.0, 5.0});

    ASSERT_EQ(project.get_annotation(id).geometry, AnnotationGeometry{Rect::from_corners({5.0, 5.0}, {15.0, 15.0})});
}
