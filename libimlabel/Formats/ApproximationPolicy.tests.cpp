#include "ApproximationPolicy.h"

#include <libimlabel/Utils/Exceptions.h>

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace iml;

TEST(to_export_shape, rectangle_is_exported_exactly)
{
    const ExportShape shape = to_export_shape(Rect::from_corners({10.0, 10.0}, {100.0, 50.0}), {});

    const std::vector<Vec2> expected = {{10.0, 10.0}, {100.0, 10.0}, {100.0, 50.0}, {10.0, 50.0}};
    ASSERT_EQ(shape.outline, expected);
    ASSERT_EQ(shape.bounds, Rect::from_corners({10.0, 10.0}, {100.0, 50.0}));
    ASSERT_EQ(shape.area, 3600.0);
    ASSERT_FALSE(shape.is_approximation);
}

TEST(to_export_shape, polygon_is_exported_exactly)
{
    const Polygon triangle{{{0.0, 0.0}, {4.0, 0.0}, {0.0, 3.0}}};
    const ExportShape shape = to_export_shape(triangle, {});
    ASSERT_EQ(shape.outline, triangle.vertices);
    ASSERT_EQ(shape.area, 6.0);
    ASSERT_EQ(shape.bounds, Rect::from_corners({0.0, 0.0}, {4.0, 3.0}));
}

TEST(to_export_shape, point_becomes_square_of_configured_size)
{
    const ExportShape shape = to_export_shape(Vec2{50.0, 60.0}, {});

    const std::vector<Vec2> expected = {{49.0, 59.0}, {51.0, 59.0}, {51.0, 61.0}, {49.0, 61.0}};
    ASSERT_EQ(shape.outline, expected);
    ASSERT_EQ(shape.area, 4.0);
    ASSERT_TRUE(shape.is_approximation);

    const ExportShape bigger = to_export_shape(Vec2{50.0, 60.0}, {.point_box_size = 10.0});
    ASSERT_EQ(bigger.bounds, Rect::from_corners({45.0, 55.0}, {55.0, 65.0}));
}

TEST(to_export_shape, circle_becomes_regular_polygon_starting_at_angle_zero)
{
    const ExportShape shape = to_export_shape(Circle{.origin = {100.0, 100.0}, .radius = 10.0}, {});

    ASSERT_EQ(shape.outline.size(), 16);
    ASSERT_DOUBLE_EQ(shape.outline[0].x, 110.0);
    ASSERT_DOUBLE_EQ(shape.outline[0].y, 100.0);
    ASSERT_NEAR(shape.outline[4].x, 100.0, 1e-9);
    ASSERT_NEAR(shape.outline[4].y, 110.0, 1e-9);
    ASSERT_NEAR(shape.bounds.left(), 90.0, 1e-9);
    ASSERT_NEAR(shape.bounds.bottom(), 110.0, 1e-9);
    ASSERT_TRUE(shape.is_approximation);
}

TEST(to_export_shape, circle_side_count_is_configurable)
{
    const ExportShape shape = to_export_shape(Circle{.origin = {}, .radius = 1.0}, {.circle_polygon_sides = 8});
    ASSERT_EQ(shape.outline.size(), 8);
}

TEST(to_export_shape, disabled_approximation_throws_unsupported_kind_with_location)
{
    const ApproximationPolicy strict{.allow_approximation = false};
    const CodecErrorLocation location{.source = "coco.json", .image_index = 1, .annotation_index = 3};

    try {
        [[maybe_unused]] auto shape = to_export_shape(Circle{.origin = {}, .radius = 1.0}, strict, location);
        FAIL() << "expected an exception";
    }
    catch (const UnsupportedKind& ex) {
        ASSERT_EQ(ex.location(), location);
    }

    ASSERT_THROW({ [[maybe_unused]] auto s = to_export_shape(Vec2{}, strict); }, UnsupportedKind);
    ASSERT_NO_THROW({ [[maybe_unused]] auto s = to_export_shape(Rect{}, strict); });
}

TEST(to_export_shape, throws_invalid_argument_for_degenerate_policy)
{
    const Circle circle{.origin = {}, .radius = 1.0};

    ASSERT_THROW({ [[maybe_unused]] auto s = to_export_shape(circle, {.circle_polygon_sides = 2}); }, std::invalid_argument);
    ASSERT_THROW({ [[maybe_unused]] auto s = to_export_shape(Vec2{}, {.point_box_size = 0.0}); }, std::invalid_argument);
    ASSERT_THROW({ [[maybe_unused]] auto s = to_export_shape(Vec2{}, {.point_box_size = -1.0}); }, std::invalid_argument);
    ASSERT_NO_THROW({ [[maybe_unused]] auto s = to_export_shape(circle, {.circle_polygon_sides = 3}); });
}
