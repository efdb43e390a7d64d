#include "Rect.h"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace iml;

TEST(Rect, from_corners_normalizes_corner_order)
{
    const Rect r = Rect::from_corners({100.0, 100.0}, {10.0, 10.0});
    ASSERT_EQ(r.p1(), Vec2(10.0, 10.0));
    ASSERT_EQ(r.p2(), Vec2(100.0, 100.0));
}

TEST(Rect, from_corners_normalizes_mixed_corners)
{
    const Rect r = Rect::from_corners({100.0, 10.0}, {10.0, 100.0});
    ASSERT_EQ(r, Rect::from_corners({10.0, 10.0}, {100.0, 100.0}));
}

TEST(Rect, dimensions_and_area)
{
    const Rect r = Rect::from_corners({10.0, 20.0}, {40.0, 60.0});
    ASSERT_EQ(r.width(), 30.0);
    ASSERT_EQ(r.height(), 40.0);
    ASSERT_EQ(r.area(), 1200.0);
    ASSERT_EQ(r.origin(), Vec2(25.0, 40.0));
}

TEST(Rect, corner_is_ordered_clockwise_from_top_left)
{
    const Rect r = Rect::from_corners({0.0, 0.0}, {4.0, 2.0});
    ASSERT_EQ(r.corner(0), Vec2(0.0, 0.0));
    ASSERT_EQ(r.corner(1), Vec2(4.0, 0.0));
    ASSERT_EQ(r.corner(2), Vec2(4.0, 2.0));
    ASSERT_EQ(r.corner(3), Vec2(0.0, 2.0));
    ASSERT_THROW({ [[maybe_unused]] auto c = r.corner(4); }, std::out_of_range);
}

TEST(Rect, contains_is_inclusive_of_boundary)
{
    const Rect r = Rect::from_corners({10.0, 10.0}, {100.0, 100.0});
    ASSERT_TRUE(r.contains({50.0, 50.0}));
    ASSERT_TRUE(r.contains({10.0, 10.0}));
    ASSERT_TRUE(r.contains({100.0, 55.0}));
    ASSERT_FALSE(r.contains({100.0001, 55.0}));
    ASSERT_FALSE(r.contains({9.0, 9.0}));
}

TEST(Rect, with_origin_translated_moves_both_corners)
{
    const Rect r = Rect::from_corners({10.0, 10.0}, {20.0, 20.0}).with_origin_translated({5.0, -5.0});
    ASSERT_EQ(r, Rect::from_corners({15.0, 5.0}, {25.0, 15.0}));
}
