// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "geometry.hpp"

#include <gtest/gtest.h>

#include <limits>

using namespace Aseprite;

TEST(DimensionsTest, Empty)
{
    Dimensions sz;
    EXPECT_TRUE(sz.empty());

    sz.w = 10;
    EXPECT_TRUE(sz.empty());

    sz.h = 20;
    EXPECT_FALSE(sz.empty());
}

TEST(RectTest, Size)
{
    const Rect rect { -1, 2, 30, 40 };
    EXPECT_EQ(rect.size(), (Dimensions { 30, 40 }));
    EXPECT_FALSE(rect.empty());
    EXPECT_TRUE((Rect { 1, 2, 0, 4 }).empty());
}

TEST(RectTest, Contains)
{
    const Rect rect { 2, 3, 4, 5 };
    EXPECT_TRUE(rect.contains({ 2, 3 }));
    EXPECT_TRUE(rect.contains({ 5, 7 }));
    EXPECT_FALSE(rect.contains({ 6, 7 }));
    EXPECT_FALSE(rect.contains({ 5, 8 }));
    EXPECT_FALSE(rect.contains({ 1, 3 }));

    const Rect far { std::numeric_limits<int32_t>::max() - 1, 0, 10, 10 };
    EXPECT_TRUE(far.contains({ std::numeric_limits<int32_t>::max(), 0 }));
}

TEST(RectTest, Intersection)
{
    // partial overlap
    const Rect partial = Rect { -2, -3, 10, 11 }.intersect({ 5, 6, 9, 10 });
    EXPECT_EQ(partial, (Rect { 5, 6, 3, 2 }));

    // no overlap (completely outside)
    const Rect out = Rect { 0, 0, 10, 10 }.intersect({ 20, 20, 5, 5 });
    EXPECT_TRUE(out.empty());

    // one contains another
    const Rect contain = Rect { 2, 3, 4, 5 }.intersect({ 0, 0, 10, 10 });
    EXPECT_EQ(contain, (Rect { 2, 3, 4, 5 }));

    // edge touch (no actual area overlap)
    const Rect edge = Rect { 0, 0, 10, 10 }.intersect({ 10, 0, 5, 5 });
    EXPECT_TRUE(edge.empty());
}
