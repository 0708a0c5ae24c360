// SPDX-License-Identifier: MIT
// Geometric primitives of sprite sheet metadata.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "geometry.hpp"

#include <algorithm>

namespace Aseprite {

bool Rect::contains(const Point& pt) const
{
    const int64_t right = static_cast<int64_t>(x) + w;
    const int64_t bottom = static_cast<int64_t>(y) + h;
    return pt.x >= x && pt.y >= y && pt.x < right && pt.y < bottom;
}

Rect Rect::intersect(const Rect& other) const
{
    // 64-bit to avoid overflow on the far edges
    const int64_t x1 = std::max<int64_t>(x, other.x);
    const int64_t y1 = std::max<int64_t>(y, other.y);
    const int64_t x2 = std::min(static_cast<int64_t>(x) + w,
                                static_cast<int64_t>(other.x) + other.w);
    const int64_t y2 = std::min(static_cast<int64_t>(y) + h,
                                static_cast<int64_t>(other.y) + other.h);

    if (x2 <= x1 || y2 <= y1) {
        return {};
    }
    return { static_cast<int32_t>(x1), static_cast<int32_t>(y1),
             static_cast<uint32_t>(x2 - x1), static_cast<uint32_t>(y2 - y1) };
}

} // namespace Aseprite
