// SPDX-License-Identifier: MIT
// Geometric primitives of sprite sheet metadata.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include <cstdint>

namespace Aseprite {

/** Coordinates in 2D (pixels). */
struct Point {
    int32_t x = 0;
    int32_t y = 0;

    bool operator==(const Point&) const = default;
};

/** Object size (pixels). */
struct Dimensions {
    uint32_t w = 0;
    uint32_t h = 0;

    /**
     * Check if size has no area.
     * @return true if width or height is zero
     */
    inline bool empty() const { return w == 0 || h == 0; }

    bool operator==(const Dimensions&) const = default;
};

/** Rectangle: position and size. */
struct Rect {
    int32_t x = 0;
    int32_t y = 0;
    uint32_t w = 0;
    uint32_t h = 0;

    /**
     * Get rectangle size.
     * @return width and height of rectangle
     */
    inline Dimensions size() const { return { w, h }; }

    /**
     * Check if rectangle has no area.
     * @return true if width or height is zero
     */
    inline bool empty() const { return w == 0 || h == 0; }

    /**
     * Check if point is inside the rectangle.
     * @param pt point to check
     * @return true if point is inside
     */
    bool contains(const Point& pt) const;

    /**
     * Get intersection of two rectangles.
     * @param other rectangle for intersection calculation
     * @return intersection, empty rectangle if there is no overlap
     */
    Rect intersect(const Rect& other) const;

    bool operator==(const Rect&) const = default;
};

} // namespace Aseprite
