// SPDX-License-Identifier: MIT
// Sprite sheet metadata exported by Aseprite.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "geometry.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Aseprite {

/** Sprite sheet region of a single frame. */
struct Frame {
    std::string filename;   ///< Frame identifier
    Rect frame;             ///< Position and size within sheet image
    bool rotated = false;   ///< Frame is rotated in sheet
    bool trimmed = false;   ///< Transparent borders were removed
    Rect sprite_source;     ///< Frame bounds within untrimmed sprite
    Dimensions source_size; ///< Size of untrimmed sprite
    uint32_t duration = 0;  ///< Display time in milliseconds

    bool operator==(const Frame&) const = default;
};

// Frames exported as array ("json-array")
using FrameList = std::vector<Frame>;
// Frames exported as object keyed by name ("json-hash"), in export order,
// keys are unique
using NamedFrames = std::vector<std::pair<std::string, Frame>>;
// Frames collection, the alternative depends on JSON layout
using Frames = std::variant<FrameList, NamedFrames>;

/** Animation direction. */
enum class Direction : uint8_t {
    Forward,
    Reverse,
    PingPong,
};

/**
 * Get direction name as written in export.
 * @param dir direction
 * @return direction name
 */
const char* direction_to_string(const Direction dir);

/**
 * Get direction from its name.
 * @param name direction name
 * @return direction or nothing if name is unknown
 */
std::optional<Direction> direction_from_string(const std::string_view name);

/** Named animation: range of frames. */
struct FrameTag {
    std::string name;
    uint32_t from = 0; ///< First frame index (inclusive)
    uint32_t to = 0;   ///< Last frame index (inclusive)
    Direction direction = Direction::Forward;
    std::optional<std::string> color;
    std::optional<std::string> data;
    std::optional<uint32_t> repeat; ///< Number of loops

    /**
     * Check if frame range is valid.
     * @return true if first index is not greater than last one
     */
    inline bool valid() const { return from <= to; }

    /**
     * Get number of frames in the range.
     * @return number of frames, 0 if range is invalid
     */
    inline uint32_t length() const { return valid() ? to - from + 1 : 0; }

    bool operator==(const FrameTag&) const = default;
};

/** Layer blending modes known by Aseprite. */
enum class BlendMode : uint8_t {
    Normal,
    Multiply,
    Screen,
    Overlay,
    Darken,
    Lighten,
    ColorDodge,
    ColorBurn,
    HardLight,
    SoftLight,
    Difference,
    Exclusion,
    HslHue,
    HslSaturation,
    HslColor,
    HslLuminosity,
    Addition,
    Subtract,
    Divide,
};

/**
 * Get blending mode from its identifier.
 * @param name blend mode identifier, e.g. "multiply"
 * @return blending mode or nothing if identifier is unknown
 */
std::optional<BlendMode> blend_mode_from_string(const std::string_view name);

/** Cel: layer content on a single frame (only cels with user data). */
struct Cel {
    uint32_t frame = 0; ///< Frame index
    std::optional<uint8_t> opacity;
    std::optional<std::string> color;
    std::optional<std::string> data;

    bool operator==(const Cel&) const = default;
};

/** Sprite layer. */
struct Layer {
    enum class Kind : uint8_t {
        Image, ///< Regular layer
        Group, ///< Group of layers: no opacity and blend mode
    };

    Kind kind = Kind::Image;
    std::string name;
    std::optional<std::string> group; ///< Parent group name
    uint8_t opacity = 255;            ///< Image layers only
    std::string blend_mode;           ///< Image layers only
    std::optional<std::string> color; ///< Hex color tag
    std::optional<std::string> data;  ///< User data
    std::optional<std::vector<Cel>> cels;

    inline bool is_group() const { return kind == Kind::Group; }

    /**
     * Compare layers, opacity and blend mode are ignored for groups.
     * @param other layer to compare with
     * @return true if layers are equal
     */
    bool operator==(const Layer& other) const;
};

/** Slice key: slice geometry starting from specified frame. */
struct SliceKey {
    uint32_t frame = 0;
    Rect bounds;
    std::optional<Rect> center; ///< 9-patch center
    std::optional<Point> pivot;

    bool operator==(const SliceKey&) const = default;
};

/** Slice: named sub-rectangle (hitbox, 9-patch, etc). */
struct Slice {
    std::string name;
    std::string color;
    std::vector<SliceKey> keys;
    std::optional<std::string> data;

    bool operator==(const Slice&) const = default;
};

/** Sprite sheet description. */
struct Metadata {
    std::string app;
    std::string version;
    std::string image;  ///< Sheet image file name
    std::string format; ///< Pixel format, e.g. "RGBA8888"
    Dimensions size;    ///< Sheet image size
    std::string scale;  ///< Scale factor as exported, e.g. "1"

    // optional sections: absent if not requested at export time
    std::optional<std::vector<FrameTag>> frame_tags;
    std::optional<std::vector<Layer>> layers;
    std::optional<std::vector<Slice>> slices;

    /**
     * Find animation tag.
     * @param name tag name
     * @return pointer to tag or nullptr if not found
     */
    const FrameTag* find_tag(const std::string_view name) const;

    /**
     * Find slice.
     * @param name slice name
     * @return pointer to slice or nullptr if not found
     */
    const Slice* find_slice(const std::string_view name) const;

    bool operator==(const Metadata&) const = default;
};

/** Root of the exported document. */
struct SpritesheetData {
    Frames frames;
    Metadata meta;

    /**
     * Check if frames were exported as object keyed by name.
     * @return true for hash layout, false for array layout
     */
    inline bool is_hash() const
    {
        return std::holds_alternative<NamedFrames>(frames);
    }

    /**
     * Get number of frames.
     * @return total number of frames
     */
    size_t frame_count() const;

    /**
     * Get frame by its index in export order.
     * @param index frame index
     * @return pointer to frame or nullptr if index is out of range
     */
    const Frame* frame_at(const size_t index) const;

    /**
     * Find frame by name: file name for array layout, key for hash one.
     * @param name frame name
     * @return pointer to frame or nullptr if not found
     */
    const Frame* find_frame(const std::string_view name) const;

    bool operator==(const SpritesheetData&) const = default;
};

} // namespace Aseprite
