// SPDX-License-Identifier: MIT
// Aseprite JSON export: decoder and encoder.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#pragma once

#include "spritesheet.hpp"

#include <cstdint>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Aseprite {

/** Decoding error: invalid JSON or document that doesn't match the schema. */
class MalformedInput : public std::runtime_error {
public:
    /**
     * Constructor for schema mismatch.
     * @param path path to the field, e.g. "frames[0].frame.x"
     * @param expected expected value description
     * @param actual actual value description
     */
    MalformedInput(const std::string& path, const std::string& expected,
                   const std::string& actual);

    /**
     * Constructor for JSON syntax error.
     * @param message error description
     */
    explicit MalformedInput(const std::string& message);

    /** Path to the field, empty for syntax errors. */
    const std::string& path() const { return field_path; }
    /** Expected value description. */
    const std::string& expected() const { return expected_shape; }
    /** Actual value description. */
    const std::string& actual() const { return actual_shape; }

private:
    std::string field_path;
    std::string expected_shape;
    std::string actual_shape;
};

/** Handling of tag direction that is not forward/reverse/pingpong. */
enum class DirectionPolicy : uint8_t {
    Error,   ///< Fail with MalformedInput
    Forward, ///< Warn and use forward direction
};

/** Decoder/encoder options. */
struct Options {
    bool allow_comments = false; ///< Accept C/C++ comments in input
    DirectionPolicy unknown_direction = DirectionPolicy::Error;
    int indent = -1; ///< Output indentation, negative for single line
};

/**
 * Decode sprite sheet metadata from JSON text.
 * @param text JSON document
 * @param opts decoder options
 * @return sprite sheet description
 * @throw MalformedInput on invalid document
 */
SpritesheetData parse(const std::string_view text, const Options& opts = {});

/**
 * Decode sprite sheet metadata from raw buffer.
 * @param data JSON document
 * @param opts decoder options
 * @return sprite sheet description
 * @throw MalformedInput on invalid document
 */
SpritesheetData parse(const std::vector<uint8_t>& data,
                      const Options& opts = {});

/**
 * Decode sprite sheet metadata from stream.
 * @param stream input stream with JSON document
 * @param opts decoder options
 * @return sprite sheet description
 * @throw MalformedInput on invalid document
 */
SpritesheetData parse(std::istream& stream, const Options& opts = {});

/**
 * Encode sprite sheet metadata to JSON text.
 * Absent optional fields are omitted, frames layout follows the model.
 * Invalid UTF-8 sequences in strings are replaced with U+FFFD.
 * @param data sprite sheet description
 * @param opts encoder options
 * @return JSON document
 * @throw std::invalid_argument if named frames have duplicate keys
 */
std::string serialize(const SpritesheetData& data, const Options& opts = {});

} // namespace Aseprite
