// SPDX-License-Identifier: MIT
// Aseprite JSON export: decoder and encoder.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "sheetjson.hpp"

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <format>
#include <istream>
#include <limits>
#include <stdexcept>
#include <system_error>
#include <utility>

// ordered to keep frames of hash layout in export order
using json = nlohmann::ordered_json;

namespace Aseprite {

MalformedInput::MalformedInput(const std::string& path,
                               const std::string& expected,
                               const std::string& actual)
    : std::runtime_error(
          std::format("{}: expected {}, got {}",
                      path.empty() ? "document" : path, expected, actual))
    , field_path(path)
    , expected_shape(expected)
    , actual_shape(actual)
{
}

MalformedInput::MalformedInput(const std::string& message)
    : std::runtime_error(message)
    , expected_shape("JSON document")
    , actual_shape("syntax error")
{
}

/**
 * Get short description of JSON value for error messages.
 * @param node JSON value
 * @return value description
 */
static std::string describe(const json& node)
{
    static constexpr size_t max_len = 32;

    switch (node.type()) {
        case json::value_t::null:
            return "null";
        case json::value_t::boolean:
            return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return std::format("integer {}", node.dump());
        case json::value_t::number_float:
            return std::format("number {}", node.dump());
        case json::value_t::string: {
            std::string text = node.dump(-1, ' ', false,
                                         json::error_handler_t::replace);
            if (text.length() > max_len) {
                // don't split multibyte UTF-8 sequence
                size_t len = max_len;
                while (len > 0 &&
                       (static_cast<uint8_t>(text[len]) & 0xc0) == 0x80) {
                    --len;
                }
                text.resize(len);
                text += "...";
            }
            return std::format("string {}", text);
        }
        case json::value_t::array:
            return "array";
        case json::value_t::object:
            return "object";
        default:
            break;
    }
    return node.type_name();
}

/** JSON tree to data model converter. */
class Decoder {
public:
    Decoder(const Options& opts)
        : options(opts)
    {
    }

    /**
     * Decode document.
     * @param root root JSON node
     * @return sprite sheet description
     */
    SpritesheetData document(const json& root) const
    {
        SpritesheetData data;

        object(root, "");
        data.frames = frames(member(root, "frames", "", "array or object"),
                             "frames");
        data.meta = metadata(member(root, "meta", "", "object"), "meta");

        return data;
    }

private:
    /**
     * Get required member of object.
     * @param node JSON object
     * @param name member name
     * @param path path to the object
     * @param expected expected member type (for error message)
     * @return member value
     */
    const json& member(const json& node, const char* name,
                       const std::string& path, const char* expected) const
    {
        const auto it = node.find(name);
        if (it == node.end()) {
            throw MalformedInput(join(path, name), expected, "nothing");
        }
        return *it;
    }

    /**
     * Get optional member of object.
     * @param node JSON object
     * @param name member name
     * @return pointer to member value, nullptr if absent or null
     */
    const json* optional(const json& node, const char* name) const
    {
        const auto it = node.find(name);
        if (it == node.end() || it->is_null()) {
            return nullptr;
        }
        return &(*it);
    }

    static std::string join(const std::string& path, const char* name)
    {
        return path.empty() ? std::string(name) : path + '.' + name;
    }

    static std::string index(const std::string& path, const size_t idx)
    {
        return std::format("{}[{}]", path, idx);
    }

    const json& object(const json& node, const std::string& path) const
    {
        if (!node.is_object()) {
            throw MalformedInput(path, "object", describe(node));
        }
        return node;
    }

    const json& array(const json& node, const std::string& path) const
    {
        if (!node.is_array()) {
            throw MalformedInput(path, "array", describe(node));
        }
        return node;
    }

    std::string string(const json& node, const std::string& path) const
    {
        if (!node.is_string()) {
            throw MalformedInput(path, "string", describe(node));
        }
        return node.get<std::string>();
    }

    bool boolean(const json& node, const std::string& path) const
    {
        if (!node.is_boolean()) {
            throw MalformedInput(path, "boolean", describe(node));
        }
        return node.get<bool>();
    }

    /**
     * Get integer value with range check.
     * @param node JSON value
     * @param path path to the value
     * @return integer value
     */
    template <typename T>
    T integer(const json& node, const std::string& path) const
    {
        if (node.is_number_unsigned()) {
            const uint64_t value = node.get<uint64_t>();
            if (std::in_range<T>(value)) {
                return static_cast<T>(value);
            }
        } else if (node.is_number_integer()) {
            const int64_t value = node.get<int64_t>();
            if (std::in_range<T>(value)) {
                return static_cast<T>(value);
            }
        }
        throw MalformedInput(
            path,
            std::format("integer in range [{}, {}]",
                        static_cast<int64_t>(std::numeric_limits<T>::min()),
                        static_cast<uint64_t>(std::numeric_limits<T>::max())),
            describe(node));
    }

    // shortcuts for object members
    std::string string(const json& node, const char* name,
                       const std::string& path) const
    {
        return string(member(node, name, path, "string"), join(path, name));
    }
    bool boolean(const json& node, const char* name,
                 const std::string& path) const
    {
        return boolean(member(node, name, path, "boolean"), join(path, name));
    }
    template <typename T>
    T integer(const json& node, const char* name, const std::string& path) const
    {
        return integer<T>(member(node, name, path, "integer"),
                          join(path, name));
    }
    std::optional<std::string> optional_string(const json& node,
                                               const char* name,
                                               const std::string& path) const
    {
        const json* value = optional(node, name);
        if (!value) {
            return std::nullopt;
        }
        return string(*value, join(path, name));
    }

    Point point(const json& node, const std::string& path) const
    {
        object(node, path);
        return { integer<int32_t>(node, "x", path),
                 integer<int32_t>(node, "y", path) };
    }

    Dimensions dimensions(const json& node, const std::string& path) const
    {
        object(node, path);
        return { integer<uint32_t>(node, "w", path),
                 integer<uint32_t>(node, "h", path) };
    }

    Rect rect(const json& node, const std::string& path) const
    {
        object(node, path);
        return { integer<int32_t>(node, "x", path),
                 integer<int32_t>(node, "y", path),
                 integer<uint32_t>(node, "w", path),
                 integer<uint32_t>(node, "h", path) };
    }

    Rect rect(const json& node, const char* name, const std::string& path) const
    {
        return rect(member(node, name, path, "object"), join(path, name));
    }

    /**
     * Decode single frame.
     * @param node JSON object with frame description
     * @param path path to the frame
     * @param key frame key (hash layout only)
     * @return frame description
     */
    Frame frame(const json& node, const std::string& path,
                const std::string* key) const
    {
        Frame frame;

        object(node, path);

        // hash layout: file name is the key
        if (key && !optional(node, "filename")) {
            frame.filename = *key;
        } else {
            frame.filename = string(node, "filename", path);
        }
        frame.frame = rect(node, "frame", path);
        frame.rotated = boolean(node, "rotated", path);
        frame.trimmed = boolean(node, "trimmed", path);
        frame.sprite_source = rect(node, "spriteSourceSize", path);
        frame.source_size = dimensions(
            member(node, "sourceSize", path, "object"),
            join(path, "sourceSize"));
        frame.duration = integer<uint32_t>(node, "duration", path);

        return frame;
    }

    Frames frames(const json& node, const std::string& path) const
    {
        if (node.is_array()) {
            FrameList list;
            list.reserve(node.size());
            for (size_t i = 0; i < node.size(); ++i) {
                list.push_back(frame(node[i], index(path, i), nullptr));
            }
            return list;
        }

        if (node.is_object()) {
            NamedFrames named;
            named.reserve(node.size());
            for (const auto& it : node.items()) {
                const std::string& key = it.key();
                const std::string subpath = std::format("{}[\"{}\"]", path, key);
                named.emplace_back(key, frame(it.value(), subpath, &key));
            }
            return named;
        }

        throw MalformedInput(path, "array or object", describe(node));
    }

    Direction direction(const json& node, const std::string& path) const
    {
        const std::string name = string(node, path);
        const std::optional<Direction> dir = direction_from_string(name);
        if (dir) {
            return *dir;
        }
        if (options.unknown_direction == DirectionPolicy::Forward) {
            Log::warning("{}: unknown direction \"{}\", forward is used",
                         path, name);
            return Direction::Forward;
        }
        throw MalformedInput(path, "one of forward, reverse, pingpong",
                             describe(node));
    }

    /**
     * Get loop counter: exported as string, but integer is also accepted.
     * @param node JSON value
     * @param path path to the value
     * @return number of loops
     */
    uint32_t repeat(const json& node, const std::string& path) const
    {
        if (!node.is_string()) {
            return integer<uint32_t>(node, path);
        }
        const std::string& text = node.get_ref<const std::string&>();
        uint32_t value = 0;
        const char* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (text.empty() || ec != std::errc() || ptr != end) {
            throw MalformedInput(path, "unsigned integer", describe(node));
        }
        return value;
    }

    FrameTag frame_tag(const json& node, const std::string& path) const
    {
        FrameTag tag;

        object(node, path);

        tag.name = string(node, "name", path);
        tag.from = integer<uint32_t>(node, "from", path);
        tag.to = integer<uint32_t>(node, "to", path);
        tag.direction = direction(member(node, "direction", path, "string"),
                                  join(path, "direction"));
        tag.color = optional_string(node, "color", path);
        tag.data = optional_string(node, "data", path);
        if (const json* value = optional(node, "repeat")) {
            tag.repeat = repeat(*value, join(path, "repeat"));
        }

        return tag;
    }

    Cel cel(const json& node, const std::string& path) const
    {
        Cel cel;

        object(node, path);

        cel.frame = integer<uint32_t>(node, "frame", path);
        if (const json* value = optional(node, "opacity")) {
            cel.opacity = integer<uint8_t>(*value, join(path, "opacity"));
        }
        cel.color = optional_string(node, "color", path);
        cel.data = optional_string(node, "data", path);

        return cel;
    }

    Layer layer(const json& node, const std::string& path) const
    {
        Layer layer;

        object(node, path);

        layer.name = string(node, "name", path);
        layer.group = optional_string(node, "group", path);

        // group layers have neither opacity nor blend mode
        const json* opacity = optional(node, "opacity");
        const json* blend_mode = optional(node, "blendMode");
        if (!opacity && !blend_mode) {
            layer.kind = Layer::Kind::Group;
        } else {
            layer.kind = Layer::Kind::Image;
            layer.opacity = integer<uint8_t>(node, "opacity", path);
            layer.blend_mode = string(node, "blendMode", path);
        }

        layer.color = optional_string(node, "color", path);
        layer.data = optional_string(node, "data", path);

        if (const json* value = optional(node, "cels")) {
            const std::string subpath = join(path, "cels");
            array(*value, subpath);
            std::vector<Cel> cels;
            cels.reserve(value->size());
            for (size_t i = 0; i < value->size(); ++i) {
                cels.push_back(cel((*value)[i], index(subpath, i)));
            }
            layer.cels = std::move(cels);
        }

        return layer;
    }

    SliceKey slice_key(const json& node, const std::string& path) const
    {
        SliceKey key;

        object(node, path);

        key.frame = integer<uint32_t>(node, "frame", path);
        key.bounds = rect(node, "bounds", path);
        if (const json* value = optional(node, "center")) {
            key.center = rect(*value, join(path, "center"));
        }
        if (const json* value = optional(node, "pivot")) {
            key.pivot = point(*value, join(path, "pivot"));
        }

        return key;
    }

    Slice slice(const json& node, const std::string& path) const
    {
        Slice slice;

        object(node, path);

        slice.name = string(node, "name", path);
        slice.color = string(node, "color", path);
        slice.data = optional_string(node, "data", path);

        const std::string keys_path = join(path, "keys");
        const json& keys = array(member(node, "keys", path, "array"), keys_path);
        slice.keys.reserve(keys.size());
        for (size_t i = 0; i < keys.size(); ++i) {
            slice.keys.push_back(slice_key(keys[i], index(keys_path, i)));
        }

        return slice;
    }

    /**
     * Decode optional list section.
     * @param node parent JSON object
     * @param name section name
     * @param path path to the parent
     * @param decode item decoder
     * @return list of items or nothing if section is absent
     */
    template <typename T, typename Fn>
    std::optional<std::vector<T>> section(const json& node, const char* name,
                                          const std::string& path,
                                          Fn decode) const
    {
        const json* value = optional(node, name);
        if (!value) {
            return std::nullopt;
        }

        const std::string subpath = join(path, name);
        array(*value, subpath);

        std::vector<T> items;
        items.reserve(value->size());
        for (size_t i = 0; i < value->size(); ++i) {
            items.push_back((this->*decode)((*value)[i], index(subpath, i)));
        }
        return items;
    }

    Metadata metadata(const json& node, const std::string& path) const
    {
        Metadata meta;

        object(node, path);

        meta.app = string(node, "app", path);
        meta.version = string(node, "version", path);
        meta.image = string(node, "image", path);
        meta.format = string(node, "format", path);
        meta.size = dimensions(member(node, "size", path, "object"),
                               join(path, "size"));
        meta.scale = string(node, "scale", path);

        meta.frame_tags =
            section<FrameTag>(node, "frameTags", path, &Decoder::frame_tag);
        meta.layers = section<Layer>(node, "layers", path, &Decoder::layer);
        meta.slices = section<Slice>(node, "slices", path, &Decoder::slice);

        return meta;
    }

private:
    const Options& options;
};

/** Data model to JSON tree converter. */
class Encoder {
public:
    json document(const SpritesheetData& data) const
    {
        json root = json::object();

        if (const FrameList* list = std::get_if<FrameList>(&data.frames)) {
            json frames = json::array();
            for (const Frame& it : *list) {
                frames.push_back(frame(it, nullptr));
            }
            root["frames"] = std::move(frames);
        } else {
            json frames = json::object();
            for (const auto& [key, it] : std::get<NamedFrames>(data.frames)) {
                if (frames.contains(key)) {
                    throw std::invalid_argument(
                        std::format("duplicate frame key \"{}\"", key));
                }
                frames[key] = frame(it, &key);
            }
            root["frames"] = std::move(frames);
        }

        root["meta"] = metadata(data.meta);

        return root;
    }

private:
    static json point(const Point& pt)
    {
        return {
            { "x", pt.x },
            { "y", pt.y },
        };
    }

    static json dimensions(const Dimensions& size)
    {
        return {
            { "w", size.w },
            { "h", size.h },
        };
    }

    static json rect(const Rect& rc)
    {
        return {
            { "x", rc.x },
            { "y", rc.y },
            { "w", rc.w },
            { "h", rc.h },
        };
    }

    static void optional(json& node, const char* name,
                         const std::optional<std::string>& value)
    {
        if (value) {
            node[name] = *value;
        }
    }

    static json frame(const Frame& frame, const std::string* key)
    {
        json node = json::object();
        if (!key || *key != frame.filename) {
            node["filename"] = frame.filename;
        }
        node["frame"] = rect(frame.frame);
        node["rotated"] = frame.rotated;
        node["trimmed"] = frame.trimmed;
        node["spriteSourceSize"] = rect(frame.sprite_source);
        node["sourceSize"] = dimensions(frame.source_size);
        node["duration"] = frame.duration;
        return node;
    }

    static json frame_tag(const FrameTag& tag)
    {
        json node = json::object();
        node["name"] = tag.name;
        node["from"] = tag.from;
        node["to"] = tag.to;
        node["direction"] = direction_to_string(tag.direction);
        if (tag.repeat) {
            node["repeat"] = std::to_string(*tag.repeat);
        }
        optional(node, "color", tag.color);
        optional(node, "data", tag.data);
        return node;
    }

    static json layer(const Layer& layer)
    {
        json node = json::object();
        node["name"] = layer.name;
        optional(node, "group", layer.group);
        if (!layer.is_group()) {
            node["opacity"] = layer.opacity;
            node["blendMode"] = layer.blend_mode;
        }
        optional(node, "color", layer.color);
        optional(node, "data", layer.data);
        if (layer.cels) {
            json cels = json::array();
            for (const Cel& cel : *layer.cels) {
                json item = json::object();
                item["frame"] = cel.frame;
                if (cel.opacity) {
                    item["opacity"] = *cel.opacity;
                }
                optional(item, "color", cel.color);
                optional(item, "data", cel.data);
                cels.push_back(std::move(item));
            }
            node["cels"] = std::move(cels);
        }
        return node;
    }

    static json slice(const Slice& slice)
    {
        json node = json::object();
        node["name"] = slice.name;
        node["color"] = slice.color;
        optional(node, "data", slice.data);

        json keys = json::array();
        for (const SliceKey& key : slice.keys) {
            json item = json::object();
            item["frame"] = key.frame;
            item["bounds"] = rect(key.bounds);
            if (key.center) {
                item["center"] = rect(*key.center);
            }
            if (key.pivot) {
                item["pivot"] = point(*key.pivot);
            }
            keys.push_back(std::move(item));
        }
        node["keys"] = std::move(keys);

        return node;
    }

    template <typename T>
    static void section(json& node, const char* name,
                        const std::optional<std::vector<T>>& items,
                        json (*encode)(const T&))
    {
        if (items) {
            json list = json::array();
            for (const T& it : *items) {
                list.push_back(encode(it));
            }
            node[name] = std::move(list);
        }
    }

    static json metadata(const Metadata& meta)
    {
        json node = json::object();
        node["app"] = meta.app;
        node["version"] = meta.version;
        node["image"] = meta.image;
        node["format"] = meta.format;
        node["size"] = dimensions(meta.size);
        node["scale"] = meta.scale;
        section(node, "frameTags", meta.frame_tags, &Encoder::frame_tag);
        section(node, "layers", meta.layers, &Encoder::layer);
        section(node, "slices", meta.slices, &Encoder::slice);
        return node;
    }
};

/**
 * Decode parsed JSON tree.
 * @param root root node of the document
 * @param opts decoder options
 * @return sprite sheet description
 */
static SpritesheetData decode(const json& root, const Options& opts)
{
    SpritesheetData data;

    try {
        data = Decoder(opts).document(root);
    } catch (const json::exception& e) {
        // types are checked before access, but never let it escape
        throw MalformedInput(std::format("invalid document: {}", e.what()));
    }

    Log::debug("Sprite sheet {} ({} layout): {} frames, {} tags, {} layers, "
               "{} slices",
               data.meta.image, data.is_hash() ? "hash" : "array",
               data.frame_count(),
               data.meta.frame_tags ? data.meta.frame_tags->size() : 0,
               data.meta.layers ? data.meta.layers->size() : 0,
               data.meta.slices ? data.meta.slices->size() : 0);

    return data;
}

SpritesheetData parse(const std::string_view text, const Options& opts)
{
    json root;
    try {
        root = json::parse(text.begin(), text.end(), nullptr, true,
                           opts.allow_comments);
    } catch (const json::parse_error& e) {
        throw MalformedInput(std::format("invalid JSON: {}", e.what()));
    }
    return decode(root, opts);
}

SpritesheetData parse(const std::vector<uint8_t>& data, const Options& opts)
{
    json root;
    try {
        root = json::parse(data.begin(), data.end(), nullptr, true,
                           opts.allow_comments);
    } catch (const json::parse_error& e) {
        throw MalformedInput(std::format("invalid JSON: {}", e.what()));
    }
    return decode(root, opts);
}

SpritesheetData parse(std::istream& stream, const Options& opts)
{
    json root;
    try {
        root = json::parse(stream, nullptr, true, opts.allow_comments);
    } catch (const json::parse_error& e) {
        throw MalformedInput(std::format("invalid JSON: {}", e.what()));
    }
    return decode(root, opts);
}

std::string serialize(const SpritesheetData& data, const Options& opts)
{
    return Encoder().document(data).dump(opts.indent, ' ', false,
                                         json::error_handler_t::replace);
}

} // namespace Aseprite
