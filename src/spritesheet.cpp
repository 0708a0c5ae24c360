// SPDX-License-Identifier: MIT
// Sprite sheet metadata exported by Aseprite.
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "spritesheet.hpp"

#include <algorithm>
#include <array>

namespace Aseprite {

static constexpr std::array direction_names =
    std::to_array<std::pair<Direction, const char*>>({
        { Direction::Forward,  "forward"  },
        { Direction::Reverse,  "reverse"  },
        { Direction::PingPong, "pingpong" },
});

static constexpr std::array blend_mode_names =
    std::to_array<std::pair<BlendMode, const char*>>({
        { BlendMode::Normal,        "normal"         },
        { BlendMode::Multiply,      "multiply"       },
        { BlendMode::Screen,        "screen"         },
        { BlendMode::Overlay,       "overlay"        },
        { BlendMode::Darken,        "darken"         },
        { BlendMode::Lighten,       "lighten"        },
        { BlendMode::ColorDodge,    "color_dodge"    },
        { BlendMode::ColorBurn,     "color_burn"     },
        { BlendMode::HardLight,     "hard_light"     },
        { BlendMode::SoftLight,     "soft_light"     },
        { BlendMode::Difference,    "difference"     },
        { BlendMode::Exclusion,     "exclusion"      },
        { BlendMode::HslHue,        "hsl_hue"        },
        { BlendMode::HslSaturation, "hsl_saturation" },
        { BlendMode::HslColor,      "hsl_color"      },
        { BlendMode::HslLuminosity, "hsl_luminosity" },
        { BlendMode::Addition,      "addition"       },
        { BlendMode::Subtract,      "subtract"       },
        { BlendMode::Divide,        "divide"         },
});

const char* direction_to_string(const Direction dir)
{
    for (const auto& it : direction_names) {
        if (it.first == dir) {
            return it.second;
        }
    }
    return "forward";
}

std::optional<Direction> direction_from_string(const std::string_view name)
{
    for (const auto& it : direction_names) {
        if (name == it.second) {
            return it.first;
        }
    }
    return std::nullopt;
}

std::optional<BlendMode> blend_mode_from_string(const std::string_view name)
{
    for (const auto& it : blend_mode_names) {
        if (name == it.second) {
            return it.first;
        }
    }
    return std::nullopt;
}

bool Layer::operator==(const Layer& other) const
{
    if (kind != other.kind || name != other.name || group != other.group ||
        color != other.color || data != other.data || cels != other.cels) {
        return false;
    }
    return is_group() ||
        (opacity == other.opacity && blend_mode == other.blend_mode);
}

const FrameTag* Metadata::find_tag(const std::string_view name) const
{
    if (!frame_tags) {
        return nullptr;
    }
    const auto it =
        std::find_if(frame_tags->begin(), frame_tags->end(),
                     [name](const FrameTag& tag) { return tag.name == name; });
    return it == frame_tags->end() ? nullptr : &(*it);
}

const Slice* Metadata::find_slice(const std::string_view name) const
{
    if (!slices) {
        return nullptr;
    }
    const auto it =
        std::find_if(slices->begin(), slices->end(),
                     [name](const Slice& slice) { return slice.name == name; });
    return it == slices->end() ? nullptr : &(*it);
}

size_t SpritesheetData::frame_count() const
{
    return std::visit([](const auto& list) { return list.size(); }, frames);
}

const Frame* SpritesheetData::frame_at(const size_t index) const
{
    if (const FrameList* list = std::get_if<FrameList>(&frames)) {
        return index < list->size() ? &(*list)[index] : nullptr;
    }
    const NamedFrames& named = std::get<NamedFrames>(frames);
    return index < named.size() ? &named[index].second : nullptr;
}

const Frame* SpritesheetData::find_frame(const std::string_view name) const
{
    if (const FrameList* list = std::get_if<FrameList>(&frames)) {
        const auto it = std::find_if(
            list->begin(), list->end(),
            [name](const Frame& frame) { return frame.filename == name; });
        return it == list->end() ? nullptr : &(*it);
    }
    const NamedFrames& named = std::get<NamedFrames>(frames);
    const auto it =
        std::find_if(named.begin(), named.end(),
                     [name](const auto& entry) { return entry.first == name; });
    return it == named.end() ? nullptr : &it->second;
}

} // namespace Aseprite
