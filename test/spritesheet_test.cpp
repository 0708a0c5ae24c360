// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "spritesheet.hpp"

#include <gtest/gtest.h>

using namespace Aseprite;

TEST(DirectionTest, FromString)
{
    EXPECT_EQ(direction_from_string("forward"), Direction::Forward);
    EXPECT_EQ(direction_from_string("reverse"), Direction::Reverse);
    EXPECT_EQ(direction_from_string("pingpong"), Direction::PingPong);

    EXPECT_FALSE(direction_from_string(""));
    EXPECT_FALSE(direction_from_string("Forward"));
    EXPECT_FALSE(direction_from_string("pingpong_reverse"));
}

TEST(DirectionTest, ToString)
{
    EXPECT_STREQ(direction_to_string(Direction::Forward), "forward");
    EXPECT_STREQ(direction_to_string(Direction::Reverse), "reverse");
    EXPECT_STREQ(direction_to_string(Direction::PingPong), "pingpong");
}

TEST(BlendModeTest, FromString)
{
    EXPECT_EQ(blend_mode_from_string("normal"), BlendMode::Normal);
    EXPECT_EQ(blend_mode_from_string("multiply"), BlendMode::Multiply);
    EXPECT_EQ(blend_mode_from_string("color_dodge"), BlendMode::ColorDodge);
    EXPECT_EQ(blend_mode_from_string("hsl_luminosity"),
              BlendMode::HslLuminosity);
    EXPECT_EQ(blend_mode_from_string("divide"), BlendMode::Divide);
    EXPECT_FALSE(blend_mode_from_string("dissolve"));
}

TEST(FrameTagTest, Range)
{
    FrameTag tag;
    tag.from = 2;
    tag.to = 5;
    EXPECT_TRUE(tag.valid());
    EXPECT_EQ(tag.length(), 4U);

    tag.to = 2;
    EXPECT_TRUE(tag.valid());
    EXPECT_EQ(tag.length(), 1U);

    tag.to = 1;
    EXPECT_FALSE(tag.valid());
    EXPECT_EQ(tag.length(), 0U);
}

TEST(LayerTest, Equality)
{
    Layer first;
    first.name = "Base";
    first.blend_mode = "normal";
    Layer second = first;
    EXPECT_EQ(first, second);

    second.opacity = 10;
    EXPECT_NE(first, second);

    // groups have neither opacity nor blend mode
    first.kind = Layer::Kind::Group;
    second.kind = Layer::Kind::Group;
    second.blend_mode = "screen";
    EXPECT_EQ(first, second);

    second.name = "Other";
    EXPECT_NE(first, second);
}

TEST(MetadataTest, Find)
{
    Metadata meta;
    EXPECT_EQ(meta.find_tag("walk"), nullptr);
    EXPECT_EQ(meta.find_slice("hitbox"), nullptr);

    meta.frame_tags = std::vector<FrameTag>(2);
    (*meta.frame_tags)[0].name = "idle";
    (*meta.frame_tags)[1].name = "walk";
    (*meta.frame_tags)[1].to = 3;
    meta.slices = std::vector<Slice>(1);
    (*meta.slices)[0].name = "hitbox";

    const FrameTag* tag = meta.find_tag("walk");
    ASSERT_NE(tag, nullptr);
    EXPECT_EQ(tag->to, 3U);
    EXPECT_EQ(meta.find_tag("run"), nullptr);

    ASSERT_NE(meta.find_slice("hitbox"), nullptr);
    EXPECT_EQ(meta.find_slice("panel"), nullptr);
}

class SpritesheetFrames : public ::testing::Test {
protected:
    static Frame make(const char* name, uint32_t duration)
    {
        Frame frame;
        frame.filename = name;
        frame.duration = duration;
        return frame;
    }
};

TEST_F(SpritesheetFrames, Array)
{
    SpritesheetData data;
    data.frames = FrameList { make("a.png", 10), make("b.png", 20) };

    EXPECT_FALSE(data.is_hash());
    EXPECT_EQ(data.frame_count(), 2U);

    ASSERT_NE(data.frame_at(1), nullptr);
    EXPECT_EQ(data.frame_at(1)->duration, 20U);
    EXPECT_EQ(data.frame_at(2), nullptr);

    ASSERT_NE(data.find_frame("a.png"), nullptr);
    EXPECT_EQ(data.find_frame("a.png")->duration, 10U);
    EXPECT_EQ(data.find_frame("c.png"), nullptr);
}

TEST_F(SpritesheetFrames, Hash)
{
    SpritesheetData data;
    data.frames = NamedFrames {
        { "second", make("b.png", 20) },
        { "first",  make("a.png", 10) },
    };

    EXPECT_TRUE(data.is_hash());
    EXPECT_EQ(data.frame_count(), 2U);

    // export order, not lexical one
    ASSERT_NE(data.frame_at(0), nullptr);
    EXPECT_EQ(data.frame_at(0)->filename, "b.png");
    EXPECT_EQ(data.frame_at(5), nullptr);

    // lookup by key
    ASSERT_NE(data.find_frame("first"), nullptr);
    EXPECT_EQ(data.find_frame("first")->duration, 10U);
    EXPECT_EQ(data.find_frame("a.png"), nullptr);
}

TEST_F(SpritesheetFrames, Equality)
{
    SpritesheetData array;
    array.frames = FrameList { make("a.png", 10) };
    SpritesheetData hash;
    hash.frames = NamedFrames { { "a.png", make("a.png", 10) } };

    EXPECT_NE(array, hash);
    EXPECT_EQ(array, array);

    SpritesheetData other = array;
    other.meta.layers = std::vector<Layer>();
    EXPECT_NE(array, other);
}
