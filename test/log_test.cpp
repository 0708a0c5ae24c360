// SPDX-License-Identifier: MIT
// Copyright (C) 2026 Artem Senichev <artemsen@gmail.com>

#include "log.hpp"

#include <gtest/gtest.h>

class LogTest : public ::testing::Test {
protected:
    void SetUp() override { saved = Log::level(); }
    void TearDown() override { Log::level() = saved; }

    Log::Level saved;
};

TEST_F(LogTest, Threshold)
{
    Log::level() = Log::Level::Info;
    EXPECT_FALSE(Log::enabled(Log::Level::Debug));
    EXPECT_TRUE(Log::enabled(Log::Level::Info));
    EXPECT_TRUE(Log::enabled(Log::Level::Error));
    EXPECT_FALSE(Log::enabled(Log::Level::Off));

    Log::level() = Log::Level::Off;
    EXPECT_FALSE(Log::enabled(Log::Level::Error));
}

TEST_F(LogTest, Output)
{
    Log::level() = Log::Level::Warning;

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Log::info("hidden {}", 1);
    Log::warning("frame {} of {}", 2, "walk");
    Log::error("bad {}", "tag");
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err, "WARNING: frame 2 of walk\nERROR: bad tag\n");
}

TEST_F(LogTest, Debug)
{
    Log::level() = Log::Level::Debug;

    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Log::debug("{} frames", 3);
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    // must not mix with program output
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err, "DEBUG: 3 frames\n");
}
