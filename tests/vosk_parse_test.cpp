/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "voxa/vosk_recognizer.hpp"

using namespace voxa;

TEST(VoskParseTest, FinalResultWithWordTimes)
{
    const std::string json = R"({
        "result": [
            {"conf": 1.0, "start": 0.42, "end": 0.9, "word": "hello"},
            {"conf": 0.8, "start": 1.05, "end": 1.5, "word": "world"}
        ],
        "text": "hello world"
    })";

    auto seg = parseVoskResult(json, 10000, true);
    ASSERT_TRUE(seg);
    EXPECT_EQ(seg->text, "hello world");
    EXPECT_EQ(seg->startMs, 10420);
    EXPECT_EQ(seg->endMs, 11500);
    EXPECT_TRUE(seg->final);
}

TEST(VoskParseTest, FinalResultWithoutWords)
{
    auto seg = parseVoskResult(R"({"text": "just text"})", 5000, true);
    ASSERT_TRUE(seg);
    EXPECT_EQ(seg->text, "just text");
    EXPECT_EQ(seg->startMs, 5000);
}

TEST(VoskParseTest, PartialResult)
{
    auto seg = parseVoskResult(R"({"partial": "hel"})", 0, false);
    ASSERT_TRUE(seg);
    EXPECT_EQ(seg->text, "hel");
    EXPECT_FALSE(seg->final);
}

TEST(VoskParseTest, EmptyOrMalformed)
{
    EXPECT_FALSE(parseVoskResult(R"({"text": ""})", 0, true));
    EXPECT_FALSE(parseVoskResult(R"({"partial": ""})", 0, false));
    EXPECT_FALSE(parseVoskResult("not json", 0, true));
    EXPECT_FALSE(parseVoskResult("", 0, true));
}
