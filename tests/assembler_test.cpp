/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "voxa/assembler.hpp"

using namespace voxa;
using voxa::test::Message;
using voxa::test::RecordingDelivery;

namespace {

Segment seg(const std::string& text, std::int64_t startMs, bool final = true) {
    Segment s;
    s.text = text;
    s.startMs = startMs;
    s.endMs = startMs >= 0 ? startMs + 500 : -1;
    s.final = final;
    return s;
}

// Nine-letter words, the last one padded so the text is exactly `len` bytes.
std::string wordsOfLength(std::size_t len) {
    std::string s;
    while (s.size() + 10 < len) {
        s += "abcdefghi ";
    }
    s += std::string(len - s.size(), 'z');
    return s;
}

std::string joined(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += ' ';
        out += p;
    }
    return out;
}

Job terminal(JobState state) {
    Job job;
    job.id = "job-1";
    job.owner = "alice";
    job.state = state;
    return job;
}

}

TEST(AssemblerTest, OrdersFinalSegmentsByOffset)
{
    Assembler assembler(4000, false);
    std::vector<Segment> segments = {
        seg("third", 3000),
        seg("first", 1000),
        seg("ignored", 1500, false),
        seg("  second  ", 2000),
        seg("after-second", -1),
        seg("", 4000),
    };
    EXPECT_EQ(assembler.transcript(segments), "first second after-second third");
}

TEST(AssemblerTest, SplitsOnSegmentBoundaries)
{
    Assembler assembler(4000, false);
    std::vector<Segment> segments;
    for (int i = 0; i < 11; ++i) {
        segments.push_back(seg(wordsOfLength(999), i * 1000));
    }
    segments.push_back(seg(wordsOfLength(1000), 11000));

    auto parts = assembler.split(segments);
    ASSERT_EQ(parts.size(), 3u);
    for (const auto& part : parts) {
        EXPECT_LE(part.size(), 4000u);
        EXPECT_NE(part.front(), ' ');
        EXPECT_NE(part.back(), ' ');
    }
    EXPECT_EQ(parts[0].size(), 4 * 999u + 3);
    EXPECT_EQ(parts[2].size(), 3 * 999u + 1000 + 3);
    EXPECT_EQ(joined(parts), assembler.transcript(segments));
}

TEST(AssemblerTest, BreaksLongSegmentBetweenWords)
{
    Assembler assembler(20, false);
    auto parts = assembler.split({seg("alpha beta gamma delta epsilon zeta eta theta", 0)});
    ASSERT_GT(parts.size(), 1u);
    for (const auto& part : parts) {
        EXPECT_LE(part.size(), 20u);
    }
    EXPECT_EQ(parts[0], "alpha beta gamma");
    EXPECT_EQ(joined(parts), "alpha beta gamma delta epsilon zeta eta theta");
}

TEST(AssemblerTest, CutsOnlyOverlongWords)
{
    Assembler assembler(16, false);
    auto parts = assembler.split({seg("hi " + std::string(40, 'x') + " bye", 0)});
    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "hi");
    EXPECT_EQ(parts[1], std::string(16, 'x'));
    EXPECT_EQ(parts[2], std::string(16, 'x'));
    EXPECT_EQ(parts[3], std::string(8, 'x') + " bye");
}

TEST(AssemblerTest, CutKeepsUtf8SequencesWhole)
{
    Assembler assembler(7, false);
    std::string word;
    for (int i = 0; i < 10; ++i) word += "\xC3\xA9";

    auto parts = assembler.split({seg(word, 0)});
    ASSERT_EQ(parts.size(), 4u);
    std::string rebuilt;
    for (const auto& part : parts) {
        EXPECT_LE(part.size(), 7u);
        EXPECT_EQ(part.size() % 2, 0u);
        EXPECT_NE(static_cast<unsigned char>(part.front()) & 0xC0, 0x80);
        rebuilt += part;
    }
    EXPECT_EQ(rebuilt, word);
}

TEST(AssemblerTest, NumberedPartsStayWithinLimit)
{
    Assembler assembler(40, true);
    std::vector<Segment> segments;
    for (int i = 0; i < 30; ++i) {
        segments.push_back(seg("segment number " + std::to_string(i), i * 1000));
    }

    auto parts = assembler.split(segments);
    ASSERT_GT(parts.size(), 9u);
    const std::string total = std::to_string(parts.size());
    std::vector<std::string> bodies;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        EXPECT_LE(parts[i].size(), 40u) << parts[i];
        const std::string prefix = "(" + std::to_string(i + 1) + "/" + total + ") ";
        ASSERT_EQ(parts[i].rfind(prefix, 0), 0u) << parts[i];
        bodies.push_back(parts[i].substr(prefix.size()));
    }
    EXPECT_EQ(joined(bodies), assembler.transcript(segments));
}

TEST(AssemblerTest, SinglePartIsNotNumbered)
{
    Assembler assembler(100, true);
    auto parts = assembler.split({seg("hello", 0), seg("world", 1000)});
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "hello world");
}

TEST(AssemblerTest, NoticesForTerminalStates)
{
    Assembler assembler(4000, false);

    Job failed = terminal(JobState::Failed);
    failed.errorKind = ErrorKind::UnsupportedFormat;
    failed.error = "Invalid data found";
    EXPECT_EQ(assembler.messages(failed),
              std::vector<std::string>{"Transcription failed: the audio format is not supported (Invalid data found)"});

    EXPECT_EQ(assembler.messages(terminal(JobState::Cancelled)),
              std::vector<std::string>{"Transcription cancelled."});

    Job silent = terminal(JobState::Completed);
    silent.segments = {seg("   ", 0), seg("partial only", 500, false)};
    EXPECT_EQ(assembler.messages(silent), std::vector<std::string>{"No speech recognized."});

    EXPECT_TRUE(assembler.messages(terminal(JobState::Transcribing)).empty());
}

TEST(AssemblerTest, FailureNoticeIsTruncatedToLimit)
{
    Assembler assembler(32, false);
    Job failed = terminal(JobState::Failed);
    failed.errorKind = ErrorKind::EngineFault;
    failed.error = std::string(200, 'e');

    auto out = assembler.messages(failed);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].size(), 32u);
    EXPECT_EQ(out[0].rfind("Transcription failed: ", 0), 0u);
}

TEST(AssemblerTest, DeliverSendsInOrderAndStopsAtRefusal)
{
    Assembler assembler(12, false);
    Job job = terminal(JobState::Completed);
    job.segments = {seg("one two", 0), seg("three four", 1000), seg("five six", 2000)};

    RecordingDelivery delivery;
    EXPECT_TRUE(assembler.deliver(job, delivery));
    auto sent = delivery.all();
    ASSERT_EQ(sent.size(), 3u);
    EXPECT_EQ(sent[0].text, "one two");
    EXPECT_EQ(sent[1].text, "three four");
    EXPECT_EQ(sent[2].text, "five six");
    EXPECT_EQ(sent[0].owner, "alice");
    EXPECT_EQ(sent[0].id, "job-1");

    RecordingDelivery refusing;
    refusing.refuseAfter(1);
    EXPECT_FALSE(assembler.deliver(job, refusing));
    EXPECT_EQ(refusing.all().size(), 1u);
}
