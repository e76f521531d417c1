/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <fstream>
#include <sstream>

#include "fakes.hpp"
#include "voxa/normalizer.hpp"

using namespace voxa;
using voxa::test::TempDir;
using voxa::test::writePcm;

namespace {

TranscoderOptions options(std::vector<std::string> argv, std::size_t chunkSamples = 1000,
                          std::int64_t maxAudioMs = 600000)
{
    TranscoderOptions o;
    o.argv = std::move(argv);
    o.sampleRate = 1000;
    o.chunkSamples = chunkSamples;
    o.maxAudioMs = maxAudioMs;
    return o;
}

std::unique_ptr<std::istream> fileStream(const std::string& path)
{
    return std::make_unique<std::ifstream>(path, std::ios::binary);
}

// Reads until End or Error; returns the terminal result.
ReadResult drain(PcmStream& stream, std::vector<PcmChunk>& chunks)
{
    for (;;) {
        PcmChunk chunk;
        ReadResult r = stream.next(chunk);
        if (r.status != ReadStatus::Chunk) return r;
        chunks.push_back(std::move(chunk));
    }
}

}

TEST(NormalizerTest, YieldsFixedWindowsWithOffsets)
{
    TempDir dir;
    auto path = writePcm(dir / "a.pcm", 2500);
    TranscoderNormalizer normalizer(options({"cat"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened) << opened.message;

    std::vector<PcmChunk> chunks;
    ReadResult end = drain(*opened.stream, chunks);
    EXPECT_EQ(end.status, ReadStatus::End);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].samples.size(), 1000u);
    EXPECT_EQ(chunks[1].samples.size(), 1000u);
    EXPECT_EQ(chunks[2].samples.size(), 500u);
    EXPECT_EQ(chunks[0].offsetMs, 0);
    EXPECT_EQ(chunks[1].offsetMs, 1000);
    EXPECT_EQ(chunks[2].offsetMs, 2000);
    EXPECT_EQ(chunks[2].durationMs(), 500);
    EXPECT_EQ(chunks[0].sampleRate, 1000);

    // Little-endian decode of the pattern written by writePcm.
    EXPECT_EQ(chunks[0].samples[0], -10000);
    EXPECT_EQ(chunks[0].samples[1], -9900);

    PcmChunk again;
    EXPECT_EQ(opened.stream->next(again).status, ReadStatus::End);
}

TEST(NormalizerTest, EmptyInputEndsImmediately)
{
    TempDir dir;
    auto path = writePcm(dir / "empty.pcm", 0);
    TranscoderNormalizer normalizer(options({"cat"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);
    PcmChunk chunk;
    EXPECT_EQ(opened.stream->next(chunk).status, ReadStatus::End);
}

TEST(NormalizerTest, OddTrailingByteIsTruncated)
{
    TempDir dir;
    auto path = writePcm(dir / "odd.pcm", 1500, 1);
    TranscoderNormalizer normalizer(options({"cat"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);
    std::vector<PcmChunk> chunks;
    ReadResult end = drain(*opened.stream, chunks);
    EXPECT_EQ(end.status, ReadStatus::Error);
    EXPECT_EQ(end.error, ErrorKind::Truncated);
    EXPECT_EQ(chunks.size(), 1u);
}

TEST(NormalizerTest, FailingTranscoderIsUnsupportedFormat)
{
    TempDir dir;
    auto path = writePcm(dir / "a.pcm", 100);
    TranscoderNormalizer normalizer(options({"sh", "-c", "cat >/dev/null; echo 'Invalid data found' >&2; exit 1"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);
    std::vector<PcmChunk> chunks;
    ReadResult end = drain(*opened.stream, chunks);
    EXPECT_EQ(end.status, ReadStatus::Error);
    EXPECT_EQ(end.error, ErrorKind::UnsupportedFormat);
    EXPECT_NE(end.message.find("Invalid data found"), std::string::npos);
}

TEST(NormalizerTest, TranscoderThatIgnoresInputStillFails)
{
    TempDir dir;
    auto path = writePcm(dir / "big.pcm", 200000);
    TranscoderNormalizer normalizer(options({"false"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);
    std::vector<PcmChunk> chunks;
    ReadResult end = drain(*opened.stream, chunks);
    EXPECT_EQ(end.error, ErrorKind::UnsupportedFormat);
    EXPECT_TRUE(chunks.empty());
}

TEST(NormalizerTest, MissingTranscoderIsConversionFailure)
{
    TempDir dir;
    auto path = writePcm(dir / "a.pcm", 100);
    TranscoderNormalizer normalizer(options({"/nonexistent/voxa-transcoder"}));

    auto opened = normalizer.open(fileStream(path));
    EXPECT_FALSE(opened);
    EXPECT_EQ(opened.error, ErrorKind::ConversionFailed);
}

TEST(NormalizerTest, AudioOverTheLimitIsTooLong)
{
    TempDir dir;
    auto path = writePcm(dir / "long.pcm", 2500);
    TranscoderNormalizer normalizer(options({"cat"}, 1000, 1500));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);
    std::vector<PcmChunk> chunks;
    ReadResult end = drain(*opened.stream, chunks);
    EXPECT_EQ(end.error, ErrorKind::TooLong);
    EXPECT_EQ(chunks.size(), 1u);
}

TEST(NormalizerTest, CloseAbandonsARunningTranscoder)
{
    TempDir dir;
    auto path = writePcm(dir / "a.pcm", 1000);
    // Emits one window then hangs until killed.
    TranscoderNormalizer normalizer(options({"sh", "-c", "head -c 2000; sleep 30"}));

    auto opened = normalizer.open(fileStream(path));
    ASSERT_TRUE(opened);

    PcmChunk chunk;
    ASSERT_EQ(opened.stream->next(chunk).status, ReadStatus::Chunk);

    auto started = std::chrono::steady_clock::now();
    opened.stream->close();
    opened.stream->close();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
    EXPECT_NE(opened.stream->next(chunk).status, ReadStatus::Chunk);
}

TEST(NormalizerTest, NullSourceIsUnavailable)
{
    TranscoderNormalizer normalizer(options({"cat"}));
    auto opened = normalizer.open(nullptr);
    EXPECT_FALSE(opened);
    EXPECT_EQ(opened.error, ErrorKind::SourceUnavailable);
}
