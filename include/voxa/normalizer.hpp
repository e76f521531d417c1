/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

#include "voxa/types.hpp"

namespace voxa {

// A window of mono signed 16-bit PCM.
struct PcmChunk {
    std::vector<int16_t> samples;
    std::int64_t offsetMs = 0;
    int sampleRate = 0;

    [[nodiscard]] std::int64_t durationMs() const noexcept {
        return sampleRate > 0 ? static_cast<std::int64_t>(samples.size()) * 1000 / sampleRate : 0;
    }
};

enum class ReadStatus : uint8_t { Chunk, End, Error };

struct ReadResult {
    ReadStatus status = ReadStatus::Error;
    ErrorKind error = ErrorKind::None;
    std::string message;
};

// Pull side of a running normalization. Chunks arrive in order, each
// `chunkSamples` long except possibly the last.
class PcmStream {
public:
    virtual ~PcmStream() = default;

    [[nodiscard]] virtual ReadResult next(PcmChunk& chunk) = 0;

    // Abandons the stream (cancellation); safe to call more than once.
    virtual void close() noexcept = 0;
};

struct OpenResult {
    std::unique_ptr<PcmStream> stream;
    ErrorKind error = ErrorKind::None;
    std::string message;
    explicit operator bool() const noexcept { return stream != nullptr; }
};

class Normalizer {
public:
    virtual ~Normalizer() = default;

    // Takes ownership of the source; it is consumed by the stream.
    [[nodiscard]] virtual OpenResult open(std::unique_ptr<std::istream> source) = 0;
    [[nodiscard]] virtual int sampleRate() const noexcept = 0;
};

struct TranscoderOptions {
    std::vector<std::string> argv;  // must write s16le mono at sampleRate to stdout
    int sampleRate = 16000;
    std::size_t chunkSamples = 80000;
    std::int64_t maxAudioMs = 600000;
};

// Pipes the source through an external transcoding process (ffmpeg by
// default). Nothing is buffered beyond one chunk.
class TranscoderNormalizer final : public Normalizer {
public:
    explicit TranscoderNormalizer(TranscoderOptions options);

    [[nodiscard]] OpenResult open(std::unique_ptr<std::istream> source) override;
    [[nodiscard]] int sampleRate() const noexcept override { return options_.sampleRate; }

private:
    TranscoderOptions options_;
};

}
