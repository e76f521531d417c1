/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "voxa/job.hpp"
#include "voxa/normalizer.hpp"
#include "voxa/types.hpp"

namespace voxa {

struct EngineResult {
    bool ok = true;
    ErrorKind error = ErrorKind::None;
    std::string message;
    std::vector<Segment> segments;

    explicit operator bool() const noexcept { return ok; }

    static EngineResult failure(ErrorKind kind, std::string message) {
        EngineResult r;
        r.ok = false;
        r.error = kind;
        r.message = std::move(message);
        return r;
    }
};

// One speech-recognition session per slot. A session is reused across jobs:
// begin() starts it afresh, feed() consumes chunks in order, finish() flushes any
// pending hypothesis as a final segment. Offsets in returned segments are
// absolute within the source.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    [[nodiscard]] virtual bool begin(std::int64_t offsetMs) = 0;
    [[nodiscard]] virtual EngineResult feed(const PcmChunk& chunk) = 0;
    [[nodiscard]] virtual EngineResult finish() = 0;
    [[nodiscard]] virtual int sampleRate() const noexcept = 0;
};

// Builds the engine session for a slot. Throws std::runtime_error when the
// engine cannot load.
using RecognizerFactory = std::function<std::unique_ptr<Recognizer>(int slot)>;

}
