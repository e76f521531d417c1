/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "voxa/types.hpp"

namespace voxa {

// Recognized text fragment. Offsets are milliseconds from the start of the
// normalized audio; -1 when the engine gave no timing.
struct Segment {
    std::string text;
    std::int64_t startMs = -1;
    std::int64_t endMs = -1;
    bool final = true;
};

using Clock = std::chrono::system_clock;

struct Job {
    JobId id;
    std::string owner;
    std::string sourceRef;
    std::uintmax_t sourceBytes = 0;
    JobState state = JobState::Received;

    // Stage that `attempts` counts against (Converting or Transcribing).
    JobState stage = JobState::Converting;
    int attempts = 0;

    // Checkpoint: Transcribing restarts here; segments before it are kept.
    std::int64_t resumeOffsetMs = 0;
    std::int64_t audioMs = 0;

    std::vector<Segment> segments;

    ErrorKind errorKind = ErrorKind::None;
    std::string error;

    // Set once the owner accepted every message of a terminal job.
    bool delivered = false;

    Clock::time_point createdAt;
    Clock::time_point updatedAt;
};

// Fields a transition may rewrite alongside the state change.
struct JobPatch {
    std::optional<std::uintmax_t> sourceBytes;
    std::optional<JobState> stage;
    std::optional<int> attempts;
    std::optional<std::int64_t> resumeOffsetMs;
    std::optional<std::int64_t> audioMs;
    std::optional<std::vector<Segment>> segments;
    std::optional<ErrorKind> errorKind;
    std::optional<std::string> error;
};

}
