/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/types.hpp"

namespace voxa {

const char* toString(JobState state) noexcept {
    switch (state) {
        case JobState::Received: return "received";
        case JobState::Queued: return "queued";
        case JobState::Converting: return "converting";
        case JobState::Transcribing: return "transcribing";
        case JobState::Completed: return "completed";
        case JobState::Failed: return "failed";
        case JobState::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::SourceUnavailable: return "source_unavailable";
        case ErrorKind::UnsupportedFormat: return "unsupported_format";
        case ErrorKind::Truncated: return "truncated";
        case ErrorKind::TooLong: return "too_long";
        case ErrorKind::ConversionFailed: return "conversion_failed";
        case ErrorKind::ChunkRejected: return "chunk_rejected";
        case ErrorKind::EngineFault: return "engine_fault";
        case ErrorKind::Internal: return "internal";
        default: return "unknown";
    }
}

std::optional<JobState> parseJobState(const std::string& value) noexcept {
    static constexpr JobState all[] = {
        JobState::Received, JobState::Queued, JobState::Converting, JobState::Transcribing,
        JobState::Completed, JobState::Failed, JobState::Cancelled
    };
    for (JobState state : all) {
        if (value == toString(state)) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<ErrorKind> parseErrorKind(const std::string& value) noexcept {
    static constexpr ErrorKind all[] = {
        ErrorKind::None, ErrorKind::SourceUnavailable, ErrorKind::UnsupportedFormat,
        ErrorKind::Truncated, ErrorKind::TooLong, ErrorKind::ConversionFailed,
        ErrorKind::ChunkRejected, ErrorKind::EngineFault, ErrorKind::Internal
    };
    for (ErrorKind kind : all) {
        if (value == toString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

}
