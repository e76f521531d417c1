/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "voxa/policy.hpp"

namespace voxa {

// What to do with a submission from an owner that already has a job in flight.
enum class OwnerPolicy : uint8_t { Reject, Queue };

struct Config {
    std::filesystem::path workspace = "workspace";
    std::string modelPath = "models/vosk-model";

    int slots = 1;
    int workers = 0;  // 0 = one per slot
    std::size_t maxQueueDepth = 32;
    OwnerPolicy ownerPolicy = OwnerPolicy::Reject;
    bool ownerExclusive = true;

    RetryPolicy retry;

    int sampleRate = 16000;
    int chunkMs = 5000;
    std::uintmax_t maxSourceBytes = 20ULL * 1024 * 1024;
    int maxAudioSeconds = 600;
    std::vector<std::string> transcoder = defaultTranscoder();

    std::size_t messageLimit = 4000;
    bool numberParts = false;

    int retentionHours = 24;
    int sweepSeconds = 60;

    // Finished transcripts reused for identical audio; 0 hours disables.
    int cacheTtlHours = 24;
    std::uintmax_t cacheMaxBytes = 500ULL * 1024 * 1024;

    [[nodiscard]] static Config fromEnv();
    [[nodiscard]] static std::vector<std::string> defaultTranscoder();

    // Empty when usable; otherwise the first problem found.
    [[nodiscard]] std::string validate() const;

    [[nodiscard]] int workerCount() const noexcept { return workers > 0 ? workers : slots; }
    [[nodiscard]] std::size_t chunkSamples() const noexcept {
        return static_cast<std::size_t>(sampleRate) * static_cast<std::size_t>(chunkMs) / 1000;
    }

    // Transcoder argv with "{rate}" replaced by the sample rate.
    [[nodiscard]] std::vector<std::string> transcoderArgv() const;
};

}
