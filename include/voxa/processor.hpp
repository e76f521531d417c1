/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "voxa/assembler.hpp"
#include "voxa/cache.hpp"
#include "voxa/config.hpp"
#include "voxa/normalizer.hpp"
#include "voxa/queue.hpp"
#include "voxa/recognizer.hpp"
#include "voxa/source.hpp"
#include "voxa/store.hpp"

namespace voxa {

enum class ProcessResult : uint8_t {
    Completed,
    Failed,
    Cancelled,
    Requeued,
    Interrupted,  // service stopping; job left active for recovery
    Lost          // store refused a transition
};

const char* toString(ProcessResult result) noexcept;

// Drives one leased job through conversion and recognition, records every
// stage change in the store, and hands terminal jobs to the assembler.
// With a cache, audio already transcribed skips the engine.
class Processor {
public:
    Processor(JobStore& store, AdmissionQueue& queue, const Config& config,
              std::shared_ptr<Normalizer> normalizer, std::shared_ptr<SourceResolver> sources,
              std::shared_ptr<Delivery> delivery, std::shared_ptr<ResultCache> cache = nullptr);

    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    // One engine per slot, created before any worker starts.
    bool initializeEngines(const RecognizerFactory& factory, int slots);

    // Consumes the lease: the slot is always released before returning.
    [[nodiscard]] ProcessResult process(const Lease& lease, int workerId) noexcept;

    // Running jobs stop at their next chunk boundary and stay active.
    void requestStop() noexcept { stopping_.store(true); }

    // Sends a terminal job's messages and marks it delivered once the owner
    // accepted all of them.
    bool notify(const Job& job) noexcept;

private:
    enum class Outcome : uint8_t { Done, Error, Cancelled, Stopped };

    struct Attempt {
        Outcome outcome = Outcome::Error;
        ErrorKind error = ErrorKind::None;
        std::string message;
        std::string cacheKey;  // set when the result may be cached
    };

    JobStore& store_;
    AdmissionQueue& queue_;
    RetryPolicy retry_;
    Assembler assembler_;
    std::shared_ptr<Normalizer> normalizer_;
    std::shared_ptr<SourceResolver> sources_;
    std::shared_ptr<Delivery> delivery_;
    std::shared_ptr<ResultCache> cache_;

    std::vector<std::unique_ptr<Recognizer>> engines_;
    std::atomic<bool> stopping_{false};

    [[nodiscard]] Attempt runAttempt(Job& job, Recognizer& engine);
    [[nodiscard]] bool fromCache(Job& job, Attempt& attempt);
    [[nodiscard]] bool enterTranscribing(Job& job);
    [[nodiscard]] ProcessResult settle(Job& job, const Lease& lease, const Attempt& attempt);
    [[nodiscard]] ProcessResult finishTerminal(Job& job, const Lease& lease, JobState next, const JobPatch& patch);
    [[nodiscard]] ProcessResult abandon(const Lease& lease, const std::string& reason) noexcept;
    static void appendFinal(std::vector<Segment>& segments, const std::vector<Segment>& produced);
};

}
