/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/processor.hpp"
#include "voxa/logger.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace voxa {

namespace {

std::string elapsedSince(std::chrono::steady_clock::time_point start) {
    auto seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds << "s";
    return out.str();
}

}

const char* toString(ProcessResult result) noexcept {
    switch (result) {
        case ProcessResult::Completed: return "completed";
        case ProcessResult::Failed: return "failed";
        case ProcessResult::Cancelled: return "cancelled";
        case ProcessResult::Requeued: return "requeued";
        case ProcessResult::Interrupted: return "interrupted";
        case ProcessResult::Lost: return "lost";
    }
    return "unknown";
}

Processor::Processor(JobStore& store, AdmissionQueue& queue, const Config& config,
                     std::shared_ptr<Normalizer> normalizer, std::shared_ptr<SourceResolver> sources,
                     std::shared_ptr<Delivery> delivery, std::shared_ptr<ResultCache> cache)
    : store_(store), queue_(queue), retry_(config.retry),
      assembler_(config.messageLimit, config.numberParts),
      normalizer_(std::move(normalizer)), sources_(std::move(sources)), delivery_(std::move(delivery)),
      cache_(std::move(cache)) {
    LOG_DEBUG("Processor created, retry policy: " + retry_.describe());
}

bool Processor::initializeEngines(const RecognizerFactory& factory, int slots) {
    engines_.clear();
    try {
        for (int i = 0; i < slots; ++i) {
            auto engine = factory(i);
            if (!engine) {
                LOG_ERROR("No recognizer for slot " + std::to_string(i));
                engines_.clear();
                return false;
            }
            engines_.push_back(std::move(engine));
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize recognizers: " + std::string(e.what()));
        engines_.clear();
        return false;
    }
    LOG_DEBUG("All " + std::to_string(slots) + " recognizers initialized");
    return true;
}

ProcessResult Processor::process(const Lease& lease, int workerId) noexcept {
    auto start = std::chrono::steady_clock::now();
    try {
        auto slot = static_cast<std::size_t>(lease.slot);
        if (lease.slot < 0 || slot >= engines_.size()) {
            LOG_ERROR(jobTag(lease.id) + "no recognizer for slot " + std::to_string(lease.slot));
            return abandon(lease, "no recognizer for slot " + std::to_string(lease.slot));
        }

        auto stored = store_.get(lease.id);
        if (!stored) {
            LOG_ERROR(jobTag(lease.id) + "record missing");
            queue_.releaseSlot(lease, Release::Finished);
            return ProcessResult::Lost;
        }
        Job job = std::move(*stored);

        if (queue_.isCancelled(job.id)) {
            return finishTerminal(job, lease, JobState::Cancelled, {});
        }

        auto claimed = store_.transition(job.id, JobState::Queued, JobState::Converting);
        if (!claimed) {
            LOG_WARN(jobTag(job.id) + "could not be claimed from " + toString(job.state));
            return abandon(lease, std::string("could not be claimed from ") + toString(job.state));
        }
        job = std::move(claimed.job);
        LOG_INFO(jobTag(job.id) + "converting on worker " + std::to_string(workerId) +
                 (job.attempts > 0 ? ", retry " + std::to_string(job.attempts) + " of " +
                                     std::to_string(retry_.budget()) : std::string()));

        Attempt attempt = runAttempt(job, *engines_[slot]);
        ProcessResult result = settle(job, lease, attempt);
        LOG_INFO(jobTag(job.id) + toString(result) + " after " + elapsedSince(start));
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(lease.id) + "internal error: " + std::string(e.what()));
        return abandon(lease, e.what());
    }
}

ProcessResult Processor::abandon(const Lease& lease, const std::string& reason) noexcept {
    try {
        auto current = store_.get(lease.id);
        if (!current || isTerminal(current->state)) {
            queue_.releaseSlot(lease, Release::Finished);
            return ProcessResult::Lost;
        }

        JobPatch patch;
        patch.errorKind = ErrorKind::Internal;
        patch.error = reason;
        auto failed = store_.transition(lease.id, current->state, JobState::Failed, patch);
        if (!failed) {
            // The record still looks live; keep its owner blocked until recovery.
            LOG_ERROR(jobTag(lease.id) + "left " + toString(current->state) + " after: " + reason);
            queue_.releaseSlot(lease, Release::Hold);
            return ProcessResult::Lost;
        }
        queue_.releaseSlot(lease, Release::Finished);
        notify(failed.job);
        return ProcessResult::Failed;
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(lease.id) + "could not be settled: " + std::string(e.what()));
        return ProcessResult::Lost;
    }
}

Processor::Attempt Processor::runAttempt(Job& job, Recognizer& engine) {
    Attempt attempt;

    if (cache_ && fromCache(job, attempt)) {
        return attempt;
    }

    auto source = sources_->open(job.sourceRef);
    if (!source) {
        attempt.error = ErrorKind::SourceUnavailable;
        attempt.message = "cannot open " + job.sourceRef;
        return attempt;
    }

    OpenResult opened = normalizer_->open(std::move(source));
    if (!opened) {
        attempt.error = opened.error;
        attempt.message = opened.message;
        return attempt;
    }
    PcmStream& stream = *opened.stream;

    bool begun = false;
    std::int64_t nextOffset = job.resumeOffsetMs;
    PcmChunk chunk;

    for (;;) {
        if (queue_.isCancelled(job.id)) {
            stream.close();
            attempt.outcome = Outcome::Cancelled;
            return attempt;
        }
        if (stopping_.load()) {
            stream.close();
            attempt.outcome = Outcome::Stopped;
            return attempt;
        }

        ReadResult read = stream.next(chunk);
        if (read.status == ReadStatus::End) {
            break;
        }
        if (read.status == ReadStatus::Error) {
            if (begun) {
                EngineResult flushed = engine.finish();
                if (flushed) appendFinal(job.segments, flushed.segments);
                job.resumeOffsetMs = nextOffset;
            }
            attempt.error = read.error;
            attempt.message = read.message;
            return attempt;
        }

        std::int64_t chunkEnd = chunk.offsetMs + chunk.durationMs();
        job.audioMs = std::max(job.audioMs, chunkEnd);
        if (chunk.offsetMs < job.resumeOffsetMs) {
            continue;
        }

        if (!begun) {
            if (job.state == JobState::Converting && !enterTranscribing(job)) {
                stream.close();
                attempt.error = ErrorKind::Internal;
                attempt.message = "could not record transcription start";
                return attempt;
            }
            if (!engine.begin(chunk.offsetMs)) {
                stream.close();
                attempt.error = ErrorKind::EngineFault;
                attempt.message = "recognizer refused to start";
                return attempt;
            }
            begun = true;
        }

        EngineResult fed = engine.feed(chunk);
        if (!fed) {
            stream.close();
            if (fed.error != ErrorKind::EngineFault) {
                // Keep what the engine already heard; the retry restarts at this chunk.
                EngineResult flushed = engine.finish();
                if (flushed) appendFinal(job.segments, flushed.segments);
            }
            job.resumeOffsetMs = chunk.offsetMs;
            attempt.error = fed.error;
            attempt.message = fed.message;
            return attempt;
        }
        appendFinal(job.segments, fed.segments);
        nextOffset = chunkEnd;
        LOG_TRACE(jobTag(job.id) + "chunk at " + std::to_string(chunk.offsetMs) + " ms, " +
                  std::to_string(job.segments.size()) + " segments");
    }

    if (job.state == JobState::Converting && !enterTranscribing(job)) {
        attempt.error = ErrorKind::Internal;
        attempt.message = "could not record transcription start";
        return attempt;
    }
    if (begun) {
        EngineResult flushed = engine.finish();
        if (!flushed) {
            job.resumeOffsetMs = nextOffset;
            attempt.error = flushed.error;
            attempt.message = flushed.message;
            return attempt;
        }
        appendFinal(job.segments, flushed.segments);
    }

    attempt.outcome = Outcome::Done;
    return attempt;
}

// True when the cache settled the attempt. On a miss the key is kept so a
// successful run can be stored under it.
bool Processor::fromCache(Job& job, Attempt& attempt) {
    auto source = sources_->open(job.sourceRef);
    if (!source) {
        return false;
    }
    auto key = ResultCache::key(*source);
    if (!key) {
        LOG_WARN(jobTag(job.id) + "could not hash source, cache skipped");
        return false;
    }
    auto hit = cache_->get(*key);
    if (!hit) {
        attempt.cacheKey = *key;
        return false;
    }

    job.audioMs = hit->audioMs;
    if (job.state == JobState::Converting && !enterTranscribing(job)) {
        attempt.error = ErrorKind::Internal;
        attempt.message = "could not record transcription start";
        return true;
    }
    job.segments = std::move(hit->segments);
    LOG_INFO(jobTag(job.id) + "transcript reused from cache " + *key);
    attempt.outcome = Outcome::Done;
    return true;
}

bool Processor::enterTranscribing(Job& job) {
    JobPatch patch;
    patch.stage = JobState::Transcribing;
    patch.attempts = job.stage == JobState::Transcribing ? job.attempts : 0;
    patch.audioMs = job.audioMs;

    auto moved = store_.transition(job.id, JobState::Converting, JobState::Transcribing, patch);
    if (!moved) {
        LOG_ERROR(jobTag(job.id) + "failed to enter transcribing");
        return false;
    }
    job = std::move(moved.job);
    LOG_DEBUG(jobTag(job.id) + "transcribing from " + std::to_string(job.resumeOffsetMs) + " ms");
    return true;
}

ProcessResult Processor::settle(Job& job, const Lease& lease, const Attempt& attempt) {
    switch (attempt.outcome) {
        case Outcome::Done: {
            if (cache_ && !attempt.cacheKey.empty()) {
                cache_->put(attempt.cacheKey, CachedResult{job.segments, job.audioMs});
            }
            JobPatch patch;
            patch.segments = job.segments;
            patch.audioMs = job.audioMs;
            patch.errorKind = ErrorKind::None;
            patch.error = std::string();
            return finishTerminal(job, lease, JobState::Completed, patch);
        }
        case Outcome::Cancelled: {
            JobPatch patch;
            patch.segments = job.segments;
            return finishTerminal(job, lease, JobState::Cancelled, patch);
        }
        case Outcome::Stopped:
            LOG_INFO(jobTag(job.id) + "left " + toString(job.state) + " for recovery");
            queue_.releaseSlot(lease, Release::Hold);
            return ProcessResult::Interrupted;
        case Outcome::Error:
            break;
    }

    LOG_WARN(jobTag(job.id) + toString(attempt.error) + " during " + toString(job.state) + ": " + attempt.message);

    if (!retry_.shouldRetry(attempt.error, job.attempts)) {
        JobPatch patch;
        patch.segments = job.segments;
        patch.resumeOffsetMs = job.resumeOffsetMs;
        patch.audioMs = job.audioMs;
        patch.errorKind = attempt.error;
        patch.error = attempt.message;
        return finishTerminal(job, lease, JobState::Failed, patch);
    }

    JobPatch patch;
    patch.attempts = job.attempts + 1;
    patch.segments = job.segments;
    patch.resumeOffsetMs = job.resumeOffsetMs;
    patch.audioMs = job.audioMs;
    patch.errorKind = attempt.error;
    patch.error = attempt.message;

    auto requeued = store_.transition(job.id, job.state, JobState::Queued, patch);
    if (!requeued) {
        LOG_ERROR(jobTag(job.id) + "could not be requeued for retry");
        return abandon(lease, "could not be requeued for retry");
    }
    job = std::move(requeued.job);

    if (queue_.releaseSlot(lease, Release::Requeue)) {
        LOG_INFO(jobTag(job.id) + "retry " + std::to_string(job.attempts) + " of " +
                 std::to_string(retry_.budget()) + " queued");
        return ProcessResult::Requeued;
    }

    // Cancelled while the retry was being recorded; the queue holds the owner
    // until the store agrees.
    auto cancelled = store_.transition(job.id, JobState::Queued, JobState::Cancelled);
    if (!cancelled) {
        LOG_ERROR(jobTag(job.id) + "cancel after retry failed");
        return ProcessResult::Lost;
    }
    queue_.forget(job.id);
    notify(cancelled.job);
    return ProcessResult::Cancelled;
}

ProcessResult Processor::finishTerminal(Job& job, const Lease& lease, JobState next, const JobPatch& patch) {
    auto moved = store_.transition(job.id, job.state, next, patch);
    if (!moved) {
        LOG_ERROR(jobTag(job.id) + "could not move from " + toString(job.state) + " to " + toString(next));
        return abandon(lease, std::string("could not record ") + toString(next));
    }
    queue_.releaseSlot(lease, Release::Finished);
    job = std::move(moved.job);
    notify(job);

    switch (next) {
        case JobState::Completed: return ProcessResult::Completed;
        case JobState::Cancelled: return ProcessResult::Cancelled;
        default: return ProcessResult::Failed;
    }
}

bool Processor::notify(const Job& job) noexcept {
    if (!delivery_ || !assembler_.deliver(job, *delivery_)) {
        return false;
    }
    if (!store_.markDelivered(job.id)) {
        LOG_WARN(jobTag(job.id) + "delivered but not marked; it will be sent again on restart");
    }
    return true;
}

void Processor::appendFinal(std::vector<Segment>& segments, const std::vector<Segment>& produced) {
    std::int64_t floor = 0;
    for (const auto& seg : segments) {
        floor = std::max(floor, seg.startMs);
    }
    for (const auto& seg : produced) {
        if (!seg.final || seg.text.empty()) {
            continue;
        }
        Segment kept = seg;
        if (kept.startMs >= 0) {
            kept.startMs = std::max(kept.startMs, floor);
            if (kept.endMs >= 0 && kept.endMs < kept.startMs) {
                kept.endMs = kept.startMs;
            }
            floor = kept.startMs;
        }
        segments.push_back(std::move(kept));
    }
}

}
