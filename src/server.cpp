/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/server.hpp"
#include "voxa/logger.hpp"
#include "voxa/pool.hpp"
#include "voxa/processor.hpp"
#include "voxa/queue.hpp"

#include <chrono>
#include <cstdlib>

namespace voxa {

// Note: signal handling is done by the CLI (voxad.cpp), not by Server

const char* toString(SubmissionError error) noexcept {
    switch (error) {
        case SubmissionError::None: return "none";
        case SubmissionError::InvalidRequest: return "invalid_request";
        case SubmissionError::SourceUnavailable: return "source_unavailable";
        case SubmissionError::SourceTooLarge: return "source_too_large";
        case SubmissionError::QueueFull: return "queue_full";
        case SubmissionError::DuplicateActiveJob: return "duplicate_active_job";
        case SubmissionError::IoError: return "io_error";
        case SubmissionError::NotRunning: return "not_running";
    }
    return "unknown";
}

const char* toString(CancelStatus status) noexcept {
    switch (status) {
        case CancelStatus::Cancelled: return "cancelled";
        case CancelStatus::Stopping: return "stopping";
        case CancelStatus::Finished: return "finished";
        case CancelStatus::NotFound: return "not_found";
    }
    return "unknown";
}

namespace {

SubmitResult rejected(SubmissionError error, std::string message) {
    SubmitResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

}

Server::Server(Config config, RecognizerFactory factory, std::shared_ptr<Delivery> delivery,
               std::shared_ptr<Normalizer> normalizer, std::shared_ptr<SourceResolver> sources)
    : config_(std::move(config)), factory_(std::move(factory)), delivery_(std::move(delivery)),
      normalizer_(std::move(normalizer)), sources_(std::move(sources)) {
    if (!normalizer_) {
        TranscoderOptions options;
        options.argv = config_.transcoderArgv();
        options.sampleRate = config_.sampleRate;
        options.chunkSamples = config_.chunkSamples();
        options.maxAudioMs = static_cast<std::int64_t>(config_.maxAudioSeconds) * 1000;
        normalizer_ = std::make_shared<TranscoderNormalizer>(std::move(options));
    }
    if (!sources_) {
        sources_ = std::make_shared<FileSourceResolver>();
    }
    LOG_DEBUG("Server created - model: " + config_.modelPath + ", workspace: " + config_.workspace.string() +
              ", slots: " + std::to_string(config_.slots));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    std::string problem = config_.validate();
    if (!problem.empty()) {
        LOG_ERROR("Invalid configuration: " + problem);
        return false;
    }
    if (!factory_) {
        LOG_ERROR("No recognizer factory provided");
        return false;
    }

    LOG_INFO("Starting voxa server...");
    LOG_DEBUG("Model: " + config_.modelPath);
    LOG_DEBUG("Workspace: " + config_.workspace.string());
    LOG_DEBUG("Slots: " + std::to_string(config_.slots) + ", workers: " + std::to_string(config_.workerCount()) +
              ", queue depth: " + std::to_string(config_.maxQueueDepth));
    LOG_DEBUG("Chunk: " + std::to_string(config_.chunkMs) + " ms at " + std::to_string(config_.sampleRate) + " Hz");

    try {
        store_ = std::make_unique<JobStore>(config_.workspace);
        if (!store_->createLayout()) {
            LOG_ERROR("Failed to create workspace");
            return false;
        }

        queue_ = std::make_unique<AdmissionQueue>(config_.slots, config_.maxQueueDepth,
                                                  config_.ownerPolicy, config_.ownerExclusive);
        if (config_.cacheTtlHours > 0) {
            cache_ = std::make_shared<ResultCache>(config_.workspace / "cache",
                                                   config_.modelPath + "@" + std::to_string(config_.sampleRate),
                                                   std::chrono::hours(config_.cacheTtlHours),
                                                   config_.cacheMaxBytes);
        }
        processor_ = std::make_unique<Processor>(*store_, *queue_, config_, normalizer_, sources_, delivery_,
                                                 cache_);

        // Recognizers load before any worker runs.
        if (!processor_->initializeEngines(factory_, config_.slots)) {
            LOG_ERROR("Failed to initialize recognizers");
            return false;
        }

        std::size_t restored = recover();
        if (restored > 0) {
            LOG_INFO("Recovered " + std::to_string(restored) + " unfinished job(s)");
        }

        shutdown_.store(false);
        pool_ = std::make_unique<Pool>(config_.workerCount(), *queue_);
        if (!pool_->start([this](const Lease& lease, int workerId) {
            (void)processor_->process(lease, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        running_.store(true);
        sweeperThread_ = std::thread(&Server::housekeepingLoop, this);

        LOG_DEBUG("Server started successfully");
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        if (pool_) pool_->stop();
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");
    shutdown_.store(true);

    if (processor_) {
        processor_->requestStop();
    }
    if (pool_) {
        pool_->stop();
    }
    if (sweeperThread_.joinable()) {
        sweeperThread_.join();
    }

    LOG_INFO("Server shutdown complete");
}

SubmitResult Server::submit(const std::string& owner, const std::string& sourceRef) noexcept {
    if (!running_.load()) {
        return rejected(SubmissionError::NotRunning, "service is not running");
    }
    if (owner.empty() || sourceRef.empty()) {
        return rejected(SubmissionError::InvalidRequest, "owner and source are required");
    }

    try {
        auto bytes = sources_->size(sourceRef);
        if (!bytes) {
            return rejected(SubmissionError::SourceUnavailable, "cannot read " + sourceRef);
        }
        if (*bytes > config_.maxSourceBytes) {
            return rejected(SubmissionError::SourceTooLarge,
                            std::to_string(*bytes) + " bytes exceeds the limit of " +
                            std::to_string(config_.maxSourceBytes));
        }

        std::lock_guard<std::mutex> lock(submitMutex_);

        switch (queue_->check(owner)) {
            case AdmitStatus::Accepted: break;
            case AdmitStatus::QueueFull:
                return rejected(SubmissionError::QueueFull, "queue is full");
            case AdmitStatus::DuplicateActiveJob:
                return rejected(SubmissionError::DuplicateActiveJob, "a job for this owner is still in progress");
            case AdmitStatus::Closed:
            case AdmitStatus::Duplicate:
                return rejected(SubmissionError::NotRunning, "service is stopping");
        }

        auto created = store_->create(owner, sourceRef);
        if (!created) {
            return rejected(SubmissionError::IoError, "could not record job");
        }
        const JobId id = created->id;

        // Queued must be durable before a worker can see the job.
        JobPatch sized;
        sized.sourceBytes = *bytes;
        auto queued = store_->transition(id, JobState::Received, JobState::Queued, sized);
        if (!queued) {
            JobPatch patch;
            patch.errorKind = ErrorKind::Internal;
            patch.error = "could not queue job";
            (void)store_->transition(id, JobState::Received, JobState::Failed, patch);
            return rejected(SubmissionError::IoError, "could not queue job");
        }

        AdmitStatus admitted = queue_->submit(id, owner);
        if (admitted != AdmitStatus::Accepted) {
            LOG_WARN(jobTag(id) + "admission changed to " + toString(admitted) + " during submit");
            JobPatch patch;
            patch.errorKind = ErrorKind::Internal;
            patch.error = std::string("not admitted: ") + toString(admitted);
            (void)store_->transition(id, JobState::Queued, JobState::Failed, patch);
            return rejected(admitted == AdmitStatus::QueueFull ? SubmissionError::QueueFull
                                                               : SubmissionError::NotRunning,
                            patch.error.value_or(""));
        }

        LOG_INFO(jobTag(id) + "queued for " + owner + " (" + std::to_string(*bytes) + " bytes)");
        SubmitResult result;
        result.id = id;
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Submit failed: " + std::string(e.what()));
        return rejected(SubmissionError::IoError, e.what());
    }
}

CancelStatus Server::cancel(const JobId& id) noexcept {
    if (!store_ || !queue_) {
        return CancelStatus::NotFound;
    }

    try {
        auto current = store_->get(id);
        if (!current) {
            return CancelStatus::NotFound;
        }
        if (isTerminal(current->state)) {
            queue_->forget(id);
            return CancelStatus::Finished;
        }

        switch (queue_->cancel(id)) {
            case CancelOutcome::Flagged:
                LOG_INFO(jobTag(id) + "cancel requested while running");
                return CancelStatus::Stopping;
            case CancelOutcome::Removed:
            case CancelOutcome::NotFound:
                break;
        }

        // Not holding a slot: settle it in the store directly. The queue keeps
        // the owner counted until the store agrees.
        for (int tries = 0; tries < 2; ++tries) {
            auto cancelled = store_->transition(id, current->state, JobState::Cancelled);
            if (cancelled) {
                LOG_INFO(jobTag(id) + "cancelled");
                queue_->forget(id);
                if (processor_) (void)processor_->notify(cancelled.job);
                return CancelStatus::Cancelled;
            }
            current = store_->get(id);
            if (!current) {
                queue_->forget(id);
                return CancelStatus::NotFound;
            }
            if (isTerminal(current->state)) {
                queue_->forget(id);
                return CancelStatus::Finished;
            }
        }
        LOG_WARN(jobTag(id) + "could not be cancelled from " + toString(current->state));
        return CancelStatus::NotFound;

    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(id) + "cancel failed: " + std::string(e.what()));
        return CancelStatus::NotFound;
    }
}

std::optional<Job> Server::job(const JobId& id) const noexcept {
    if (!store_) return std::nullopt;
    return store_->get(id);
}

Stats Server::stats() const noexcept {
    Stats stats;
    stats.slots = config_.slots;
    if (store_) stats.states = store_->counts();
    if (queue_) {
        try {
            stats.queueDepth = queue_->depth();
            stats.active = queue_->activeCount();
        } catch (const std::exception& e) {
            LOG_ERROR("Stats unavailable: " + std::string(e.what()));
        }
    }
    return stats;
}

Usage Server::usage(const std::string& owner) const noexcept {
    if (!store_) return Usage{};
    return store_->usage(owner);
}

std::size_t Server::recover() noexcept {
    std::size_t restored = 0;
    try {
        // Interrupted jobs restart their current stage from its checkpoint.
        for (const auto& job : store_->listActive()) {
            JobPatch patch;
            std::vector<Segment> kept;
            for (const auto& seg : job.segments) {
                bool before = seg.startMs >= 0 ? seg.startMs < job.resumeOffsetMs : job.resumeOffsetMs > 0;
                if (before) kept.push_back(seg);
            }
            patch.segments = std::move(kept);

            auto requeued = store_->transition(job.id, job.state, JobState::Queued, patch);
            if (requeued) {
                LOG_WARN(jobTag(job.id) + "recovering from " + toString(job.state) + " at " +
                         std::to_string(job.resumeOffsetMs) + " ms");
            } else {
                LOG_ERROR(jobTag(job.id) + "could not be recovered from " + toString(job.state));
            }
        }

        for (const auto& job : store_->listPending()) {
            if (job.state == JobState::Received) {
                auto queued = store_->transition(job.id, JobState::Received, JobState::Queued);
                if (!queued) {
                    LOG_ERROR(jobTag(job.id) + "could not be queued during recovery");
                    continue;
                }
            }
            queue_->restore(job.id, job.owner);
            ++restored;
        }

        // Settled before the owner accepted the result.
        for (auto state : {JobState::Completed, JobState::Failed, JobState::Cancelled}) {
            for (const auto& job : store_->list(state)) {
                if (job.delivered) continue;
                LOG_INFO(jobTag(job.id) + "redelivering " + toString(job.state) + " result");
                if (!processor_->notify(job)) {
                    LOG_WARN(jobTag(job.id) + "redelivery refused, will retry on next start");
                }
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering jobs: " + std::string(e.what()));
    }
    return restored;
}

std::size_t Server::sweep() noexcept {
    if (!store_) return 0;

    std::size_t purged = 0;
    try {
        auto cutoff = Clock::now() - std::chrono::hours(config_.retentionHours);
        for (const auto& job : store_->listStale(cutoff)) {
            if (isTerminal(job.state)) {
                if (store_->remove(job.id)) {
                    ++purged;
                }
            } else {
                LOG_WARN(jobTag(job.id) + "stuck in " + toString(job.state) + " past retention");
            }
        }
        if (purged > 0) {
            LOG_INFO("Purged " + std::to_string(purged) + " expired job(s)");
        }
        if (cache_) {
            (void)cache_->sweep();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Housekeeping error: " + std::string(e.what()));
    }
    return purged;
}

void Server::housekeepingLoop() {
    ThreadNameScope name("Sweeper");
    LOG_DEBUG("Housekeeping loop started");

    const auto interval = std::chrono::seconds(config_.sweepSeconds);
    while (!shutdown_.load()) {
        auto sleepEnd = std::chrono::steady_clock::now() + interval;
        while (std::chrono::steady_clock::now() < sleepEnd && !shutdown_.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (shutdown_.load()) break;
        (void)sweep();
    }

    LOG_DEBUG("Housekeeping loop stopped");
}

}
