/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/pool.hpp"
#include "voxa/logger.hpp"

namespace voxa {

Pool::Pool(int workers, AdmissionQueue& queue) noexcept : workers_(workers), queue_(queue) {
    LOG_DEBUG("Pool created with " + std::to_string(workers) + " workers over " +
              std::to_string(queue.slots()) + " slots");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid job processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    queue_.shutdown();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    LOG_INFO("Pool stopped");
}

void Pool::workerLoop(int workerId) {
    ThreadNameScope name(getThreadName(workerId));
    LOG_DEBUG("Worker thread started");

    for (;;) {
        std::optional<Lease> lease;
        try {
            lease = queue_.acquireSlot();
        } catch (const std::exception& e) {
            LOG_ERROR("Waiting for a slot failed: " + std::string(e.what()));
            break;
        }
        if (!lease) {
            break;
        }

        LOG_INFO(jobTag(lease->id) + "claimed on slot " + std::to_string(lease->slot));
        try {
            processor_(*lease, workerId);
        } catch (const std::exception& e) {
            // The processor owns the lease; if it threw, give the slot back so
            // the queue does not shrink. Recovery picks the job up on restart.
            LOG_ERROR(jobTag(lease->id) + "processing error: " + std::string(e.what()));
            queue_.releaseSlot(*lease, Release::Finished);
        }
    }

    LOG_DEBUG("Worker stopped");
}

}
