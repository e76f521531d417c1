/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <functional>
#include <thread>
#include <vector>

#include "voxa/queue.hpp"

namespace voxa {

// Runs a job while its lease is held. The processor decides how the lease is
// released.
using JobProcessor = std::function<void(const Lease&, int workerId)>;

class Pool {
public:
    Pool(int workers, AdmissionQueue& queue) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobProcessor processor);

    // Closes the queue and joins the workers; running jobs finish their
    // current chunk first.
    void stop() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    AdmissionQueue& queue_;
    JobProcessor processor_;

    std::atomic<bool> running_{false};
    std::vector<std::thread> workerThreads_;
};

}
