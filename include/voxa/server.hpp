/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "voxa/assembler.hpp"
#include "voxa/cache.hpp"
#include "voxa/config.hpp"
#include "voxa/normalizer.hpp"
#include "voxa/recognizer.hpp"
#include "voxa/source.hpp"
#include "voxa/store.hpp"

namespace voxa {

class AdmissionQueue;
class Pool;
class Processor;

enum class SubmissionError : uint8_t {
    None,
    InvalidRequest,
    SourceUnavailable,
    SourceTooLarge,
    QueueFull,
    DuplicateActiveJob,
    IoError,
    NotRunning
};

const char* toString(SubmissionError error) noexcept;

struct SubmitResult {
    JobId id;
    SubmissionError error = SubmissionError::None;
    std::string message;
    explicit operator bool() const noexcept { return error == SubmissionError::None; }
};

enum class CancelStatus : uint8_t {
    Cancelled,   // was waiting; now Cancelled
    Stopping,    // running; stops at the next chunk boundary
    Finished,    // already terminal
    NotFound
};

const char* toString(CancelStatus status) noexcept;

struct Stats {
    StateCounts states;
    std::size_t queueDepth = 0;
    std::size_t active = 0;
    int slots = 0;
};

class Server final {
public:
    // normalizer and sources default to the configured transcoder and plain
    // file paths; delivery may be null.
    Server(Config config, RecognizerFactory factory,
           std::shared_ptr<Delivery> delivery,
           std::shared_ptr<Normalizer> normalizer = nullptr,
           std::shared_ptr<SourceResolver> sources = nullptr);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();

    // Running jobs stop at their next chunk boundary and resume on restart.
    void shutdown() noexcept;

    [[nodiscard]] SubmitResult submit(const std::string& owner, const std::string& sourceRef) noexcept;
    [[nodiscard]] CancelStatus cancel(const JobId& id) noexcept;
    [[nodiscard]] std::optional<Job> job(const JobId& id) const noexcept;
    [[nodiscard]] Stats stats() const noexcept;

    // Requests, source bytes and audio for one owner, or for everyone when
    // owner is empty. Purged jobs still count.
    [[nodiscard]] Usage usage(const std::string& owner = {}) const noexcept;

    // One housekeeping pass; returns how many expired jobs were purged.
    // Expired cache entries are dropped in the same pass.
    std::size_t sweep() noexcept;

    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return config_.workspace; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    [[nodiscard]] std::size_t recover() noexcept;
    void housekeepingLoop();

    Config config_;
    RecognizerFactory factory_;
    std::shared_ptr<Delivery> delivery_;
    std::shared_ptr<Normalizer> normalizer_;
    std::shared_ptr<SourceResolver> sources_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    std::unique_ptr<JobStore> store_;
    std::shared_ptr<ResultCache> cache_;
    std::unique_ptr<AdmissionQueue> queue_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Pool> pool_;

    std::mutex submitMutex_;
    std::thread sweeperThread_;
};

}
