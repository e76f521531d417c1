/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voxa/job.hpp"
#include "voxa/types.hpp"

namespace voxa {

enum class TransitionStatus : uint8_t {
    Ok,
    StateMismatch,      // job is not in the expected state
    InvalidTransition,  // expected -> next is not an edge of the lifecycle
    IoError
};

struct TransitionResult {
    TransitionStatus status = TransitionStatus::IoError;
    Job job;
    explicit operator bool() const noexcept { return status == TransitionStatus::Ok; }
};

struct StateCounts {
    std::array<std::size_t, 7> byState{};
    [[nodiscard]] std::size_t operator[](JobState state) const noexcept {
        return byState[static_cast<std::size_t>(state)];
    }
};

// Request totals. Jobs removed by retention are folded into a ledger
// first, so totals cover every job the workspace ever accepted.
struct Usage {
    std::size_t requests = 0;
    std::uintmax_t bytes = 0;
    std::int64_t audioMs = 0;
    std::size_t owners = 0;  // distinct owners, global totals only
};

// Durable job records. Each job is a directory named by its id that lives
// under the directory of its current state; a transition rewrites job.json
// and renames the directory, so the rename is the compare-and-swap.
class JobStore final {
public:
    explicit JobStore(const std::filesystem::path& workspace);

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;
    JobStore(JobStore&&) = delete;
    JobStore& operator=(JobStore&&) = delete;

    [[nodiscard]] bool createLayout() noexcept;

    // Persists a new job in Received. Id and timestamps are assigned here.
    [[nodiscard]] std::optional<Job> create(const std::string& owner, const std::string& sourceRef) noexcept;

    [[nodiscard]] TransitionResult transition(const JobId& id, JobState expected, JobState next,
                                              const JobPatch& patch = {}) noexcept;

    [[nodiscard]] std::optional<Job> get(const JobId& id) const noexcept;

    // Converting and Transcribing jobs, oldest first.
    [[nodiscard]] std::vector<Job> listActive() const noexcept;
    // Received and Queued jobs, oldest first.
    [[nodiscard]] std::vector<Job> listPending() const noexcept;
    // Jobs in any state not updated since `olderThan`.
    [[nodiscard]] std::vector<Job> listStale(Clock::time_point olderThan) const noexcept;
    [[nodiscard]] std::vector<Job> list(JobState state) const noexcept;

    // Records that a terminal job's messages reached its owner.
    [[nodiscard]] bool markDelivered(const JobId& id) noexcept;

    // Drops a terminal job's directory after adding it to the usage ledger.
    [[nodiscard]] bool remove(const JobId& id) noexcept;

    // Totals for one owner, or across all owners when `owner` is empty.
    [[nodiscard]] Usage usage(const std::string& owner = {}) const noexcept;

    [[nodiscard]] StateCounts counts() const noexcept;
    [[nodiscard]] const std::filesystem::path& workspace() const noexcept { return workspace_; }

    [[nodiscard]] static bool allowed(JobState from, JobState to) noexcept;

private:
    std::filesystem::path workspace_;
    mutable std::mutex mutex_;

    [[nodiscard]] static JobId generateId();
    [[nodiscard]] std::filesystem::path stateDir(JobState state) const;
    [[nodiscard]] std::filesystem::path jobDir(JobState state, const JobId& id) const;
    [[nodiscard]] std::optional<JobState> locate(const JobId& id) const;
    [[nodiscard]] std::optional<Job> load(const std::filesystem::path& dir, JobState state) const;
    [[nodiscard]] bool writeRecord(const std::filesystem::path& dir, const Job& job) const;
    void collect(JobState state, std::vector<Job>& out) const;
    [[nodiscard]] std::map<std::string, Usage> readLedger() const;
    [[nodiscard]] bool writeLedger(const std::map<std::string, Usage>& ledger) const;
};

}
