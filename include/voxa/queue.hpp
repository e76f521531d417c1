/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "voxa/config.hpp"
#include "voxa/types.hpp"

namespace voxa {

enum class AdmitStatus : uint8_t { Accepted, QueueFull, DuplicateActiveJob, Duplicate, Closed };

struct Lease {
    JobId id;
    std::string owner;
    int slot = -1;
};

// Hold frees the slot but keeps the job counted against its owner until
// forget(); used while the store has not yet recorded a final state.
enum class Release : uint8_t { Finished, Requeue, Hold };

enum class CancelOutcome : uint8_t { Removed, Flagged, NotFound };

const char* toString(AdmitStatus status) noexcept;

// Bounded FIFO of admitted jobs plus the engine slots they run on. A job
// holds a slot from acquireSlot() until releaseSlot(); at most `slots` jobs
// hold one at a time. With ownerExclusive, an owner never holds two slots,
// and a waiting job never overtakes an earlier job of the same owner.
class AdmissionQueue {
public:
    AdmissionQueue(int slots, std::size_t maxDepth, OwnerPolicy policy, bool ownerExclusive);

    AdmissionQueue(const AdmissionQueue&) = delete;
    AdmissionQueue& operator=(const AdmissionQueue&) = delete;

    // Would submit() accept a job from this owner right now?
    [[nodiscard]] AdmitStatus check(const std::string& owner) const;
    [[nodiscard]] AdmitStatus submit(const JobId& id, const std::string& owner);

    // Re-enqueue after a restart; ignores depth and owner limits.
    void restore(const JobId& id, const std::string& owner);

    // Blocks until a slot and an eligible job are both available.
    // nullopt once shutdown() was called.
    [[nodiscard]] std::optional<Lease> acquireSlot();

    // Requeue puts the job back at its original position. Returns false when
    // a requeue was refused because the job was cancelled meanwhile; the job
    // is then held as with Release::Hold.
    bool releaseSlot(const Lease& lease, Release how);

    // A waiting job is removed but stays held until forget().
    [[nodiscard]] CancelOutcome cancel(const JobId& id);

    // Drops a held job once the store shows it settled.
    void forget(const JobId& id);
    [[nodiscard]] bool isCancelled(const JobId& id) const;

    void shutdown() noexcept;

    [[nodiscard]] std::size_t depth() const;
    [[nodiscard]] std::size_t activeCount() const;
    [[nodiscard]] int slots() const noexcept { return static_cast<int>(slotBusy_.size()); }

private:
    struct Entry {
        JobId id;
        std::string owner;
    };

    struct Active {
        std::string owner;
        std::uint64_t seq = 0;
        int slot = -1;
        bool cancelled = false;
    };

    std::size_t maxDepth_;
    OwnerPolicy policy_;
    bool ownerExclusive_;

    mutable std::mutex mutex_;
    std::condition_variable changed_;
    bool closed_ = false;

    std::uint64_t nextSeq_ = 0;
    std::map<std::uint64_t, Entry> pending_;
    std::unordered_map<JobId, std::uint64_t> pendingSeq_;
    std::unordered_map<JobId, Active> active_;
    std::unordered_map<JobId, std::string> held_;        // id -> owner
    std::unordered_map<std::string, int> ownerJobs_;     // pending + active + held
    std::unordered_map<std::string, int> ownerRunning_;  // active only
    std::vector<bool> slotBusy_;

    AdmitStatus checkLocked(const std::string& owner) const;
    void enqueueLocked(std::uint64_t seq, const JobId& id, const std::string& owner);
    std::map<std::uint64_t, Entry>::iterator nextEligibleLocked();
    int freeSlotLocked() const;
    static void decrement(std::unordered_map<std::string, int>& counts, const std::string& owner);
};

}
