/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/queue.hpp"
#include "voxa/logger.hpp"

namespace voxa {

const char* toString(AdmitStatus status) noexcept {
    switch (status) {
        case AdmitStatus::Accepted: return "accepted";
        case AdmitStatus::QueueFull: return "queue_full";
        case AdmitStatus::DuplicateActiveJob: return "duplicate_active_job";
        case AdmitStatus::Duplicate: return "duplicate";
        case AdmitStatus::Closed: return "closed";
    }
    return "unknown";
}

AdmissionQueue::AdmissionQueue(int slots, std::size_t maxDepth, OwnerPolicy policy, bool ownerExclusive)
    : maxDepth_(maxDepth), policy_(policy), ownerExclusive_(ownerExclusive),
      slotBusy_(static_cast<std::size_t>(slots > 0 ? slots : 1), false) {
    LOG_DEBUG("Admission queue: " + std::to_string(slotBusy_.size()) + " slots, depth " +
              std::to_string(maxDepth_) + ", owner policy " +
              (policy_ == OwnerPolicy::Reject ? "reject" : "queue"));
}

AdmitStatus AdmissionQueue::check(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checkLocked(owner);
}

AdmitStatus AdmissionQueue::checkLocked(const std::string& owner) const {
    if (closed_) {
        return AdmitStatus::Closed;
    }
    if (policy_ == OwnerPolicy::Reject) {
        auto it = ownerJobs_.find(owner);
        if (it != ownerJobs_.end() && it->second > 0) {
            return AdmitStatus::DuplicateActiveJob;
        }
    }
    if (pending_.size() >= maxDepth_) {
        return AdmitStatus::QueueFull;
    }
    return AdmitStatus::Accepted;
}

AdmitStatus AdmissionQueue::submit(const JobId& id, const std::string& owner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingSeq_.count(id) || active_.count(id) || held_.count(id)) {
            return AdmitStatus::Duplicate;
        }
        AdmitStatus status = checkLocked(owner);
        if (status != AdmitStatus::Accepted) {
            return status;
        }
        enqueueLocked(nextSeq_++, id, owner);
    }
    changed_.notify_all();
    return AdmitStatus::Accepted;
}

void AdmissionQueue::restore(const JobId& id, const std::string& owner) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pendingSeq_.count(id) || active_.count(id)) {
            return;
        }
        enqueueLocked(nextSeq_++, id, owner);
    }
    changed_.notify_all();
}

void AdmissionQueue::enqueueLocked(std::uint64_t seq, const JobId& id, const std::string& owner) {
    pending_[seq] = Entry{id, owner};
    pendingSeq_[id] = seq;
    ++ownerJobs_[owner];
}

std::optional<Lease> AdmissionQueue::acquireSlot() {
    std::unique_lock<std::mutex> lock(mutex_);
    auto entry = pending_.end();
    changed_.wait(lock, [this, &entry] {
        if (closed_) return true;
        if (freeSlotLocked() < 0) return false;
        entry = nextEligibleLocked();
        return entry != pending_.end();
    });
    if (closed_) {
        return std::nullopt;
    }

    Lease lease;
    lease.id = entry->second.id;
    lease.owner = entry->second.owner;
    lease.slot = freeSlotLocked();

    Active active;
    active.owner = lease.owner;
    active.seq = entry->first;
    active.slot = lease.slot;

    slotBusy_[static_cast<std::size_t>(lease.slot)] = true;
    ++ownerRunning_[lease.owner];
    active_[lease.id] = active;
    pendingSeq_.erase(lease.id);
    pending_.erase(entry);
    return lease;
}

bool AdmissionQueue::releaseSlot(const Lease& lease, Release how) {
    bool requeued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(lease.id);
        if (it == active_.end()) {
            LOG_WARN(jobTag(lease.id) + "released a slot it does not hold");
            return false;
        }

        Active active = it->second;
        active_.erase(it);
        slotBusy_[static_cast<std::size_t>(active.slot)] = false;
        decrement(ownerRunning_, active.owner);

        if (how == Release::Requeue && !active.cancelled) {
            pending_[active.seq] = Entry{lease.id, active.owner};
            pendingSeq_[lease.id] = active.seq;
            requeued = true;
        } else if (how == Release::Finished) {
            decrement(ownerJobs_, active.owner);
        } else {
            held_[lease.id] = active.owner;
        }
    }
    changed_.notify_all();
    return requeued;
}

CancelOutcome AdmissionQueue::cancel(const JobId& id) {
    CancelOutcome outcome = CancelOutcome::NotFound;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto seq = pendingSeq_.find(id);
        if (seq != pendingSeq_.end()) {
            auto entry = pending_.find(seq->second);
            held_[id] = entry->second.owner;
            pending_.erase(entry);
            pendingSeq_.erase(seq);
            outcome = CancelOutcome::Removed;
        } else {
            auto active = active_.find(id);
            if (active != active_.end()) {
                active->second.cancelled = true;
                outcome = CancelOutcome::Flagged;
            }
        }
    }
    if (outcome == CancelOutcome::Removed) {
        changed_.notify_all();
    }
    return outcome;
}

void AdmissionQueue::forget(const JobId& id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = held_.find(id);
        if (it == held_.end()) {
            return;
        }
        decrement(ownerJobs_, it->second);
        held_.erase(it);
    }
    changed_.notify_all();
}

bool AdmissionQueue::isCancelled(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    return it != active_.end() && it->second.cancelled;
}

void AdmissionQueue::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    changed_.notify_all();
}

std::size_t AdmissionQueue::depth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

std::size_t AdmissionQueue::activeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

std::map<std::uint64_t, AdmissionQueue::Entry>::iterator AdmissionQueue::nextEligibleLocked() {
    if (!ownerExclusive_) {
        return pending_.begin();
    }
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        auto running = ownerRunning_.find(it->second.owner);
        if (running == ownerRunning_.end() || running->second == 0) {
            return it;
        }
    }
    return pending_.end();
}

int AdmissionQueue::freeSlotLocked() const {
    for (std::size_t i = 0; i < slotBusy_.size(); ++i) {
        if (!slotBusy_[i]) return static_cast<int>(i);
    }
    return -1;
}

void AdmissionQueue::decrement(std::unordered_map<std::string, int>& counts, const std::string& owner) {
    auto it = counts.find(owner);
    if (it == counts.end()) return;
    if (--it->second <= 0) {
        counts.erase(it);
    }
}

}
