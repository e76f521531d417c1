/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/store.hpp"
#include "voxa/logger.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <unistd.h>

#include <nlohmann/json.hpp>

namespace voxa {

namespace {

using json = nlohmann::json;

constexpr const char* kRecordFile = "job.json";
constexpr const char* kStagingDir = "writing";
constexpr const char* kUsageFile = "usage.json";

constexpr JobState kAllStates[] = {
    JobState::Received, JobState::Queued, JobState::Converting, JobState::Transcribing,
    JobState::Completed, JobState::Failed, JobState::Cancelled
};

std::int64_t toMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

Clock::time_point fromMillis(std::int64_t ms) {
    return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

json toJson(const Job& job) {
    json segments = json::array();
    for (const auto& segment : job.segments) {
        segments.push_back({
            {"text", segment.text},
            {"start_ms", segment.startMs},
            {"end_ms", segment.endMs}
        });
    }

    return json{
        {"id", job.id},
        {"owner", job.owner},
        {"source", job.sourceRef},
        {"source_bytes", job.sourceBytes},
        {"state", toString(job.state)},
        {"stage", toString(job.stage)},
        {"attempts", job.attempts},
        {"resume_offset_ms", job.resumeOffsetMs},
        {"audio_ms", job.audioMs},
        {"segments", segments},
        {"error_kind", toString(job.errorKind)},
        {"error", job.error},
        {"delivered", job.delivered},
        {"created_at", toMillis(job.createdAt)},
        {"updated_at", toMillis(job.updatedAt)}
    };
}

Job fromJson(const json& j) {
    Job job;
    job.id = j.at("id").get<std::string>();
    job.owner = j.at("owner").get<std::string>();
    job.sourceRef = j.at("source").get<std::string>();
    job.sourceBytes = j.value("source_bytes", std::uintmax_t{0});
    job.stage = parseJobState(j.value("stage", std::string("converting"))).value_or(JobState::Converting);
    job.attempts = j.value("attempts", 0);
    job.resumeOffsetMs = j.value("resume_offset_ms", std::int64_t{0});
    job.audioMs = j.value("audio_ms", std::int64_t{0});

    if (j.contains("segments")) {
        for (const auto& s : j.at("segments")) {
            Segment segment;
            segment.text = s.at("text").get<std::string>();
            segment.startMs = s.value("start_ms", std::int64_t{-1});
            segment.endMs = s.value("end_ms", std::int64_t{-1});
            segment.final = true;
            job.segments.push_back(std::move(segment));
        }
    }

    job.errorKind = parseErrorKind(j.value("error_kind", std::string("none"))).value_or(ErrorKind::Internal);
    job.error = j.value("error", std::string());
    job.delivered = j.value("delivered", false);
    job.createdAt = fromMillis(j.value("created_at", std::int64_t{0}));
    job.updatedAt = fromMillis(j.value("updated_at", std::int64_t{0}));
    return job;
}

void applyPatch(Job& job, const JobPatch& patch) {
    if (patch.sourceBytes) job.sourceBytes = *patch.sourceBytes;
    if (patch.stage) job.stage = *patch.stage;
    if (patch.attempts) job.attempts = *patch.attempts;
    if (patch.resumeOffsetMs) job.resumeOffsetMs = *patch.resumeOffsetMs;
    if (patch.audioMs) job.audioMs = *patch.audioMs;
    if (patch.segments) job.segments = *patch.segments;
    if (patch.errorKind) job.errorKind = *patch.errorKind;
    if (patch.error) job.error = *patch.error;
}

void sortByCreation(std::vector<Job>& jobs) {
    std::sort(jobs.begin(), jobs.end(), [](const Job& a, const Job& b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt < b.createdAt;
        }
        return a.id < b.id;
    });
}

}

JobStore::JobStore(const std::filesystem::path& workspace) : workspace_(workspace) {
    LOG_DEBUG("JobStore created for workspace: " + workspace_.string());
}

bool JobStore::createLayout() noexcept {
    try {
        std::filesystem::create_directories(workspace_ / kStagingDir);
        for (JobState state : kAllStates) {
            std::filesystem::create_directories(stateDir(state));
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create workspace layout: " + std::string(e.what()));
        return false;
    }
}

std::optional<Job> JobStore::create(const std::string& owner, const std::string& sourceRef) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);

        Job job;
        job.id = generateId();
        job.owner = owner;
        job.sourceRef = sourceRef;
        job.state = JobState::Received;
        job.createdAt = Clock::now();
        job.updatedAt = job.createdAt;

        auto staging = workspace_ / kStagingDir / job.id;
        std::filesystem::create_directories(staging);
        if (!writeRecord(staging, job)) {
            LOG_ERROR(jobTag(job.id) + "failed to write record");
            std::error_code ec;
            std::filesystem::remove_all(staging, ec);
            return std::nullopt;
        }

        // Publish: the job becomes visible only once fully written
        std::error_code ec;
        std::filesystem::rename(staging, jobDir(JobState::Received, job.id), ec);
        if (ec) {
            LOG_ERROR(jobTag(job.id) + "failed to publish: " + ec.message());
            std::filesystem::remove_all(staging, ec);
            return std::nullopt;
        }

        LOG_DEBUG(jobTag(job.id) + "created for owner " + owner);
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        return std::nullopt;
    }
}

TransitionResult JobStore::transition(const JobId& id, JobState expected, JobState next,
                                      const JobPatch& patch) noexcept {
    if (!allowed(expected, next)) {
        LOG_WARN(jobTag(id) + "rejected transition " + toString(expected) + " -> " + toString(next));
        return {TransitionStatus::InvalidTransition, {}};
    }

    try {
        std::lock_guard<std::mutex> lock(mutex_);

        auto source = jobDir(expected, id);
        if (!std::filesystem::is_directory(source)) {
            LOG_DEBUG(jobTag(id) + "not in state " + toString(expected));
            return {TransitionStatus::StateMismatch, {}};
        }

        auto job = load(source, expected);
        if (!job) {
            return {TransitionStatus::IoError, {}};
        }

        applyPatch(*job, patch);
        job->state = next;
        job->updatedAt = Clock::now();

        // The directory stays authoritative: if the rename below fails the
        // record's "state" field is ignored on load.
        if (!writeRecord(source, *job)) {
            LOG_ERROR(jobTag(id) + "failed to rewrite record");
            return {TransitionStatus::IoError, {}};
        }

        std::error_code ec;
        std::filesystem::rename(source, jobDir(next, id), ec);
        if (ec) {
            LOG_ERROR(jobTag(id) + "failed to move to " + toString(next) + ": " + ec.message());
            return {TransitionStatus::IoError, {}};
        }

        LOG_DEBUG(jobTag(id) + toString(expected) + " -> " + toString(next));
        return {TransitionStatus::Ok, std::move(*job)};
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(id) + "transition error: " + std::string(e.what()));
        return {TransitionStatus::IoError, {}};
    }
}

std::optional<Job> JobStore::get(const JobId& id) const noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto state = locate(id);
        if (!state) {
            return std::nullopt;
        }
        return load(jobDir(*state, id), *state);
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(id) + "read error: " + std::string(e.what()));
        return std::nullopt;
    }
}

std::vector<Job> JobStore::listActive() const noexcept {
    std::vector<Job> jobs;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        collect(JobState::Converting, jobs);
        collect(JobState::Transcribing, jobs);
        sortByCreation(jobs);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing active jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::vector<Job> JobStore::listPending() const noexcept {
    std::vector<Job> jobs;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        collect(JobState::Received, jobs);
        collect(JobState::Queued, jobs);
        sortByCreation(jobs);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing pending jobs: " + std::string(e.what()));
    }
    return jobs;
}

std::vector<Job> JobStore::listStale(Clock::time_point olderThan) const noexcept {
    std::vector<Job> stale;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Job> all;
        for (JobState state : kAllStates) {
            collect(state, all);
        }
        std::copy_if(all.begin(), all.end(), std::back_inserter(stale),
                     [olderThan](const Job& job) { return job.updatedAt < olderThan; });
        sortByCreation(stale);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing stale jobs: " + std::string(e.what()));
    }
    return stale;
}

std::vector<Job> JobStore::list(JobState state) const noexcept {
    std::vector<Job> jobs;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        collect(state, jobs);
        sortByCreation(jobs);
    } catch (const std::exception& e) {
        LOG_ERROR("Error listing " + std::string(toString(state)) + " jobs: " + e.what());
    }
    return jobs;
}

bool JobStore::markDelivered(const JobId& id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto state = locate(id);
        if (!state || !isTerminal(*state)) {
            LOG_WARN(jobTag(id) + "cannot mark delivered: not a terminal job");
            return false;
        }
        auto dir = jobDir(*state, id);
        auto job = load(dir, *state);
        if (!job) {
            return false;
        }
        if (job->delivered) {
            return true;
        }
        job->delivered = true;
        if (!writeRecord(dir, *job)) {
            LOG_ERROR(jobTag(id) + "failed to record delivery");
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(id) + "mark delivered error: " + std::string(e.what()));
        return false;
    }
}

bool JobStore::remove(const JobId& id) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto state = locate(id);
        if (!state) {
            return false;
        }
        if (!isTerminal(*state)) {
            LOG_WARN(jobTag(id) + "refusing to remove job in state " + toString(*state));
            return false;
        }

        auto dir = jobDir(*state, id);
        if (auto job = load(dir, *state)) {
            auto ledger = readLedger();
            Usage& totals = ledger[job->owner];
            ++totals.requests;
            totals.bytes += job->sourceBytes;
            totals.audioMs += job->audioMs;
            if (!writeLedger(ledger)) {
                LOG_ERROR(jobTag(id) + "usage ledger not updated, keeping job");
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            LOG_ERROR(jobTag(id) + "failed to remove: " + ec.message());
            return false;
        }
        LOG_DEBUG(jobTag(id) + "removed");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(id) + "remove error: " + std::string(e.what()));
        return false;
    }
}

Usage JobStore::usage(const std::string& owner) const noexcept {
    Usage total;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto ledger = readLedger();

        std::vector<Job> live;
        for (JobState state : kAllStates) {
            collect(state, live);
        }
        for (const auto& job : live) {
            Usage& totals = ledger[job.owner];
            ++totals.requests;
            totals.bytes += job.sourceBytes;
            totals.audioMs += job.audioMs;
        }

        for (const auto& [name, totals] : ledger) {
            if (!owner.empty() && name != owner) {
                continue;
            }
            total.requests += totals.requests;
            total.bytes += totals.bytes;
            total.audioMs += totals.audioMs;
            if (owner.empty() && totals.requests > 0) {
                ++total.owners;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error computing usage: " + std::string(e.what()));
    }
    return total;
}

StateCounts JobStore::counts() const noexcept {
    StateCounts counts;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        for (JobState state : kAllStates) {
            auto dir = stateDir(state);
            if (!std::filesystem::exists(dir)) {
                continue;
            }
            std::size_t n = 0;
            for (const auto& entry : std::filesystem::directory_iterator(dir)) {
                if (entry.is_directory()) ++n;
            }
            counts.byState[static_cast<std::size_t>(state)] = n;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Error counting jobs: " + std::string(e.what()));
    }
    return counts;
}

bool JobStore::allowed(JobState from, JobState to) noexcept {
    switch (from) {
        case JobState::Received:
            return to == JobState::Queued || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Queued:
            return to == JobState::Converting || to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Converting:
            return to == JobState::Transcribing || to == JobState::Queued ||
                   to == JobState::Failed || to == JobState::Cancelled;
        case JobState::Transcribing:
            return to == JobState::Completed || to == JobState::Queued ||
                   to == JobState::Failed || to == JobState::Cancelled;
        default:
            return false;
    }
}

JobId JobStore::generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

std::filesystem::path JobStore::stateDir(JobState state) const {
    return workspace_ / toString(state);
}

std::filesystem::path JobStore::jobDir(JobState state, const JobId& id) const {
    return stateDir(state) / id;
}

std::optional<JobState> JobStore::locate(const JobId& id) const {
    if (id.empty() || id.find('/') != std::string::npos || id == "." || id == "..") {
        return std::nullopt;
    }
    for (JobState state : kAllStates) {
        if (std::filesystem::is_directory(jobDir(state, id))) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<Job> JobStore::load(const std::filesystem::path& dir, JobState state) const {
    auto path = dir / kRecordFile;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        LOG_ERROR("Job record missing: " + path.string());
        return std::nullopt;
    }

    try {
        json j = json::parse(file);
        Job job = fromJson(j);
        job.state = state;
        return job;
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt job record " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

bool JobStore::writeRecord(const std::filesystem::path& dir, const Job& job) const {
    auto tempPath = dir / (std::string(kRecordFile) + ".tmp");
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file << toJson(job).dump(2);
        file.flush();
        if (!file.good()) return false;
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, dir / kRecordFile, ec);
    return !ec;
}

std::map<std::string, Usage> JobStore::readLedger() const {
    std::map<std::string, Usage> ledger;
    auto path = workspace_ / kUsageFile;
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ledger;
    }

    try {
        json j = json::parse(file);
        for (const auto& [owner, entry] : j.value("owners", json::object()).items()) {
            Usage& totals = ledger[owner];
            totals.requests = entry.value("requests", std::size_t{0});
            totals.bytes = entry.value("bytes", std::uintmax_t{0});
            totals.audioMs = entry.value("audio_ms", std::int64_t{0});
        }
    } catch (const json::exception& e) {
        LOG_ERROR("Corrupt usage ledger " + path.string() + ": " + e.what());
    }
    return ledger;
}

bool JobStore::writeLedger(const std::map<std::string, Usage>& ledger) const {
    json owners = json::object();
    for (const auto& [owner, totals] : ledger) {
        owners[owner] = json{
            {"requests", totals.requests},
            {"bytes", totals.bytes},
            {"audio_ms", totals.audioMs}
        };
    }

    auto tempPath = workspace_ / (std::string(kUsageFile) + ".tmp");
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file) return false;
        file << json{{"owners", owners}}.dump(2);
        file.flush();
        if (!file.good()) return false;
    }

    std::error_code ec;
    std::filesystem::rename(tempPath, workspace_ / kUsageFile, ec);
    return !ec;
}

void JobStore::collect(JobState state, std::vector<Job>& out) const {
    auto dir = stateDir(state);
    if (!std::filesystem::exists(dir)) {
        return;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (!entry.is_directory()) {
            continue;
        }
        if (auto job = load(entry.path(), state)) {
            out.push_back(std::move(*job));
        }
    }
}

}
