/*
 * voxa - Job inspection tool (voxa-jobs)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/assembler.hpp"
#include "voxa/config.hpp"
#include "voxa/store.hpp"
#include "voxa/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <unistd.h>

using namespace voxa;

namespace {

constexpr JobState kAllStates[] = {JobState::Received, JobState::Queued, JobState::Converting,
                                   JobState::Transcribing, JobState::Completed, JobState::Failed,
                                   JobState::Cancelled};

void printUsage(const char* progName) {
    std::cout << "voxa Job Inspection Tool\n\n";
    std::cout << "Usage: " << progName << " <workspace> [job_id]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  workspace     Directory holding job records\n";
    std::cout << "  job_id        Job to show (optional)\n\n";
    std::cout << "Behavior:\n";
    std::cout << "  - If job_id provided: print its transcript, or its error\n";
    std::cout << "  - If no job_id: print per-state counts and the most recent job\n\n";
    std::cout << "Exit codes: 0 completed, 1 failed/cancelled/missing, 2 not finished\n";
}

std::optional<Job> latestJob(const JobStore& store) {
    std::optional<Job> latest;
    for (auto state : kAllStates) {
        for (auto& job : store.list(state)) {
            if (!latest || job.createdAt > latest->createdAt ||
                (job.createdAt == latest->createdAt && job.id > latest->id)) {
                latest = std::move(job);
            }
        }
    }
    return latest;
}

int showJob(const Job& job) {
    // Transcript text is not split here; the limit only matters for chat delivery.
    Assembler assembler(Config().messageLimit, false);

    switch (job.state) {
        case JobState::Completed: {
            std::string text = assembler.transcript(job.segments);
            std::cout << (text.empty() ? assembler.notice(job) : text) << std::endl;
            return 0;
        }
        case JobState::Failed:
            std::cerr << "Job failed: " << job.id << std::endl;
            std::cerr << assembler.notice(job) << std::endl;
            return 1;
        case JobState::Cancelled:
            std::cerr << "Job cancelled: " << job.id << std::endl;
            return 1;
        default:
            std::cerr << "Job not ready: " << job.id << " (state: " << toString(job.state)
                      << ", attempts: " << job.attempts << ")" << std::endl;
            return 2;
    }
}

}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    if (std::getenv("VOXA_LOG_LEVEL")) {
        Logger::initFromEnv();
    } else {
        Logger::setLevel(LogLevel::WARN);
    }

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string workspace = argv[1];
    std::string jobId = argc > 2 ? argv[2] : "";

    // Check piped input for a job id if not provided
    if (jobId.empty() && !isatty(fileno(stdin))) {
        std::cin >> jobId;
    }

    try {
        JobStore store(workspace);

        if (!jobId.empty()) {
            auto job = store.get(jobId);
            if (!job) {
                std::cerr << "Job not found: " << jobId << std::endl;
                return 1;
            }
            return showJob(*job);
        }

        auto counts = store.counts();
        for (auto state : kAllStates) {
            std::cout << toString(state) << "\t" << counts[state] << "\n";
        }

        auto latest = latestJob(store);
        if (!latest) {
            std::cout << "No jobs found" << std::endl;
            return 0;
        }
        std::cout << "latest\t" << latest->id << " (" << toString(latest->state) << ", owner "
                  << latest->owner << ")" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
