/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "voxa/job.hpp"

namespace voxa {

struct CachedResult {
    std::vector<Segment> segments;
    std::int64_t audioMs = 0;
};

// Finished transcripts keyed by a digest of the source bytes, one JSON file
// per entry. An entry written by a different engine is a miss. Entries
// expire after `ttl`; past `maxBytes` the oldest are evicted.
class ResultCache final {
public:
    ResultCache(std::filesystem::path dir, std::string engineTag,
                std::chrono::hours ttl, std::uintmax_t maxBytes);

    ResultCache(const ResultCache&) = delete;
    ResultCache& operator=(const ResultCache&) = delete;

    // 64-bit FNV-1a of the content followed by its length. nullopt when the
    // stream fails before its end.
    [[nodiscard]] static std::optional<std::string> key(std::istream& in);

    [[nodiscard]] std::optional<CachedResult> get(const std::string& key,
                                                  Clock::time_point now = Clock::now()) const noexcept;
    bool put(const std::string& key, const CachedResult& result,
             Clock::time_point now = Clock::now()) noexcept;

    // Drops expired entries, then the oldest until under the size cap.
    // Returns how many entries were removed.
    std::size_t sweep(Clock::time_point now = Clock::now()) noexcept;

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }

private:
    std::filesystem::path dir_;
    std::string engineTag_;
    std::chrono::hours ttl_;
    std::uintmax_t maxBytes_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::filesystem::path entryPath(const std::string& key) const;
    std::size_t sweepLocked(Clock::time_point now);
};

}
