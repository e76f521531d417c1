/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/cache.hpp"
#include "voxa/logger.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace voxa {

namespace {

using json = nlohmann::json;

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr const char* kSuffix = ".json";

std::int64_t toMillis(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

bool validKey(const std::string& key) {
    return !key.empty() && std::all_of(key.begin(), key.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || c == '-';
    });
}

struct Entry {
    std::filesystem::path path;
    std::int64_t createdMs = 0;
    std::uintmax_t bytes = 0;
};

}

ResultCache::ResultCache(std::filesystem::path dir, std::string engineTag,
                         std::chrono::hours ttl, std::uintmax_t maxBytes)
    : dir_(std::move(dir)), engineTag_(std::move(engineTag)), ttl_(ttl), maxBytes_(maxBytes) {
    LOG_DEBUG("Result cache at " + dir_.string() + ", ttl " + std::to_string(ttl_.count()) + "h");
}

std::optional<std::string> ResultCache::key(std::istream& in) {
    std::uint64_t hash = kFnvOffset;
    std::uint64_t length = 0;
    char buf[64 * 1024];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize got = in.gcount();
        for (std::streamsize i = 0; i < got; ++i) {
            hash ^= static_cast<unsigned char>(buf[i]);
            hash *= kFnvPrime;
        }
        length += static_cast<std::uint64_t>(got);
    }
    if (in.bad()) {
        return std::nullopt;
    }

    std::ostringstream out;
    out << std::hex << std::setw(16) << std::setfill('0') << hash << '-' << length;
    return out.str();
}

std::optional<CachedResult> ResultCache::get(const std::string& key, Clock::time_point now) const noexcept {
    if (!validKey(key)) {
        return std::nullopt;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ifstream file(entryPath(key), std::ios::binary);
        if (!file) {
            return std::nullopt;
        }

        json j = json::parse(file, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            LOG_WARN("Ignoring corrupt cache entry " + key);
            return std::nullopt;
        }
        if (j.value("engine", std::string()) != engineTag_) {
            return std::nullopt;
        }
        auto created = j.value("created_at", std::int64_t{0});
        if (created < toMillis(now - ttl_)) {
            return std::nullopt;
        }

        CachedResult result;
        result.audioMs = j.value("audio_ms", std::int64_t{0});
        for (const auto& s : j.value("segments", json::array())) {
            Segment seg;
            seg.text = s.value("text", std::string());
            seg.startMs = s.value("start_ms", std::int64_t{-1});
            seg.endMs = s.value("end_ms", std::int64_t{-1});
            result.segments.push_back(std::move(seg));
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Cache read failed for " + key + ": " + e.what());
        return std::nullopt;
    }
}

bool ResultCache::put(const std::string& key, const CachedResult& result, Clock::time_point now) noexcept {
    if (!validKey(key)) {
        return false;
    }
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        std::filesystem::create_directories(dir_);

        json segments = json::array();
        for (const auto& seg : result.segments) {
            segments.push_back(json{{"text", seg.text}, {"start_ms", seg.startMs}, {"end_ms", seg.endMs}});
        }
        json j{
            {"engine", engineTag_},
            {"created_at", toMillis(now)},
            {"audio_ms", result.audioMs},
            {"segments", segments}
        };

        auto path = entryPath(key);
        auto temp = dir_ / (key + ".tmp");
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << j.dump();
            file.flush();
            if (!file.good()) return false;
        }
        std::error_code ec;
        std::filesystem::rename(temp, path, ec);
        if (ec) {
            LOG_ERROR("Cache write failed for " + key + ": " + ec.message());
            std::filesystem::remove(temp, ec);
            return false;
        }

        LOG_DEBUG("Cached transcript " + key);
        sweepLocked(now);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Cache write failed for " + key + ": " + e.what());
        return false;
    }
}

std::size_t ResultCache::sweep(Clock::time_point now) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        return sweepLocked(now);
    } catch (const std::exception& e) {
        LOG_ERROR("Cache sweep failed: " + std::string(e.what()));
        return 0;
    }
}

std::size_t ResultCache::sweepLocked(Clock::time_point now) {
    if (!std::filesystem::is_directory(dir_)) {
        return 0;
    }

    std::vector<Entry> entries;
    for (const auto& item : std::filesystem::directory_iterator(dir_)) {
        if (!item.is_regular_file() || item.path().extension() != kSuffix) {
            continue;
        }
        Entry entry;
        entry.path = item.path();
        entry.bytes = item.file_size();
        std::ifstream file(entry.path, std::ios::binary);
        json j = json::parse(file, nullptr, false);
        entry.createdMs = j.is_object() ? j.value("created_at", std::int64_t{0}) : 0;
        entries.push_back(std::move(entry));
    }
    std::sort(entries.begin(), entries.end(),
              [](const Entry& a, const Entry& b) { return a.createdMs < b.createdMs; });

    std::uintmax_t total = 0;
    for (const auto& entry : entries) {
        total += entry.bytes;
    }

    const std::int64_t cutoff = toMillis(now - ttl_);
    std::size_t removed = 0;
    for (const auto& entry : entries) {
        if (entry.createdMs >= cutoff && total <= maxBytes_) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::remove(entry.path, ec)) {
            total -= entry.bytes;
            ++removed;
        }
    }
    if (removed > 0) {
        LOG_DEBUG("Cache sweep removed " + std::to_string(removed) + " entr" + (removed == 1 ? "y" : "ies"));
    }
    return removed;
}

std::filesystem::path ResultCache::entryPath(const std::string& key) const {
    return dir_ / (key + kSuffix);
}

}
