/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/config.hpp"
#include "voxa/logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

namespace voxa {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

int env_int(const char* name, int defv) {
    const char* v = env(name);
    if (!v) return defv;
    try {
        return std::stoi(v);
    } catch (const std::exception&) {
        LOG_WARN(std::string(name) + "=" + v + " is not a number, using " + std::to_string(defv));
        return defv;
    }
}

std::uintmax_t env_size(const char* name, std::uintmax_t defv) {
    const char* v = env(name);
    if (!v) return defv;
    try {
        auto parsed = static_cast<std::uintmax_t>(std::stoull(v));
        return parsed == 0 ? defv : parsed;
    } catch (const std::exception&) {
        LOG_WARN(std::string(name) + "=" + v + " is not a size, using " + std::to_string(defv));
        return defv;
    }
}

bool env_bool(const char* name, bool defv) {
    const char* v = env(name);
    if (!v) return defv;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    LOG_WARN(std::string(name) + "=" + v + " is not a boolean");
    return defv;
}

std::vector<std::string> splitWords(const std::string& value) {
    std::vector<std::string> words;
    std::istringstream ss(value);
    std::string word;
    while (ss >> word) {
        words.push_back(word);
    }
    return words;
}

}

std::vector<std::string> Config::defaultTranscoder() {
    return {"ffmpeg", "-hide_banner", "-nostdin", "-loglevel", "error",
            "-i", "pipe:0", "-vn", "-ac", "1", "-ar", "{rate}",
            "-acodec", "pcm_s16le", "-f", "s16le", "pipe:1"};
}

Config Config::fromEnv() {
    Config config;

    if (const char* v = env("VOXA_WORKSPACE")) config.workspace = v;
    if (const char* v = env("VOXA_MODEL")) config.modelPath = v;

    config.slots = env_int("VOXA_SLOTS", config.slots);
    config.workers = env_int("VOXA_WORKERS", config.workers);
    config.maxQueueDepth = static_cast<std::size_t>(env_size("VOXA_MAX_QUEUE", config.maxQueueDepth));

    if (const char* v = env("VOXA_OWNER_POLICY")) {
        std::string policy(v);
        if (policy == "queue") {
            config.ownerPolicy = OwnerPolicy::Queue;
        } else if (policy == "reject") {
            config.ownerPolicy = OwnerPolicy::Reject;
        } else {
            LOG_WARN("VOXA_OWNER_POLICY must be 'reject' or 'queue', got: " + policy);
        }
    }
    config.ownerExclusive = env_bool("VOXA_OWNER_EXCLUSIVE", config.ownerExclusive);

    config.retry.setBudget(env_int("VOXA_RETRY_ATTEMPTS", config.retry.budget()));
    if (const char* v = env("VOXA_RETRYABLE")) {
        config.retry.parse(v);
    }

    config.sampleRate = env_int("VOXA_SAMPLE_RATE", config.sampleRate);
    config.chunkMs = env_int("VOXA_CHUNK_MS", config.chunkMs);
    config.maxSourceBytes = env_size("VOXA_MAX_SOURCE_BYTES", config.maxSourceBytes);
    config.maxAudioSeconds = env_int("VOXA_MAX_AUDIO_SECONDS", config.maxAudioSeconds);
    if (const char* v = env("VOXA_TRANSCODER")) {
        auto argv = splitWords(v);
        if (!argv.empty()) config.transcoder = argv;
    }

    config.messageLimit = static_cast<std::size_t>(env_size("VOXA_MESSAGE_LIMIT", config.messageLimit));
    config.numberParts = env_bool("VOXA_NUMBER_PARTS", config.numberParts);

    config.retentionHours = env_int("VOXA_RETENTION_HOURS", config.retentionHours);
    config.sweepSeconds = env_int("VOXA_SWEEP_SECONDS", config.sweepSeconds);
    config.cacheTtlHours = env_int("VOXA_CACHE_TTL_HOURS", config.cacheTtlHours);
    config.cacheMaxBytes = env_size("VOXA_CACHE_MAX_BYTES", config.cacheMaxBytes);

    return config;
}

std::string Config::validate() const {
    if (slots < 1) return "slots must be at least 1";
    if (workers < 0) return "workers must not be negative";
    if (sampleRate < 1000) return "sample rate must be at least 1000 Hz";
    if (chunkMs < 100) return "chunk duration must be at least 100 ms";
    if (chunkSamples() == 0) return "chunk holds no samples";
    if (messageLimit < 16) return "message limit must be at least 16 characters";
    if (transcoder.empty()) return "transcoder command is empty";
    if (maxAudioSeconds < 1) return "maximum audio duration must be positive";
    if (retentionHours < 0) return "retention must not be negative";
    if (sweepSeconds < 1) return "sweep interval must be at least 1 second";
    if (cacheTtlHours < 0) return "cache TTL must not be negative";
    return "";
}

std::vector<std::string> Config::transcoderArgv() const {
    std::vector<std::string> argv = transcoder;
    const std::string placeholder = "{rate}";
    for (auto& arg : argv) {
        auto pos = arg.find(placeholder);
        if (pos != std::string::npos) {
            arg.replace(pos, placeholder.size(), std::to_string(sampleRate));
        }
    }
    return argv;
}

}
