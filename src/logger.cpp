/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <unordered_map>

namespace voxa {

namespace {

struct LogState {
    std::mutex mutex;
    LogLevel level = LogLevel::INFO;
    bool levelInitialized = false;
    std::unordered_map<std::thread::id, std::string> threadNames;
    std::ofstream file;
};

LogState& state() {
    static LogState s;
    return s;
}

std::string timestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&time_t, &local);

    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

// Caller holds the state mutex.
std::string currentThreadLabel(LogState& s) {
    auto tid = std::this_thread::get_id();
    auto it = s.threadNames.find(tid);
    if (it != s.threadNames.end()) {
        return it->second;
    }
    std::ostringstream oss;
    oss << "T" << tid;
    return oss.str();
}

}

void Logger::setLevel(LogLevel level) noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
    s.levelInitialized = true;
}

void Logger::initFromEnv() noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = parseEnvLevel();
    s.levelInitialized = true;
}

LogLevel Logger::level() noexcept {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.levelInitialized) {
        s.level = parseEnvLevel();
        s.levelInitialized = true;
    }
    return s.level;
}

bool Logger::enabled(LogLevel level) noexcept {
    return static_cast<uint8_t>(level) <= static_cast<uint8_t>(Logger::level());
}

bool Logger::setFile(const std::string& path) noexcept {
    try {
        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (s.file.is_open()) {
            s.file.close();
        }
        if (path.empty()) {
            return true;
        }
        s.file.open(path, std::ios::app);
        return s.file.is_open();
    } catch (...) {
        return false;
    }
}

void Logger::log(LogLevel level, const std::string& message) noexcept {
    try {
        if (!enabled(level)) {
            return;
        }

        auto& s = state();
        std::string stamp = timestampNow();

        std::lock_guard<std::mutex> lock(s.mutex);
        std::string line = "[" + stamp + "] [" + levelToString(level) + "] [" +
                           currentThreadLabel(s) + "] " + message;

        // stdout belongs to deliveries and tool output
        std::cerr << line << std::endl;
        if (s.file.is_open()) {
            s.file << line << '\n';
            s.file.flush();
        }
    } catch (...) {
        // Never throw from logging
    }
}

LogLevel Logger::parseEnvLevel() noexcept {
    const char* env_val = std::getenv("VOXA_LOG_LEVEL");
    if (!env_val) return LogLevel::INFO;

    std::string level_str(env_val);
    for (char& c : level_str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (level_str == "error") return LogLevel::ERROR;
    if (level_str == "warn" || level_str == "warning") return LogLevel::WARN;
    if (level_str == "info") return LogLevel::INFO;
    if (level_str == "debug") return LogLevel::DEBUG;
    if (level_str == "trace") return LogLevel::TRACE;

    return LogLevel::INFO;
}

const char* Logger::levelToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::TRACE: return "TRACE";
        default: return "UNKN ";
    }
}

void setThreadName(const std::string& name) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames[std::this_thread::get_id()] = name;
}

void clearThreadName() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.threadNames.erase(std::this_thread::get_id());
}

std::string getThreadName(int worker_id) {
    return "Worker-" + std::to_string(worker_id);
}

std::string jobTag(const std::string& jobId) {
    return "job " + jobId + ": ";
}

}
