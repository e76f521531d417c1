/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace voxa {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;
    [[nodiscard]] static bool enabled(LogLevel level) noexcept;

    // Mirror every line into an append-only file (daemon mode). Empty path closes it.
    static bool setFile(const std::string& path) noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context. Short-lived helper threads (transcoder
// feeders) must drop their name on exit or the table grows per job.
void setThreadName(const std::string& name);
void clearThreadName();
std::string getThreadName(int worker_id);

class ThreadNameScope {
public:
    explicit ThreadNameScope(const std::string& name) { setThreadName(name); }
    ~ThreadNameScope() { clearThreadName(); }

    ThreadNameScope(const ThreadNameScope&) = delete;
    ThreadNameScope& operator=(const ThreadNameScope&) = delete;
};

// "job <id>: " prefix used by every per-job log line
std::string jobTag(const std::string& jobId);

}

#define LOG_ERROR(msg) ::voxa::Logger::error(msg)
#define LOG_WARN(msg)  ::voxa::Logger::warn(msg)
#define LOG_INFO(msg)  ::voxa::Logger::info(msg)
#define LOG_DEBUG(msg) ::voxa::Logger::debug(msg)
#define LOG_TRACE(msg) ::voxa::Logger::trace(msg)
