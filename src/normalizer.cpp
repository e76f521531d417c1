/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/normalizer.hpp"
#include "voxa/logger.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <pthread.h>
#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace voxa {

namespace {

constexpr std::size_t kFeedBlock = 64 * 1024;
constexpr std::size_t kStderrTail = 1024;

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool writeAll(int fd, const char* data, std::size_t len) noexcept {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    auto nl = s.rfind('\n');
    return nl == std::string::npos ? s : s.substr(nl + 1);
}

class TranscoderStream final : public PcmStream {
public:
    TranscoderStream(pid_t pid, int stdinFd, int stdoutFd, int stderrFd,
                     std::unique_ptr<std::istream> source, const TranscoderOptions& options)
        : pid_(pid), stdoutFd_(stdoutFd), source_(std::move(source)),
          sampleRate_(options.sampleRate), chunkBytes_(options.chunkSamples * 2),
          maxSamples_(options.maxAudioMs * options.sampleRate / 1000) {
        pending_.reserve(chunkBytes_ + kFeedBlock);
        feeder_ = std::thread([this, stdinFd]() { feed(stdinFd); });
        drainer_ = std::thread([this, stderrFd]() { drain(stderrFd); });
    }

    ~TranscoderStream() override { close(); }

    TranscoderStream(const TranscoderStream&) = delete;
    TranscoderStream& operator=(const TranscoderStream&) = delete;

    ReadResult next(PcmChunk& chunk) override {
        if (finished_) {
            return failure_.status == ReadStatus::Error ? failure_ : ReadResult{ReadStatus::End, ErrorKind::None, ""};
        }

        while (!eof_ && pending_.size() < chunkBytes_) {
            char buf[kFeedBlock];
            ssize_t n = ::read(stdoutFd_, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                return fail(ErrorKind::ConversionFailed, std::string("read from transcoder failed: ") + std::strerror(errno));
            }
            if (n == 0) {
                eof_ = true;
                break;
            }
            pending_.insert(pending_.end(), buf, buf + n);
        }

        if (pending_.size() >= chunkBytes_) {
            return emit(chunk, chunkBytes_);
        }

        // End of output: the exit status decides whether the tail is trustworthy.
        int status = reap();
        if (!(WIFEXITED(status) && WEXITSTATUS(status) == 0)) {
            std::string detail = stderrTail();
            return fail(ErrorKind::UnsupportedFormat,
                        "transcoder rejected input" + (detail.empty() ? std::string() : ": " + detail));
        }
        if (sourceFailed_) {
            return fail(ErrorKind::ConversionFailed, "error while reading source");
        }
        if (pending_.size() % 2 != 0) {
            return fail(ErrorKind::Truncated, "decoded audio ends mid-sample");
        }
        if (pending_.empty()) {
            finished_ = true;
            return ReadResult{ReadStatus::End, ErrorKind::None, ""};
        }
        ReadResult result = emit(chunk, pending_.size());
        if (result.status == ReadStatus::Chunk) {
            finished_ = true;
        }
        return result;
    }

    void close() noexcept override {
        if (pid_ > 0 && !reaped_) {
            // The whole group, so helpers spawned by a wrapper script die too.
            ::kill(-pid_, SIGKILL);
        }
        closeFd(stdoutFd_);
        if (feeder_.joinable()) feeder_.join();
        if (drainer_.joinable()) drainer_.join();
        if (pid_ > 0 && !reaped_) {
            int status = 0;
            while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
            reaped_ = true;
        }
        finished_ = true;
    }

private:
    pid_t pid_;
    int stdoutFd_;
    std::unique_ptr<std::istream> source_;
    int sampleRate_;
    std::size_t chunkBytes_;
    std::int64_t maxSamples_;

    std::thread feeder_;
    std::thread drainer_;
    std::atomic<bool> sourceFailed_{false};

    mutable std::mutex stderrMutex_;
    std::string stderr_;

    std::vector<char> pending_;
    std::int64_t samplesOut_ = 0;
    bool eof_ = false;
    bool finished_ = false;
    bool reaped_ = false;
    ReadResult failure_;

    ReadResult emit(PcmChunk& chunk, std::size_t bytes) {
        std::size_t count = bytes / 2;
        if (samplesOut_ + static_cast<std::int64_t>(count) > maxSamples_) {
            return fail(ErrorKind::TooLong, "audio exceeds " + std::to_string(maxSamples_ * 1000 / sampleRate_) + " ms");
        }

        chunk.samples.resize(count);
        for (std::size_t i = 0; i < count; ++i) {
            auto lo = static_cast<uint8_t>(pending_[2 * i]);
            auto hi = static_cast<uint8_t>(pending_[2 * i + 1]);
            chunk.samples[i] = static_cast<int16_t>(static_cast<uint16_t>(lo | (hi << 8)));
        }
        chunk.sampleRate = sampleRate_;
        chunk.offsetMs = samplesOut_ * 1000 / sampleRate_;
        samplesOut_ += static_cast<std::int64_t>(count);

        pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(bytes));
        return ReadResult{ReadStatus::Chunk, ErrorKind::None, ""};
    }

    ReadResult fail(ErrorKind kind, const std::string& message) {
        LOG_DEBUG("Transcoder stream failed (" + std::string(toString(kind)) + "): " + message);
        close();
        failure_ = ReadResult{ReadStatus::Error, kind, message};
        return failure_;
    }

    int reap() noexcept {
        if (feeder_.joinable()) feeder_.join();
        if (drainer_.joinable()) drainer_.join();
        int status = 0;
        if (!reaped_) {
            while (::waitpid(pid_, &status, 0) < 0) {
                if (errno != EINTR) {
                    status = -1;
                    break;
                }
            }
            reaped_ = true;
        }
        return status;
    }

    void feed(int fd) noexcept {
        ThreadNameScope name("Transcoder");

        // A transcoder that exits early must surface as EPIPE, not kill the process.
        sigset_t mask;
        sigemptyset(&mask);
        sigaddset(&mask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &mask, nullptr);

        try {
            char buf[kFeedBlock];
            while (*source_) {
                source_->read(buf, sizeof(buf));
                std::streamsize got = source_->gcount();
                if (got > 0 && !writeAll(fd, buf, static_cast<std::size_t>(got))) {
                    LOG_TRACE(std::string("Transcoder stopped reading input: ") + std::strerror(errno));
                    break;
                }
            }
            if (source_->bad()) {
                sourceFailed_ = true;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Feeding transcoder failed: " + std::string(e.what()));
            sourceFailed_ = true;
        }
        ::close(fd);
    }

    void drain(int fd) noexcept {
        char buf[512];
        for (;;) {
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) break;
            std::lock_guard<std::mutex> lock(stderrMutex_);
            stderr_.append(buf, static_cast<std::size_t>(n));
            if (stderr_.size() > kStderrTail * 2) {
                stderr_.erase(0, stderr_.size() - kStderrTail);
            }
        }
        ::close(fd);
    }

    std::string stderrTail() const {
        std::lock_guard<std::mutex> lock(stderrMutex_);
        return trimmed(stderr_);
    }
};

}

TranscoderNormalizer::TranscoderNormalizer(TranscoderOptions options) : options_(std::move(options)) {
    if (options_.chunkSamples == 0) {
        options_.chunkSamples = static_cast<std::size_t>(options_.sampleRate);
    }
}

OpenResult TranscoderNormalizer::open(std::unique_ptr<std::istream> source) {
    OpenResult result;
    if (!source) {
        result.error = ErrorKind::SourceUnavailable;
        result.message = "no source stream";
        return result;
    }
    if (options_.argv.empty()) {
        result.error = ErrorKind::ConversionFailed;
        result.message = "transcoder command is empty";
        return result;
    }

    int in[2] = {-1, -1};
    int out[2] = {-1, -1};
    int err[2] = {-1, -1};
    if (::pipe2(in, O_CLOEXEC) != 0 || ::pipe2(out, O_CLOEXEC) != 0 || ::pipe2(err, O_CLOEXEC) != 0) {
        result.error = ErrorKind::ConversionFailed;
        result.message = std::string("pipe failed: ") + std::strerror(errno);
        for (int* fd : {&in[0], &in[1], &out[0], &out[1], &err[0], &err[1]}) closeFd(*fd);
        LOG_ERROR("Cannot start transcoder: " + result.message);
        return result;
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err[1], STDERR_FILENO);

    std::vector<char*> argv;
    argv.reserve(options_.argv.size() + 1);
    for (auto& arg : options_.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    pid_t pid = -1;
    int rc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);
    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    closeFd(in[0]);
    closeFd(out[1]);
    closeFd(err[1]);

    if (rc != 0) {
        closeFd(in[1]);
        closeFd(out[0]);
        closeFd(err[0]);
        result.error = ErrorKind::ConversionFailed;
        result.message = "cannot run " + options_.argv[0] + ": " + std::strerror(rc);
        LOG_ERROR("Cannot start transcoder: " + result.message);
        return result;
    }

    LOG_TRACE("Spawned transcoder " + options_.argv[0] + " (pid " + std::to_string(pid) + ")");
    result.stream = std::make_unique<TranscoderStream>(pid, in[1], out[0], err[0], std::move(source), options_);
    return result;
}

}
