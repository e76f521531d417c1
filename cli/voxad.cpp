/*
 * voxa - Transcription daemon (voxad)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/server.hpp"
#include "voxa/vosk_recognizer.hpp"
#include "voxa/logger.hpp"
#include <iostream>
#include <fstream>
#include <chrono>
#include <csignal>
#include <cerrno>
#include <filesystem>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <unistd.h>

using namespace voxa;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

namespace {

std::mutex g_output_mutex;

void emit(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << line << "\n" << std::flush;
}

// Deliveries go to stdout, one line per message.
class ConsoleDelivery final : public Delivery {
public:
    bool send(const std::string& owner, const JobId& id, const std::string& text) override {
        emit("deliver " + id + " " + owner + " " + text);
        return static_cast<bool>(std::cout);
    }
};

std::optional<pid_t> readPidFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    long pid = 0;
    file >> pid;
    if (pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

void printUsage(const char* progName) {
    std::cout << "voxa transcription daemon " << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <model> <workspace> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -s, --slots <n>      Recognizer slots (VOXA_SLOTS)\n";
    std::cout << "  -w, --workers <n>    Worker threads, defaults to slots (VOXA_WORKERS)\n";
    std::cout << "  -q, --queue <n>      Maximum waiting jobs (VOXA_MAX_QUEUE)\n";
    std::cout << "  -l, --log-file <p>   Also append log lines to a file\n\n";
    std::cout << "Commands on stdin, one per line:\n";
    std::cout << "  submit <owner> <path>   queue a recording\n";
    std::cout << "  cancel <job-id>         cancel a job\n";
    std::cout << "  status <job-id>         show a job\n";
    std::cout << "  stats [owner]           show counts, or one owner's usage\n";
    std::cout << "  quit                    stop the daemon\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  VOXA_LOG_LEVEL     Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  VOSK_LOG_LEVEL     Recognizer library verbosity (-1 quiet)\n";
    std::cout << "  VOXA_TRANSCODER    Transcoder command, {rate} is the sample rate\n";
}

bool parseCount(const char* text, int& out) {
    try {
        out = std::stoi(text);
        return out > 0;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns false when the daemon should stop.
bool handleCommand(Server& server, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;
    if (cmd.empty()) {
        return true;
    }

    if (cmd == "quit" || cmd == "exit") {
        return false;
    }

    if (cmd == "submit") {
        std::string owner;
        in >> owner;
        std::string path;
        std::getline(in >> std::ws, path);
        auto result = server.submit(owner, path);
        if (result) {
            emit("ok " + result.id);
        } else {
            emit(std::string("error ") + toString(result.error) + " " + result.message);
        }
        return true;
    }

    if (cmd == "cancel") {
        std::string id;
        in >> id;
        emit(std::string("cancel ") + id + " " + toString(server.cancel(id)));
        return true;
    }

    if (cmd == "status") {
        std::string id;
        in >> id;
        auto job = server.job(id);
        if (!job) {
            emit("status " + id + " missing");
            return true;
        }
        std::string line = "status " + id + " " + toString(job->state) +
                           " attempts=" + std::to_string(job->attempts) +
                           " segments=" + std::to_string(job->segments.size());
        if (job->errorKind != ErrorKind::None) {
            line += std::string(" error=") + toString(job->errorKind);
        }
        emit(line);
        return true;
    }

    if (cmd == "stats") {
        std::string owner;
        in >> owner;
        if (!owner.empty()) {
            auto usage = server.usage(owner);
            emit("usage " + owner + " requests=" + std::to_string(usage.requests) +
                 " bytes=" + std::to_string(usage.bytes) + " audio_ms=" + std::to_string(usage.audioMs));
            return true;
        }

        auto stats = server.stats();
        std::string line = "stats";
        for (auto state : {JobState::Received, JobState::Queued, JobState::Converting, JobState::Transcribing,
                           JobState::Completed, JobState::Failed, JobState::Cancelled}) {
            line += std::string(" ") + toString(state) + "=" + std::to_string(stats.states[state]);
        }
        line += " depth=" + std::to_string(stats.queueDepth) + " active=" + std::to_string(stats.active) +
                "/" + std::to_string(stats.slots);
        emit(line);

        auto usage = server.usage();
        emit("usage owners=" + std::to_string(usage.owners) + " requests=" + std::to_string(usage.requests) +
             " bytes=" + std::to_string(usage.bytes) + " audio_ms=" + std::to_string(usage.audioMs));
        return true;
    }

    emit("error unknown_command " + cmd);
    return true;
}

}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    Logger::initFromEnv();
    setThreadName("Main");

    Config config = Config::fromEnv();
    config.modelPath = argv[1];
    config.workspace = argv[2];
    std::string logFile;

    for (int i = 3; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;
        if ((arg == "-s" || arg == "--slots") && hasValue) {
            if (!parseCount(argv[++i], config.slots)) {
                std::cerr << "Error: Invalid slot count\n";
                return 1;
            }
        } else if ((arg == "-w" || arg == "--workers") && hasValue) {
            if (!parseCount(argv[++i], config.workers)) {
                std::cerr << "Error: Invalid worker count\n";
                return 1;
            }
        } else if ((arg == "-q" || arg == "--queue") && hasValue) {
            int depth = 0;
            if (!parseCount(argv[++i], depth)) {
                std::cerr << "Error: Invalid queue depth\n";
                return 1;
            }
            config.maxQueueDepth = static_cast<std::size_t>(depth);
        } else if ((arg == "-l" || arg == "--log-file") && hasValue) {
            logFile = argv[++i];
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n";
            return 1;
        }
    }

    if (!logFile.empty() && !Logger::setFile(logFile)) {
        std::cerr << "Error: Cannot open log file: " << logFile << "\n";
        return 1;
    }

    if (!std::filesystem::exists(std::filesystem::path(config.modelPath))) {
        std::cerr << "Error: Model not found: " << config.modelPath << "\n";
        return 1;
    }

    std::filesystem::path pidPath = config.workspace / ".voxad.pid";
    if (auto pid = readPidFile(pidPath); pid && isProcessAlive(*pid) && *pid != getpid()) {
        std::cerr << "Error: voxad already running on " << config.workspace.string()
                  << " (pid " << *pid << ")\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    // A closed stdout must not kill the daemon mid-job.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        auto factory = voskFactory(config.modelPath, config.sampleRate, config.chunkSamples());
        Server server(config, factory, std::make_shared<ConsoleDelivery>());

        if (!server.start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        {
            std::ofstream pf(pidPath);
            if (pf) {
                pf << getpid();
            } else {
                LOG_WARN("Cannot write pid file: " + pidPath.string());
            }
        }

        LOG_INFO("voxad " + std::string(VERSION) + " running, workspace " + config.workspace.string());

        bool inputOpen = true;
        bool quit = false;
        std::string buffer;
        while (!g_shutdown_requested && !quit && server.isRunning()) {
            if (!inputOpen) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                continue;
            }

            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            int ready = ::poll(&pfd, 1, 100);
            if (ready < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("poll on stdin failed, commands disabled");
                inputOpen = false;
                continue;
            }
            if (ready == 0) {
                continue;
            }

            char chunk[4096];
            ssize_t n = ::read(STDIN_FILENO, chunk, sizeof(chunk));
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                LOG_DEBUG("stdin closed, commands disabled");
                inputOpen = false;
                continue;
            }
            buffer.append(chunk, static_cast<std::size_t>(n));

            std::size_t nl;
            while (!quit && (nl = buffer.find('\n')) != std::string::npos) {
                std::string line = buffer.substr(0, nl);
                buffer.erase(0, nl + 1);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                quit = !handleCommand(server, line);
            }
        }

        LOG_DEBUG("Shutdown requested, stopping server...");
        {
            std::error_code ec;
            std::filesystem::remove(pidPath, ec);
        }
        server.shutdown();
        // The model is freed once the last slot's recognizer goes with the server.
        VoskEngine::releaseModel();

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
