#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace voxa {

// Job lifecycle states. Completed, Failed and Cancelled are terminal.
enum class JobState : std::uint8_t {
    Received,
    Queued,
    Converting,
    Transcribing,
    Completed,
    Failed,
    Cancelled
};

// Stage-level failures, classified by RetryPolicy.
enum class ErrorKind : std::uint8_t {
    None,
    SourceUnavailable,
    UnsupportedFormat,
    Truncated,
    TooLong,
    ConversionFailed,
    ChunkRejected,
    EngineFault,
    Internal
};

// Opaque job identifier (timestamp_pid_counter, sortable by creation time).
using JobId = std::string;

[[nodiscard]] const char* toString(JobState state) noexcept;
[[nodiscard]] const char* toString(ErrorKind kind) noexcept;
[[nodiscard]] std::optional<JobState> parseJobState(const std::string& value) noexcept;
[[nodiscard]] std::optional<ErrorKind> parseErrorKind(const std::string& value) noexcept;

[[nodiscard]] inline bool isTerminal(JobState state) noexcept {
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

[[nodiscard]] inline bool isActive(JobState state) noexcept {
    return state == JobState::Converting || state == JobState::Transcribing;
}

} // namespace voxa
