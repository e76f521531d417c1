/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <string>

#include "voxa/types.hpp"

namespace voxa {

// Error kind -> retryable table plus the per-stage attempt budget.
// EngineFault is pinned to fatal.
class RetryPolicy {
public:
    RetryPolicy() noexcept;

    void setRetryable(ErrorKind kind, bool retryable) noexcept;
    void setBudget(int attempts) noexcept { budget_ = attempts < 0 ? 0 : attempts; }

    // Replaces the table with a comma separated list of kind names
    // ("chunk_rejected,conversion_failed"). Unknown names are logged and skipped.
    void parse(const std::string& list) noexcept;

    [[nodiscard]] bool retryable(ErrorKind kind) const noexcept;
    [[nodiscard]] int budget() const noexcept { return budget_; }

    // True when a job that already used `attempts` retries may try again.
    [[nodiscard]] bool shouldRetry(ErrorKind kind, int attempts) const noexcept {
        return retryable(kind) && attempts < budget_;
    }

    [[nodiscard]] std::string describe() const;

private:
    std::array<bool, static_cast<std::size_t>(ErrorKind::Internal) + 1> table_{};
    int budget_ = 2;
};

}
