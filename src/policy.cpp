/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/policy.hpp"
#include "voxa/logger.hpp"
#include <sstream>

namespace voxa {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

}

RetryPolicy::RetryPolicy() noexcept {
    table_[static_cast<std::size_t>(ErrorKind::ChunkRejected)] = true;
    table_[static_cast<std::size_t>(ErrorKind::ConversionFailed)] = true;
}

void RetryPolicy::setRetryable(ErrorKind kind, bool retryable) noexcept {
    if (kind == ErrorKind::EngineFault && retryable) {
        LOG_WARN("engine_fault is never retryable; ignoring");
        return;
    }
    if (kind == ErrorKind::None) {
        return;
    }
    table_[static_cast<std::size_t>(kind)] = retryable;
}

void RetryPolicy::parse(const std::string& list) noexcept {
    try {
        table_.fill(false);
        std::stringstream ss(list);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (item.empty()) continue;
            if (auto kind = parseErrorKind(item)) {
                setRetryable(*kind, true);
            } else {
                LOG_WARN("Unknown error kind in retry policy: " + item);
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to parse retry policy: " + std::string(e.what()));
    }
}

bool RetryPolicy::retryable(ErrorKind kind) const noexcept {
    if (kind == ErrorKind::EngineFault) {
        return false;
    }
    return table_[static_cast<std::size_t>(kind)];
}

std::string RetryPolicy::describe() const {
    std::string out;
    for (std::size_t i = 0; i < table_.size(); ++i) {
        if (!table_[i]) continue;
        if (!out.empty()) out += ",";
        out += toString(static_cast<ErrorKind>(i));
    }
    return (out.empty() ? std::string("none") : out) + " x" + std::to_string(budget_);
}

}
