/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "voxa/job.hpp"

namespace voxa {

// Outbound side of the chat client. Messages for one job are sent in order
// and must not be reordered by the implementation.
class Delivery {
public:
    virtual ~Delivery() = default;
    [[nodiscard]] virtual bool send(const std::string& owner, const JobId& id, const std::string& text) = 0;
};

// Turns a terminal job into the messages its owner receives.
class Assembler {
public:
    Assembler(std::size_t messageLimit, bool numberParts) noexcept
        : limit_(messageLimit), numberParts_(numberParts) {}

    // Final segments in offset order, joined by single spaces.
    [[nodiscard]] std::string transcript(const std::vector<Segment>& segments) const;

    // Transcript split into messages of at most messageLimit bytes. Breaks
    // fall between segments; a segment that does not fit a whole message is
    // broken between words; only a word longer than a message is cut.
    [[nodiscard]] std::vector<std::string> split(const std::vector<Segment>& segments) const;

    // Failure, cancellation or empty-result text.
    [[nodiscard]] std::string notice(const Job& job) const;

    [[nodiscard]] std::vector<std::string> messages(const Job& job) const;

    // Sends messages(job) in order; false at the first refused message.
    bool deliver(const Job& job, Delivery& delivery) const noexcept;

    [[nodiscard]] static const char* describe(ErrorKind kind) noexcept;

private:
    std::size_t limit_;
    bool numberParts_;

    [[nodiscard]] std::vector<std::string> units(const std::vector<Segment>& segments, std::size_t width) const;
    [[nodiscard]] static std::vector<std::string> pack(const std::vector<std::string>& units, std::size_t width);
};

}
