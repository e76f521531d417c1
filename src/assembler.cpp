/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/assembler.hpp"
#include "voxa/logger.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

namespace voxa {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto start = s.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

// Final segment texts in offset order. Segments without timing sort with
// the last timed segment before them.
std::vector<std::string> orderedTexts(const std::vector<Segment>& segments) {
    std::vector<std::pair<std::int64_t, std::string>> keyed;
    std::int64_t last = 0;
    for (const auto& seg : segments) {
        if (!seg.final) continue;
        if (seg.startMs >= 0) last = seg.startMs;
        std::string text = trim(seg.text);
        if (!text.empty()) {
            keyed.emplace_back(last, std::move(text));
        }
    }
    std::stable_sort(keyed.begin(), keyed.end(),
        [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> texts;
    texts.reserve(keyed.size());
    for (auto& k : keyed) {
        texts.push_back(std::move(k.second));
    }
    return texts;
}

// Cuts an overlong word into pieces of at most `width` bytes without
// splitting a UTF-8 sequence.
void cutWord(const std::string& word, std::size_t width, std::vector<std::string>& out) {
    std::size_t pos = 0;
    while (pos < word.size()) {
        std::size_t len = std::min(width, word.size() - pos);
        if (pos + len < word.size()) {
            std::size_t back = len;
            while (back > 0 && (static_cast<unsigned char>(word[pos + back]) & 0xC0) == 0x80) {
                --back;
            }
            if (back > 0) len = back;
        }
        out.push_back(word.substr(pos, len));
        pos += len;
    }
}

std::size_t digits(std::size_t n) {
    std::size_t d = 1;
    while (n >= 10) {
        n /= 10;
        ++d;
    }
    return d;
}

}

std::string Assembler::transcript(const std::vector<Segment>& segments) const {
    std::string out;
    for (const auto& text : orderedTexts(segments)) {
        if (!out.empty()) out += ' ';
        out += text;
    }
    return out;
}

std::vector<std::string> Assembler::units(const std::vector<Segment>& segments, std::size_t width) const {
    std::vector<std::string> result;
    for (const auto& text : orderedTexts(segments)) {
        if (text.size() <= width) {
            result.push_back(text);
            continue;
        }
        std::istringstream words(text);
        std::string word;
        while (words >> word) {
            if (word.size() <= width) {
                result.push_back(word);
            } else {
                cutWord(word, width, result);
            }
        }
    }
    return result;
}

std::vector<std::string> Assembler::pack(const std::vector<std::string>& units, std::size_t width) {
    std::vector<std::string> parts;
    std::string current;
    for (const auto& unit : units) {
        if (!current.empty() && current.size() + 1 + unit.size() > width) {
            parts.push_back(std::move(current));
            current.clear();
        }
        if (!current.empty()) current += ' ';
        current += unit;
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

std::vector<std::string> Assembler::split(const std::vector<Segment>& segments) const {
    std::vector<std::string> parts = pack(units(segments, limit_), limit_);
    if (!numberParts_ || parts.size() <= 1) {
        return parts;
    }

    // "(i/n) " eats into every part, which can raise n; settle n first.
    std::size_t n = parts.size();
    for (;;) {
        std::size_t width = limit_ - (2 * digits(n) + 4);
        parts = pack(units(segments, width), width);
        if (digits(parts.size()) <= digits(n)) break;
        n = parts.size();
    }

    const std::string total = std::to_string(parts.size());
    for (std::size_t i = 0; i < parts.size(); ++i) {
        parts[i] = "(" + std::to_string(i + 1) + "/" + total + ") " + parts[i];
    }
    return parts;
}

const char* Assembler::describe(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SourceUnavailable: return "the audio could not be read";
        case ErrorKind::UnsupportedFormat: return "the audio format is not supported";
        case ErrorKind::Truncated: return "the audio file is incomplete";
        case ErrorKind::TooLong: return "the recording is too long";
        case ErrorKind::ConversionFailed: return "the audio could not be converted";
        case ErrorKind::ChunkRejected: return "part of the audio could not be recognized";
        case ErrorKind::EngineFault: return "the speech recognizer failed";
        case ErrorKind::None:
        case ErrorKind::Internal: break;
    }
    return "an internal error occurred";
}

std::string Assembler::notice(const Job& job) const {
    switch (job.state) {
        case JobState::Failed: {
            std::string text = std::string("Transcription failed: ") + describe(job.errorKind);
            if (!job.error.empty()) {
                text += " (" + job.error + ")";
            }
            if (text.size() > limit_) {
                std::vector<std::string> cut;
                cutWord(text, limit_, cut);
                text = cut.front();
            }
            return text;
        }
        case JobState::Cancelled:
            return "Transcription cancelled.";
        case JobState::Completed:
            return "No speech recognized.";
        default:
            return "";
    }
}

std::vector<std::string> Assembler::messages(const Job& job) const {
    if (job.state == JobState::Completed) {
        auto parts = split(job.segments);
        if (!parts.empty()) {
            return parts;
        }
    }
    std::string text = notice(job);
    if (text.empty()) {
        return {};
    }
    return {text};
}

bool Assembler::deliver(const Job& job, Delivery& delivery) const noexcept {
    try {
        auto out = messages(job);
        if (out.empty()) {
            LOG_WARN(jobTag(job.id) + "nothing to deliver in state " + toString(job.state));
            return false;
        }
        for (std::size_t i = 0; i < out.size(); ++i) {
            if (!delivery.send(job.owner, job.id, out[i])) {
                LOG_ERROR(jobTag(job.id) + "delivery refused message " + std::to_string(i + 1) +
                          " of " + std::to_string(out.size()));
                return false;
            }
        }
        LOG_DEBUG(jobTag(job.id) + "delivered " + std::to_string(out.size()) + " message(s)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR(jobTag(job.id) + "delivery failed: " + std::string(e.what()));
        return false;
    }
}

}
