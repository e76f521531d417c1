/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace voxa {

// Turns a job's opaque source_ref into a byte stream. The pipeline opens a
// source once per conversion attempt and never keeps its bytes.
class SourceResolver {
public:
    virtual ~SourceResolver() = default;

    // nullptr when the source cannot be opened.
    [[nodiscard]] virtual std::unique_ptr<std::istream> open(const std::string& sourceRef) const = 0;

    // Size in bytes when known up front; used for the submission size limit.
    [[nodiscard]] virtual std::optional<std::uintmax_t> size(const std::string& sourceRef) const = 0;
};

// source_ref is a file path, resolved against `root` when relative.
class FileSourceResolver final : public SourceResolver {
public:
    explicit FileSourceResolver(std::filesystem::path root = {}) : root_(std::move(root)) {}

    [[nodiscard]] std::unique_ptr<std::istream> open(const std::string& sourceRef) const override;
    [[nodiscard]] std::optional<std::uintmax_t> size(const std::string& sourceRef) const override;

private:
    std::filesystem::path root_;

    [[nodiscard]] std::filesystem::path resolve(const std::string& sourceRef) const;
};

}
