/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/source.hpp"
#include "voxa/logger.hpp"
#include <fstream>

namespace voxa {

std::unique_ptr<std::istream> FileSourceResolver::open(const std::string& sourceRef) const {
    auto path = resolve(sourceRef);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LOG_WARN("Source is not a regular file: " + path.string());
        return nullptr;
    }

    auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*file) {
        LOG_WARN("Failed to open source: " + path.string());
        return nullptr;
    }
    return file;
}

std::optional<std::uintmax_t> FileSourceResolver::size(const std::string& sourceRef) const {
    std::error_code ec;
    auto bytes = std::filesystem::file_size(resolve(sourceRef), ec);
    if (ec) {
        return std::nullopt;
    }
    return bytes;
}

std::filesystem::path FileSourceResolver::resolve(const std::string& sourceRef) const {
    std::filesystem::path path(sourceRef);
    if (path.is_relative() && !root_.empty()) {
        return root_ / path;
    }
    return path;
}

}
