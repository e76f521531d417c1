/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <cstdlib>

#include <gtest/gtest.h>

#include "voxa/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Quiet unless VOXA_LOG_LEVEL asks for more.
    if (std::getenv("VOXA_LOG_LEVEL")) {
        voxa::Logger::initFromEnv();
    } else {
        voxa::Logger::setLevel(voxa::LogLevel::ERROR);
    }
    return RUN_ALL_TESTS();
}
