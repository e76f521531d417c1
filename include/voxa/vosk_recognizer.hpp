/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "voxa/recognizer.hpp"

struct VoskModel;
struct VoskRecognizer;

namespace voxa {

// Converts one Vosk result document into a segment. `final` selects between
// the "text"/"result" form and the {"partial": ...} form. Word times are
// seconds relative to the session start and get shifted by `baseMs`.
// nullopt when the document carries no text.
[[nodiscard]] std::optional<Segment> parseVoskResult(const std::string& json, std::int64_t baseMs, bool final);

class VoskEngine final : public Recognizer {
public:
    // Throws std::runtime_error when the model or recognizer cannot be created.
    VoskEngine(const std::string& modelPath, int sampleRate, std::size_t maxChunkSamples);
    ~VoskEngine() override;

    VoskEngine(const VoskEngine&) = delete;
    VoskEngine& operator=(const VoskEngine&) = delete;
    VoskEngine(VoskEngine&&) = delete;
    VoskEngine& operator=(VoskEngine&&) = delete;

    [[nodiscard]] bool begin(std::int64_t offsetMs) override;
    [[nodiscard]] EngineResult feed(const PcmChunk& chunk) override;
    [[nodiscard]] EngineResult finish() override;
    [[nodiscard]] int sampleRate() const noexcept override { return sampleRate_; }

    // Drops the shared model once no engine references it.
    static void releaseModel() noexcept;

private:
    // One model per process, shared by every slot; recognizers are per slot.
    static std::shared_ptr<VoskModel> shared_model_;
    static std::string current_model_path_;
    static std::mutex model_mutex_;

    std::shared_ptr<VoskModel> model_;
    VoskRecognizer* recognizer_ = nullptr;
    int sampleRate_;
    std::size_t maxChunkSamples_;
    std::int64_t baseMs_ = 0;
    bool pending_ = false;  // audio fed since the last final result
};

// Factory for Server: one VoskEngine per slot, all on the same model.
[[nodiscard]] RecognizerFactory voskFactory(const std::string& modelPath, int sampleRate, std::size_t maxChunkSamples);

}
