/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "voxa/vosk_recognizer.hpp"
#include "voxa/logger.hpp"

#include <cstdlib>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <vosk_api.h>

namespace voxa {

std::shared_ptr<VoskModel> VoskEngine::shared_model_ = nullptr;
std::string VoskEngine::current_model_path_ = "";
std::mutex VoskEngine::model_mutex_;

namespace {

int voskLogLevel() {
    if (const char* v = std::getenv("VOSK_LOG_LEVEL")) {
        try {
            return std::stoi(v);
        } catch (const std::exception&) {
            LOG_WARN(std::string("VOSK_LOG_LEVEL=") + v + " is not a number");
        }
    }
    return -1;
}

std::int64_t toMs(double seconds) {
    return static_cast<std::int64_t>(seconds * 1000.0 + 0.5);
}

}

std::optional<Segment> parseVoskResult(const std::string& json, std::int64_t baseMs, bool final) {
    nlohmann::json doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        LOG_WARN("Unparseable recognizer output: " + json);
        return std::nullopt;
    }

    Segment seg;
    seg.final = final;
    seg.text = doc.value(final ? "text" : "partial", std::string());
    if (seg.text.empty()) {
        return std::nullopt;
    }

    const auto words = doc.find(final ? "result" : "partial_result");
    if (words != doc.end() && words->is_array() && !words->empty()) {
        const auto& first = words->front();
        const auto& last = words->back();
        if (first.contains("start")) seg.startMs = baseMs + toMs(first["start"].get<double>());
        if (last.contains("end")) seg.endMs = baseMs + toMs(last["end"].get<double>());
    }
    return seg;
}

VoskEngine::VoskEngine(const std::string& modelPath, int sampleRate, std::size_t maxChunkSamples)
    : sampleRate_(sampleRate), maxChunkSamples_(maxChunkSamples) {
    {
        std::lock_guard<std::mutex> lock(model_mutex_);
        if (!shared_model_ || current_model_path_ != modelPath) {
            vosk_set_log_level(voskLogLevel());
            LOG_INFO("Loading model: " + modelPath);
            VoskModel* model = vosk_model_new(modelPath.c_str());
            if (!model) {
                LOG_ERROR("Failed to load model: " + modelPath);
                throw std::runtime_error("Failed to load model: " + modelPath);
            }
            shared_model_ = std::shared_ptr<VoskModel>(model, vosk_model_free);
            current_model_path_ = modelPath;
            LOG_INFO("Model loaded successfully");
        }
        model_ = shared_model_;
    }

    recognizer_ = vosk_recognizer_new(model_.get(), static_cast<float>(sampleRate_));
    if (!recognizer_) {
        throw std::runtime_error("Failed to create recognizer at " + std::to_string(sampleRate_) + " Hz");
    }
    vosk_recognizer_set_words(recognizer_, 1);
}

VoskEngine::~VoskEngine() {
    if (recognizer_) {
        vosk_recognizer_free(recognizer_);
        recognizer_ = nullptr;
    }
}

void VoskEngine::releaseModel() noexcept {
    std::lock_guard<std::mutex> lock(model_mutex_);
    shared_model_.reset();
    current_model_path_.clear();
}

bool VoskEngine::begin(std::int64_t offsetMs) {
    // A reset recognizer keeps counting time from its first sample, so every
    // job starts on a fresh one.
    if (recognizer_) {
        vosk_recognizer_free(recognizer_);
    }
    recognizer_ = vosk_recognizer_new(model_.get(), static_cast<float>(sampleRate_));
    if (!recognizer_) {
        LOG_ERROR("Failed to recreate recognizer at " + std::to_string(sampleRate_) + " Hz");
        return false;
    }
    vosk_recognizer_set_words(recognizer_, 1);
    baseMs_ = offsetMs;
    pending_ = false;
    return true;
}

EngineResult VoskEngine::feed(const PcmChunk& chunk) {
    if (!recognizer_) {
        return EngineResult::failure(ErrorKind::Internal, "no recognizer");
    }
    if (chunk.samples.empty()) {
        return EngineResult::failure(ErrorKind::ChunkRejected, "empty chunk");
    }
    if (chunk.sampleRate != sampleRate_) {
        return EngineResult::failure(ErrorKind::ChunkRejected,
            "chunk at " + std::to_string(chunk.sampleRate) + " Hz, engine expects " + std::to_string(sampleRate_));
    }
    if (chunk.samples.size() > maxChunkSamples_) {
        return EngineResult::failure(ErrorKind::ChunkRejected,
            "chunk of " + std::to_string(chunk.samples.size()) + " samples exceeds the window");
    }

    int accepted = vosk_recognizer_accept_waveform_s(recognizer_, chunk.samples.data(),
                                                     static_cast<int>(chunk.samples.size()));
    if (accepted < 0) {
        return EngineResult::failure(ErrorKind::EngineFault, "recognizer failed on chunk at " +
                                     std::to_string(chunk.offsetMs) + " ms");
    }

    EngineResult result;
    if (accepted == 1) {
        pending_ = false;
        if (auto seg = parseVoskResult(vosk_recognizer_result(recognizer_), baseMs_, true)) {
            result.segments.push_back(std::move(*seg));
        }
    } else {
        pending_ = true;
        if (auto seg = parseVoskResult(vosk_recognizer_partial_result(recognizer_), baseMs_, false)) {
            result.segments.push_back(std::move(*seg));
        }
    }
    return result;
}

EngineResult VoskEngine::finish() {
    EngineResult result;
    if (!recognizer_) {
        return result;
    }
    if (pending_) {
        if (auto seg = parseVoskResult(vosk_recognizer_final_result(recognizer_), baseMs_, true)) {
            result.segments.push_back(std::move(*seg));
        }
    }
    pending_ = false;
    vosk_recognizer_reset(recognizer_);
    return result;
}

RecognizerFactory voskFactory(const std::string& modelPath, int sampleRate, std::size_t maxChunkSamples) {
    return [modelPath, sampleRate, maxChunkSamples](int slot) -> std::unique_ptr<Recognizer> {
        LOG_DEBUG("Creating recognizer for slot " + std::to_string(slot));
        return std::make_unique<VoskEngine>(modelPath, sampleRate, maxChunkSamples);
    };
}

}
