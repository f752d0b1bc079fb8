#pragma once

#include "audio_format.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Sentinel language hint: let the model detect the spoken language.
inline constexpr const char* kAutoLanguage = "auto";

// A validated /transcribe payload with the transport encoding removed.
struct TranscriptionRequest {
    std::string filename;
    std::vector<uint8_t> audio;
    AudioFormat format;
    std::string language;
};

// What the model consumes: 16 kHz mono float32 PCM.
struct NormalizedAudio {
    static constexpr uint32_t kSampleRate = 16000;
    static constexpr uint16_t kChannels = 1;

    std::vector<float> samples;
    double duration_s = 0.0;
};

struct TranscriptResult {
    std::string text;
    std::optional<std::string> language; // detected, when the model reports it
    double duration_s = 0.0;
    double processing_s = 0.0;
};
