#pragma once

#include "backend.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>

struct whisper_context;

// whisper.cpp model loaded in-process. Loading takes seconds and happens
// once per process; the instance is then handed to JobQueue.
class WhisperBackend : public InferenceEngine {
public:
    struct Options {
        std::string model_path;
        std::string model_name;
        int threads = 4;
        bool use_gpu = true;
        bool verbose = false;
    };

    static std::expected<std::unique_ptr<WhisperBackend>, std::string> load(Options options);

    ~WhisperBackend() override;

    WhisperBackend(const WhisperBackend&) = delete;
    WhisperBackend& operator=(const WhisperBackend&) = delete;

    std::expected<TranscriptResult, TranscribeError>
        transcribe(const NormalizedAudio& audio, const std::string& language,
                   std::stop_token stop) override;

    bool supports_language(const std::string& language) const override;

    std::string model_name() const override { return options_.model_name; }

    // Trims the joined segment text and maps transcripts made only of
    // non-speech markers ("[BLANK_AUDIO]", "[ Silence ]", "(music)") to "".
    static std::string clean_text(std::string_view raw);

private:
    WhisperBackend(Options options, whisper_context* ctx);

    Options options_;
    whisper_context* ctx_ = nullptr;
};
