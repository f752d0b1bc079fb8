#pragma once

#include "errors.hpp"
#include "transcription.hpp"

#include <expected>
#include <stop_token>
#include <string>

// The speech model. Implementations are not required to be thread-safe:
// JobQueue owns the single instance and calls it from one thread only.
class InferenceEngine {
public:
    virtual ~InferenceEngine() = default;

    // language is a tag such as "en", or kAutoLanguage. An empty transcript
    // is a successful result (no speech). The stop token is raised when the
    // caller has stopped waiting; honoring it is optional.
    virtual std::expected<TranscriptResult, TranscribeError>
        transcribe(const NormalizedAudio& audio, const std::string& language,
                   std::stop_token stop) = 0;

    virtual bool supports_language(const std::string& language) const = 0;

    virtual std::string model_name() const = 0;
};
