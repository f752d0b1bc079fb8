#pragma once

#include <string>
#include <string_view>

// Every way a transcription request can fail. The names are part of the
// wire contract (the "errorKind" field), so keep to_string() stable.
enum class ErrorKind {
    InvalidRequest,
    EmptyInput,
    UnsupportedFormat,
    UnsupportedLanguage,
    CorruptAudio,
    PayloadTooLarge,
    ServerBusy,
    NotReady,
    InferenceTimeout,
    InferenceError,
    Cancelled,
};

struct TranscribeError {
    ErrorKind kind;
    std::string message;
};

std::string_view to_string(ErrorKind kind);

// HTTP status used when the error is reported to a client.
int http_status(ErrorKind kind);
