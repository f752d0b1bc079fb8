#include "errors.hpp"

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest: return "InvalidRequest";
        case ErrorKind::EmptyInput: return "EmptyInput";
        case ErrorKind::UnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::UnsupportedLanguage: return "UnsupportedLanguage";
        case ErrorKind::CorruptAudio: return "CorruptAudio";
        case ErrorKind::PayloadTooLarge: return "PayloadTooLarge";
        case ErrorKind::ServerBusy: return "ServerBusy";
        case ErrorKind::NotReady: return "NotReady";
        case ErrorKind::InferenceTimeout: return "InferenceTimeout";
        case ErrorKind::InferenceError: return "InferenceError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "InferenceError";
}

int http_status(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRequest:
        case ErrorKind::EmptyInput:
        case ErrorKind::UnsupportedFormat:
        case ErrorKind::UnsupportedLanguage:
            return 400;
        case ErrorKind::CorruptAudio: return 422;
        case ErrorKind::PayloadTooLarge: return 413;
        case ErrorKind::ServerBusy:
        case ErrorKind::NotReady:
            return 503;
        case ErrorKind::InferenceTimeout: return 504;
        case ErrorKind::InferenceError: return 500;
        case ErrorKind::Cancelled: return 499;
    }
    return 500;
}
