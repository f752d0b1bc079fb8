#include "audio_format.hpp"

#include <cctype>
#include <string>

std::optional<AudioFormat> parse_audio_format(std::string_view tag) {
    if (tag.starts_with('.')) tag.remove_prefix(1);

    std::string lower(tag);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (auto format : kSupportedFormats) {
        if (lower == to_string(format)) return format;
    }
    return std::nullopt;
}

std::string_view to_string(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Webm: return "webm";
        case AudioFormat::M4a: return "m4a";
        case AudioFormat::Flac: return "flac";
    }
    return "wav";
}
