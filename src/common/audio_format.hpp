#pragma once

#include <array>
#include <optional>
#include <string_view>

// Containers/codecs the service accepts. Anything else is rejected before
// the payload is even looked at.
enum class AudioFormat { Mp3, Wav, Webm, M4a, Flac };

inline constexpr std::array<AudioFormat, 5> kSupportedFormats = {
    AudioFormat::Mp3, AudioFormat::Wav, AudioFormat::Webm,
    AudioFormat::M4a, AudioFormat::Flac,
};

// Case-insensitive, tolerates a leading '.' so file extensions can be
// passed straight through.
std::optional<AudioFormat> parse_audio_format(std::string_view tag);

std::string_view to_string(AudioFormat format);
