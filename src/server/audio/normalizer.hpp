#pragma once

#include "errors.hpp"
#include "transcription.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

namespace audio {

// Decodes bytes in the declared container/codec and converts them to the
// model's PCM layout. Stateless: the same input always yields the same
// output. Fails with UnsupportedFormat (tag not accepted, checked first),
// EmptyInput (zero bytes) or CorruptAudio (nothing decodable).
std::expected<NormalizedAudio, TranscribeError>
    normalize(std::span<const uint8_t> bytes, std::string_view declared_format);

std::expected<NormalizedAudio, TranscribeError>
    normalize(std::span<const uint8_t> bytes, AudioFormat format);

// libavformat demuxer used for a format; resolved with av_find_input_format.
const char* demuxer_name(AudioFormat format);

// Lowers FFmpeg's own logging to errors unless verbose.
void set_decoder_verbose(bool verbose);

} // namespace audio
