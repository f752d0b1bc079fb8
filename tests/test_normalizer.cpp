#include <catch2/catch_message.hpp>
#include <catch2/catch_test_macros.hpp>

#include "audio/normalizer.hpp"
#include "encoded_fixture.hpp"
#include "wav_fixture.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace {

bool near(double a, double b, double tolerance) {
    return std::fabs(a - b) <= tolerance;
}

float peak(const std::vector<float>& samples) {
    float p = 0.0f;
    for (float s : samples) p = std::max(p, std::fabs(s));
    return p;
}

} // namespace

TEST_CASE("audio::normalize", "[normalizer]") {
    audio::set_decoder_verbose(false);

    SECTION("UnsupportedFormatRegardlessOfContent") {
        auto valid = wav::silent_clip(1.0);
        std::vector<uint8_t> garbage = {1, 2, 3, 4};
        std::vector<uint8_t> empty;

        for (const char* tag : {"ogg", "aac", "", "wave", "opus"}) {
            for (auto* bytes : {&valid, &garbage, &empty}) {
                auto out = audio::normalize(*bytes, tag);
                REQUIRE_FALSE(out.has_value());
                REQUIRE(out.error().kind == ErrorKind::UnsupportedFormat);
            }
        }
    }

    SECTION("EmptyPayload") {
        std::vector<uint8_t> empty;
        auto out = audio::normalize(empty, "wav");
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::EmptyInput);
    }

    SECTION("GarbageUnderDeclaredWav") {
        std::string text = "this is definitely not a RIFF file";
        std::vector<uint8_t> bytes(text.begin(), text.end());
        auto out = audio::normalize(bytes, "wav");
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::CorruptAudio);
    }

    SECTION("WavWithoutSamples") {
        std::vector<int16_t> none;
        auto bytes = wav::encode(none, 16000);
        auto out = audio::normalize(bytes, "wav");
        REQUIRE_FALSE(out.has_value());
        REQUIRE(out.error().kind == ErrorKind::CorruptAudio);
    }

    SECTION("SilentMono16k") {
        auto bytes = wav::silent_clip(2.0);
        auto out = audio::normalize(bytes, "wav");
        REQUIRE(out.has_value());
        REQUIRE(near(static_cast<double>(out->samples.size()), 32000, 160));
        REQUIRE(near(out->duration_s, 2.0, 0.01));
        REQUIRE(std::ranges::all_of(out->samples, [](float s) { return s == 0.0f; }));
    }

    SECTION("StereoResampledToMono16k") {
        auto pcm = wav::tone(1.0, 44100, 440.0, 2);
        auto bytes = wav::encode(pcm, 44100, 2);
        auto out = audio::normalize(bytes, AudioFormat::Wav);
        REQUIRE(out.has_value());
        REQUIRE(near(static_cast<double>(out->samples.size()), 16000, 160));
        REQUIRE(near(out->duration_s, 1.0, 0.01));

        REQUIRE(peak(out->samples) > 0.1f);
        REQUIRE(peak(out->samples) <= 1.0f);
    }

    SECTION("UpsampledFrom8k") {
        auto bytes = wav::encode(wav::tone(0.5, 8000, 300.0), 8000);
        auto out = audio::normalize(bytes, "wav");
        REQUIRE(out.has_value());
        REQUIRE(near(out->duration_s, 0.5, 0.01));
    }

    SECTION("TagIsCaseInsensitive") {
        auto bytes = wav::silent_clip(0.5);
        auto out = audio::normalize(bytes, ".WAV");
        REQUIRE(out.has_value());
    }

    SECTION("Deterministic") {
        auto bytes = wav::tone_clip(0.5, 22050);
        auto a = audio::normalize(bytes, "wav");
        auto b = audio::normalize(bytes, "wav");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(a->samples == b->samples);
    }

    SECTION("EveryFormatHasADemuxer") {
        for (AudioFormat format : kSupportedFormats) {
            INFO(to_string(format));
            REQUIRE(av_find_input_format(audio::demuxer_name(format)) != nullptr);
        }
    }

    SECTION("FlacTone") {
        auto bytes = encoded::tone("flac", {"flac"}, 1.5);
        REQUIRE_FALSE(bytes.empty());

        auto out = audio::normalize(bytes, "flac");
        REQUIRE(out.has_value());
        REQUIRE(near(out->duration_s, 1.5, 0.15));
        REQUIRE(peak(out->samples) > 0.1f);
    }

    SECTION("CompressedFormats") {
        struct Case {
            const char* tag;
            const char* muxer;
            std::vector<const char*> encoders;
        };
        const Case cases[] = {
            {"m4a", "mp4", {"aac", "libfdk_aac"}},
            {"mp3", "mp3", {"libmp3lame", "libshine"}},
            {"webm", "webm", {"libopus", "libvorbis", "opus", "vorbis"}},
        };

        for (const auto& c : cases) {
            INFO(c.tag);
            auto bytes = encoded::tone(c.muxer, c.encoders, 1.5);
            if (bytes.empty()) {
                WARN("no " << c.tag << " encoder in this FFmpeg build");
                continue;
            }

            auto out = audio::normalize(bytes, c.tag);
            REQUIRE(out.has_value());
            REQUIRE(near(out->duration_s, 1.5, 0.15));
            REQUIRE(peak(out->samples) > 0.1f);
        }
    }
}
