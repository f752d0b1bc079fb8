#include "normalizer.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/mem.h>
#include <libswresample/swresample.h>
}

namespace audio {

namespace {

constexpr int kIoBufferSize = 32 * 1024;

TranscribeError corrupt(std::string message) {
    return {ErrorKind::CorruptAudio, std::move(message)};
}

std::string av_error(int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

// Read cursor over the caller's buffer, fed to libavformat as custom I/O.
struct MemoryReader {
    std::span<const uint8_t> data;
    size_t pos = 0;

    static int read(void* opaque, uint8_t* buf, int buf_size) {
        auto* self = static_cast<MemoryReader*>(opaque);
        size_t remaining = self->data.size() - self->pos;
        if (remaining == 0) return AVERROR_EOF;
        size_t n = std::min(remaining, static_cast<size_t>(buf_size));
        std::memcpy(buf, self->data.data() + self->pos, n);
        self->pos += n;
        return static_cast<int>(n);
    }

    static int64_t seek(void* opaque, int64_t offset, int whence) {
        auto* self = static_cast<MemoryReader*>(opaque);
        auto size = static_cast<int64_t>(self->data.size());
        if (whence == AVSEEK_SIZE) return size;

        int64_t target;
        switch (whence & ~AVSEEK_FORCE) {
            case SEEK_SET: target = offset; break;
            case SEEK_CUR: target = static_cast<int64_t>(self->pos) + offset; break;
            case SEEK_END: target = size + offset; break;
            default: return -1;
        }
        if (target < 0 || target > size) return -1;
        self->pos = static_cast<size_t>(target);
        return target;
    }
};

// Owning wrappers so every early return releases what was allocated.
struct IoContextDeleter {
    void operator()(AVIOContext* ctx) const {
        if (!ctx) return;
        av_freep(&ctx->buffer);
        avio_context_free(&ctx);
    }
};
struct FormatContextDeleter {
    void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextDeleter {
    void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct SwrContextDeleter {
    void operator()(SwrContext* ctx) const { swr_free(&ctx); }
};
struct PacketDeleter {
    void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
    void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};

using IoContextPtr = std::unique_ptr<AVIOContext, IoContextDeleter>;
using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextDeleter>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextDeleter>;
using SwrContextPtr = std::unique_ptr<SwrContext, SwrContextDeleter>;
using PacketPtr = std::unique_ptr<AVPacket, PacketDeleter>;
using FramePtr = std::unique_ptr<AVFrame, FrameDeleter>;

// Converts one decoded frame (or flushes the resampler when frame is null)
// and appends the mono float output.
bool append_resampled(SwrContext* swr, const AVFrame* frame, int in_rate,
                      std::vector<float>& out) {
    int in_samples = frame ? frame->nb_samples : 0;
    int64_t capacity = av_rescale_rnd(swr_get_delay(swr, in_rate) + in_samples,
                                      NormalizedAudio::kSampleRate, in_rate, AV_ROUND_UP);
    if (capacity <= 0) return true;

    size_t offset = out.size();
    out.resize(offset + static_cast<size_t>(capacity));
    auto* dst = reinterpret_cast<uint8_t*>(out.data() + offset);

    int converted = swr_convert(swr, &dst, static_cast<int>(capacity),
                                frame ? const_cast<const uint8_t**>(frame->extended_data) : nullptr,
                                in_samples);
    if (converted < 0) {
        out.resize(offset);
        return false;
    }
    out.resize(offset + static_cast<size_t>(converted));
    return true;
}

} // namespace

// Short names as registered by libavformat; "webm" and "m4a" are aliases
// of the matroska and mov demuxers.
const char* demuxer_name(AudioFormat format) {
    switch (format) {
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Webm: return "webm";
        case AudioFormat::M4a: return "m4a";
        case AudioFormat::Flac: return "flac";
    }
    return "wav";
}

std::expected<NormalizedAudio, TranscribeError>
normalize(std::span<const uint8_t> bytes, std::string_view declared_format) {
    auto format = parse_audio_format(declared_format);
    if (!format) {
        return std::unexpected(TranscribeError{
            ErrorKind::UnsupportedFormat,
            "unsupported format '" + std::string(declared_format) + "'"});
    }
    return normalize(bytes, *format);
}

std::expected<NormalizedAudio, TranscribeError>
normalize(std::span<const uint8_t> bytes, AudioFormat format) {
    if (bytes.empty()) {
        return std::unexpected(TranscribeError{ErrorKind::EmptyInput, "audio payload is empty"});
    }

    MemoryReader reader{bytes};

    auto* io_buffer = static_cast<uint8_t*>(av_malloc(kIoBufferSize));
    if (!io_buffer) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "out of memory"});
    }
    IoContextPtr io(avio_alloc_context(io_buffer, kIoBufferSize, 0, &reader,
                                       &MemoryReader::read, nullptr, &MemoryReader::seek));
    if (!io) {
        av_free(io_buffer);
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "out of memory"});
    }

    const AVInputFormat* input_format = av_find_input_format(demuxer_name(format));
    if (!input_format) {
        return std::unexpected(corrupt(std::string("no demuxer for ") + demuxer_name(format)));
    }

    AVFormatContext* raw_fmt = avformat_alloc_context();
    if (!raw_fmt) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "out of memory"});
    }
    raw_fmt->pb = io.get();
    raw_fmt->flags |= AVFMT_FLAG_CUSTOM_IO;

    // On failure avformat_open_input frees the context itself.
    int ret = avformat_open_input(&raw_fmt, nullptr, input_format, nullptr);
    if (ret < 0) {
        return std::unexpected(corrupt("cannot open " + std::string(to_string(format)) +
                                       " stream: " + av_error(ret)));
    }
    FormatContextPtr fmt(raw_fmt);

    ret = avformat_find_stream_info(fmt.get(), nullptr);
    if (ret < 0) {
        return std::unexpected(corrupt("cannot read stream info: " + av_error(ret)));
    }

    int stream_index = av_find_best_stream(fmt.get(), AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        return std::unexpected(corrupt("no audio stream"));
    }
    AVStream* stream = fmt->streams[stream_index];

    const AVCodec* decoder = avcodec_find_decoder(stream->codecpar->codec_id);
    if (!decoder) {
        return std::unexpected(corrupt("no decoder for audio codec"));
    }

    CodecContextPtr dec(avcodec_alloc_context3(decoder));
    if (!dec) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "out of memory"});
    }
    if ((ret = avcodec_parameters_to_context(dec.get(), stream->codecpar)) < 0 ||
        (ret = avcodec_open2(dec.get(), decoder, nullptr)) < 0) {
        return std::unexpected(corrupt("cannot open decoder: " + av_error(ret)));
    }
    if (dec->sample_rate <= 0) {
        return std::unexpected(corrupt("stream has no sample rate"));
    }

    // Some containers leave the layout unspecified; assume the default for
    // the channel count.
    if (dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&dec->ch_layout, std::max(dec->ch_layout.nb_channels, 1));
    }

    AVChannelLayout mono = AV_CHANNEL_LAYOUT_MONO;
    SwrContext* raw_swr = nullptr;
    ret = swr_alloc_set_opts2(&raw_swr,
                              &mono, AV_SAMPLE_FMT_FLT, NormalizedAudio::kSampleRate,
                              &dec->ch_layout, dec->sample_fmt, dec->sample_rate,
                              0, nullptr);
    SwrContextPtr swr(raw_swr);
    if (ret < 0 || swr_init(swr.get()) < 0) {
        return std::unexpected(corrupt("cannot convert sample layout"));
    }

    PacketPtr pkt(av_packet_alloc());
    FramePtr frame(av_frame_alloc());
    if (!pkt || !frame) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "out of memory"});
    }

    std::vector<float> samples;
    auto drain_decoder = [&]() -> bool {
        while (avcodec_receive_frame(dec.get(), frame.get()) == 0) {
            bool ok = append_resampled(swr.get(), frame.get(), dec->sample_rate, samples);
            av_frame_unref(frame.get());
            if (!ok) return false;
        }
        return true;
    };

    while (av_read_frame(fmt.get(), pkt.get()) >= 0) {
        if (pkt->stream_index == stream_index) {
            // Damaged packets are skipped; only a stream that yields nothing is corrupt.
            if (avcodec_send_packet(dec.get(), pkt.get()) == 0 && !drain_decoder()) {
                av_packet_unref(pkt.get());
                return std::unexpected(corrupt("sample conversion failed"));
            }
        }
        av_packet_unref(pkt.get());
    }

    avcodec_send_packet(dec.get(), nullptr);
    if (!drain_decoder() || !append_resampled(swr.get(), nullptr, dec->sample_rate, samples)) {
        return std::unexpected(corrupt("sample conversion failed"));
    }

    if (samples.empty()) {
        return std::unexpected(corrupt("no samples could be decoded"));
    }

    NormalizedAudio out;
    out.duration_s = static_cast<double>(samples.size()) / NormalizedAudio::kSampleRate;
    out.samples = std::move(samples);
    return out;
}

void set_decoder_verbose(bool verbose) {
    av_log_set_level(verbose ? AV_LOG_INFO : AV_LOG_ERROR);
}

} // namespace audio
