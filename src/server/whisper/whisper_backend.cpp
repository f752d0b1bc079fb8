#include "whisper_backend.hpp"

#include <whisper.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <mutex>
#include <print>
#include <string_view>

namespace {

std::atomic<bool> g_forward_model_log{false};

// whisper.cpp emits partial lines; buffer until newline.
std::mutex g_log_mutex;
std::string g_log_line;

void whisper_log_callback(ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || !g_forward_model_log.load(std::memory_order_relaxed)) return;
    if (level == GGML_LOG_LEVEL_NONE) return;

    std::lock_guard lock(g_log_mutex);
    g_log_line += text;

    size_t pos;
    while ((pos = g_log_line.find('\n')) != std::string::npos) {
        auto line = g_log_line.substr(0, pos);
        g_log_line.erase(0, pos + 1);

        auto end = line.find_last_not_of(" \t\r");
        if (end == std::string::npos) continue;
        line.resize(end + 1);
        std::println(stderr, "[localscribe] whisper: {}", line);
    }
}

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

// Marker body with case, spaces and underscores folded away:
// "[ Blank_Audio ]" -> "blankaudio".
bool is_non_speech_marker(std::string_view body) {
    static constexpr std::array<std::string_view, 9> markers = {
        "blankaudio", "silence", "sound", "music", "noise",
        "inaudible", "nospeech", "applause", "laughter",
    };
    std::string folded;
    for (char c : body) {
        if (c == ' ' || c == '_' || c == '\t') continue;
        folded += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return std::ranges::find(markers, folded) != markers.end();
}

// True if text is one or more bracketed markers and nothing else.
bool only_markers(std::string_view text) {
    bool any = false;
    while (!(text = trim(text)).empty()) {
        char open = text.front();
        char close = open == '[' ? ']' : open == '(' ? ')' : open == '*' ? '*' : '\0';
        if (close == '\0') return false;
        auto end = text.find(close, 1);
        if (end == std::string_view::npos || !is_non_speech_marker(text.substr(1, end - 1))) return false;
        text.remove_prefix(end + 1);
        any = true;
    }
    return any;
}

} // namespace

std::expected<std::unique_ptr<WhisperBackend>, std::string>
WhisperBackend::load(Options options) {
    g_forward_model_log.store(options.verbose, std::memory_order_relaxed);
    whisper_log_set(whisper_log_callback, nullptr);

    auto cparams = whisper_context_default_params();
    cparams.use_gpu = options.use_gpu;

    whisper_context* ctx = whisper_init_from_file_with_params(options.model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("failed to load whisper model: " + options.model_path);
    }

    return std::unique_ptr<WhisperBackend>(new WhisperBackend(std::move(options), ctx));
}

WhisperBackend::WhisperBackend(Options options, whisper_context* ctx)
    : options_(std::move(options)), ctx_(ctx) {}

WhisperBackend::~WhisperBackend() {
    if (ctx_) whisper_free(ctx_);
}

std::expected<TranscriptResult, TranscribeError>
WhisperBackend::transcribe(const NormalizedAudio& audio, const std::string& language,
                           std::stop_token stop) {
    if (audio.samples.empty()) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "no samples"});
    }

    // whisper refuses input shorter than one second; pad with silence.
    constexpr size_t min_samples = NormalizedAudio::kSampleRate + NormalizedAudio::kSampleRate / 100;
    std::vector<float> padded;
    const float* data = audio.samples.data();
    size_t count = audio.samples.size();
    if (count < min_samples) {
        padded = audio.samples;
        padded.resize(min_samples, 0.0f);
        data = padded.data();
        count = padded.size();
    }

    auto params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language.empty() ? kAutoLanguage : language.c_str();
    params.detect_language = false;
    params.translate = false;
    params.n_threads = options_.threads;
    params.no_context = true;
    params.print_progress = false;
    params.print_special = false;
    params.print_realtime = false;
    params.print_timestamps = false;

    // Best effort: whisper checks this between graph evaluations.
    params.abort_callback = [](void* user_data) {
        return static_cast<std::stop_token*>(user_data)->stop_requested();
    };
    params.abort_callback_user_data = &stop;

    auto start = std::chrono::steady_clock::now();
    int ret = whisper_full(ctx_, params, data, static_cast<int>(count));
    auto end = std::chrono::steady_clock::now();

    if (ret != 0) {
        if (stop.stop_requested()) {
            return std::unexpected(TranscribeError{ErrorKind::Cancelled, "inference aborted"});
        }
        return std::unexpected(TranscribeError{
            ErrorKind::InferenceError, "whisper_full failed with code " + std::to_string(ret)});
    }

    std::string text;
    int n_segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n_segments; ++i) {
        const char* segment = whisper_full_get_segment_text(ctx_, i);
        if (segment) text += segment;
    }
    text = clean_text(text);

    TranscriptResult result{
        .text = std::move(text),
        .language = std::nullopt,
        .duration_s = audio.duration_s,
        .processing_s = std::chrono::duration<double>(end - start).count(),
    };

    int lang_id = whisper_full_lang_id(ctx_);
    if (lang_id >= 0) {
        if (const char* lang = whisper_lang_str(lang_id)) result.language = lang;
    }

    return result;
}

std::string WhisperBackend::clean_text(std::string_view raw) {
    auto text = trim(raw);
    if (only_markers(text)) return {};
    return std::string(text);
}

bool WhisperBackend::supports_language(const std::string& language) const {
    return whisper_lang_id(language.c_str()) >= 0;
}
