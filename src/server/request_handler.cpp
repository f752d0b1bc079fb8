#include "request_handler.hpp"

#include "audio/normalizer.hpp"
#include "base64.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <print>

using json = nlohmann::json;

std::string Reply::text() const {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

RequestHandler::Slot::Slot(std::atomic<size_t>& counter, size_t limit)
    : counter_(counter), held_(counter_.fetch_add(1, std::memory_order_acq_rel) < limit) {
    if (!held_) counter_.fetch_sub(1, std::memory_order_acq_rel);
}

RequestHandler::Slot::~Slot() {
    if (held_) counter_.fetch_sub(1, std::memory_order_acq_rel);
}

RequestHandler::RequestHandler(HealthReporter& health, std::vector<std::string> languages,
                               bool verbose)
    : health_(health), languages_(std::move(languages)), verbose_(verbose) {}

RequestHandler::~RequestHandler() {
    shutdown();
}

void RequestHandler::attach(std::unique_ptr<JobQueue> queue) {
    queue_ = std::move(queue);
    health_.mark_ready();
}

Reply RequestHandler::health() const {
    if (!health_.ready()) {
        return {503, {{"ok", false}, {"ready", false}, {"model", health_.model_name()}}};
    }
    return {200, {{"ok", true}, {"ready", true}, {"model", queue_->model_name()}}};
}

Reply RequestHandler::transcribe(std::string_view body, std::stop_token caller) {
    json payload;
    try {
        payload = json::parse(body);
    } catch (const json::exception& e) {
        return error_reply({ErrorKind::InvalidRequest, std::string("malformed JSON body: ") + e.what()});
    }
    return transcribe(payload, std::move(caller));
}

Reply RequestHandler::transcribe(const json& payload, std::stop_token caller) {
    if (!health_.ready()) {
        return error_reply({ErrorKind::NotReady, "model is still loading"});
    }

    auto request = parse(payload);
    if (!request) {
        log(std::format("rejected request: {} ({})", to_string(request.error().kind),
                        request.error().message));
        return error_reply(request.error());
    }

    // Admission happens before decoding so a burst cannot pile up decoded PCM.
    Slot slot(in_flight_, queue_->capacity());
    if (!slot) {
        log(std::format("rejected {}: {} requests in flight", request->filename, queue_->capacity()));
        return error_reply({ErrorKind::ServerBusy,
                            std::format("server is busy ({} requests in flight)", queue_->capacity())});
    }

    log(std::format("transcribe {} ({}, {} bytes, language {})", request->filename,
                    to_string(request->format), request->audio.size(), request->language));

    auto start = std::chrono::steady_clock::now();

    auto pcm = audio::normalize(request->audio, request->format);
    if (!pcm) {
        log(std::format("{}: {}", request->filename, pcm.error().message));
        return error_reply(pcm.error());
    }

    auto result = queue_->run(std::move(*pcm), request->language, std::move(caller));

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (!result) {
        log(std::format("{}: {} after {:.1f}s: {}", request->filename,
                        to_string(result.error().kind), elapsed, result.error().message));
        return error_reply(result.error());
    }

    log(std::format("{}: {:.1f}s audio, {:.1f}s total, {} chars", request->filename,
                    result->duration_s, elapsed, result->text.size()));

    json body = {
        {"ok", true},
        {"text", result->text},
        {"duration", result->duration_s},
    };
    if (result->language) {
        body["language"] = *result->language;
    } else if (request->language != kAutoLanguage) {
        body["language"] = request->language;
    }
    return {200, std::move(body)};
}

std::expected<TranscriptionRequest, TranscribeError>
RequestHandler::parse(const json& payload) const {
    auto invalid = [](std::string msg) {
        return std::unexpected(TranscribeError{ErrorKind::InvalidRequest, std::move(msg)});
    };

    if (!payload.is_object()) return invalid("request body must be a JSON object");

    auto data = payload.find("data");
    if (data == payload.end() || !data->is_string()) {
        return invalid("missing field 'data' (base64 audio)");
    }

    // Optional fields fall back to the defaults the client has always relied on.
    auto string_field = [&](const char* key, const char* fallback) -> std::expected<std::string, TranscribeError> {
        auto it = payload.find(key);
        if (it == payload.end() || it->is_null()) return std::string(fallback);
        if (!it->is_string()) return invalid(std::format("field '{}' must be a string", key));
        return it->get<std::string>();
    };

    auto filename = string_field("filename", "audio");
    if (!filename) return std::unexpected(filename.error());
    auto format_tag = string_field("format", "wav");
    if (!format_tag) return std::unexpected(format_tag.error());
    auto language = string_field("language", kAutoLanguage);
    if (!language) return std::unexpected(language.error());

    auto format = parse_audio_format(*format_tag);
    if (!format) {
        return std::unexpected(TranscribeError{
            ErrorKind::UnsupportedFormat, std::format("unsupported format '{}'", *format_tag)});
    }

    if (language->empty()) *language = kAutoLanguage;
    if (!language_accepted(*language)) {
        return std::unexpected(TranscribeError{
            ErrorKind::UnsupportedLanguage, std::format("unsupported language '{}'", *language)});
    }

    auto bytes = base64::decode(data->get_ref<const std::string&>());
    if (!bytes) return invalid("field 'data' is not valid base64");
    if (bytes->empty()) {
        return std::unexpected(TranscribeError{ErrorKind::EmptyInput, "audio payload is empty"});
    }

    return TranscriptionRequest{
        .filename = std::move(*filename),
        .audio = std::move(*bytes),
        .format = *format,
        .language = std::move(*language),
    };
}

void RequestHandler::shutdown() {
    if (queue_) queue_->shutdown();
}

Reply RequestHandler::error_reply(const TranscribeError& error) {
    return {http_status(error.kind),
            {{"ok", false}, {"errorKind", std::string(to_string(error.kind))}, {"error", error.message}}};
}

bool RequestHandler::language_accepted(const std::string& language) const {
    if (language == kAutoLanguage) return true;
    if (!languages_.empty()) return std::ranges::find(languages_, language) != languages_.end();
    return queue_ && queue_->supports_language(language);
}

void RequestHandler::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[localscribe] {}", msg);
    }
}
