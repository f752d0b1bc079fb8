#pragma once

#include "errors.hpp"
#include "health.hpp"
#include "job_queue.hpp"
#include "transcription.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <memory>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

// JSON response plus the HTTP status it should be sent with.
struct Reply {
    int status = 200;
    nlohmann::json body;

    // Serialized body. Invalid UTF-8 (echoed from a bad request) is
    // replaced rather than thrown.
    std::string text() const;
};

// Validates /transcribe payloads, drives normalization and the job queue,
// and maps every outcome to the stable {ok, ...} response shape. Safe to
// call from many request threads at once.
//
// At most capacity() requests are in flight (decoding, queued or running)
// at any time. Excess requests fail with ServerBusy before their audio is
// decoded.
class RequestHandler {
public:
    // languages: accepted tags besides "auto"; empty defers to the model.
    RequestHandler(HealthReporter& health, std::vector<std::string> languages,
                   bool verbose = false);
    ~RequestHandler();

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // Installs the queue that owns the loaded model and reports ready.
    // Must be called at most once.
    void attach(std::unique_ptr<JobQueue> queue);

    Reply health() const;

    // body is the raw request body. Blocks until the job has a terminal
    // outcome; the stop token signals that the client went away.
    Reply transcribe(std::string_view body, std::stop_token caller = {});
    Reply transcribe(const nlohmann::json& payload, std::stop_token caller = {});

    // Shape validation and base64 decoding. No job is created here.
    std::expected<TranscriptionRequest, TranscribeError> parse(const nlohmann::json& payload) const;

    void shutdown();

    // Requests currently past admission.
    size_t in_flight() const { return in_flight_.load(std::memory_order_relaxed); }

    static Reply error_reply(const TranscribeError& error);

private:
    // Holds one admission slot for the lifetime of a request.
    class Slot {
    public:
        Slot(std::atomic<size_t>& counter, size_t limit);
        ~Slot();
        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        explicit operator bool() const { return held_; }

    private:
        std::atomic<size_t>& counter_;
        bool held_;
    };

    bool language_accepted(const std::string& language) const;
    void log(const std::string& msg) const;

    HealthReporter& health_;
    std::vector<std::string> languages_;
    bool verbose_;

    // Written once by attach() before health_ flips to ready; read only
    // after observing ready.
    std::unique_ptr<JobQueue> queue_;

    std::atomic<size_t> in_flight_{0};
};
