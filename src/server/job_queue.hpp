#pragma once

#include "errors.hpp"
#include "transcription.hpp"
#include "whisper/backend.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

// Funnels every transcription through one worker thread that owns the
// model. Admission is FIFO and bounded; a full queue rejects immediately.
//
// Timeouts and caller cancellation are cancel-if-not-started: a job still
// waiting in the queue is withdrawn and never runs, while a job the model
// is already working on keeps the worker busy until the model returns.
// The engine is asked to stop through its stop token, but nothing depends
// on it doing so.
class JobQueue {
public:
    using Outcome = std::expected<TranscriptResult, TranscribeError>;

    struct Options {
        size_t max_depth = 8;
        std::chrono::milliseconds timeout{std::chrono::seconds(300)};
        bool verbose = false;
    };

    // Handle returned by submit(); pass it to wait().
    class Ticket {
    public:
        uint64_t id() const;

    private:
        friend class JobQueue;
        struct Job;
        explicit Ticket(std::shared_ptr<Job> job) : job_(std::move(job)) {}
        std::shared_ptr<Job> job_;
    };

    JobQueue(std::unique_ptr<InferenceEngine> engine, Options options);
    ~JobQueue();

    JobQueue(const JobQueue&) = delete;
    JobQueue& operator=(const JobQueue&) = delete;

    // Admits a job or fails with ServerBusy. The timeout clock starts here.
    std::expected<Ticket, TranscribeError> submit(NormalizedAudio audio, std::string language);

    // Blocks until the job completes, its deadline passes (InferenceTimeout)
    // or the caller's stop token fires (Cancelled).
    Outcome wait(Ticket& ticket, std::stop_token caller = {});

    // submit() followed by wait().
    Outcome run(NormalizedAudio audio, std::string language, std::stop_token caller = {});

    // Stops the worker. Queued jobs fail with InferenceError; a running job
    // is allowed to finish first.
    void shutdown();

    // Admitted jobs that have not finished, including the running one.
    size_t depth() const;
    size_t capacity() const { return options_.max_depth; }
    uint64_t consecutive_timeouts() const;

    std::string model_name() const { return model_name_; }
    bool supports_language(const std::string& language) const;

private:
    using Job = Ticket::Job;

    void worker_loop(std::stop_token stop);
    bool withdraw(const std::shared_ptr<Job>& job);
    void complete(Job& job, Outcome outcome);
    void log(const std::string& msg);

    std::unique_ptr<InferenceEngine> engine_;
    const std::string model_name_;
    Options options_;

    mutable std::mutex mu_;
    std::condition_variable_any cv_;
    std::deque<std::shared_ptr<Job>> queue_;
    size_t pending_ = 0; // queued + running
    uint64_t next_id_ = 1;
    uint64_t consecutive_timeouts_ = 0;
    bool accepting_ = true;

    std::jthread worker_;
};
