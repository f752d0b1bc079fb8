#include "job_queue.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <print>

struct JobQueue::Ticket::Job {
    uint64_t id = 0;
    NormalizedAudio audio;
    std::string language;
    std::chrono::steady_clock::time_point deadline;

    // Raised once nobody is waiting for the outcome any more.
    std::stop_source abandoned;

    std::mutex mu;
    std::condition_variable_any done_cv;
    std::optional<Outcome> outcome;
};

uint64_t JobQueue::Ticket::id() const {
    return job_ ? job_->id : 0;
}

JobQueue::JobQueue(std::unique_ptr<InferenceEngine> engine, Options options)
    : engine_(std::move(engine)), model_name_(engine_->model_name()),
      options_(options) {
    worker_ = std::jthread([this](std::stop_token stop) { worker_loop(stop); });
}

JobQueue::~JobQueue() {
    shutdown();
}

std::expected<JobQueue::Ticket, TranscribeError>
JobQueue::submit(NormalizedAudio audio, std::string language) {
    auto job = std::make_shared<Job>();
    job->audio = std::move(audio);
    job->language = std::move(language);

    {
        std::lock_guard lock(mu_);
        if (!accepting_) {
            return std::unexpected(TranscribeError{ErrorKind::InferenceError, "server is shutting down"});
        }
        if (pending_ >= options_.max_depth) {
            return std::unexpected(TranscribeError{
                ErrorKind::ServerBusy,
                std::format("queue is full ({} jobs)", options_.max_depth)});
        }
        job->id = next_id_++;
        job->deadline = std::chrono::steady_clock::now() + options_.timeout;
        queue_.push_back(job);
        pending_++;
    }
    cv_.notify_one();

    return Ticket(std::move(job));
}

JobQueue::Outcome JobQueue::wait(Ticket& ticket, std::stop_token caller) {
    auto job = ticket.job_;
    if (!job) {
        return std::unexpected(TranscribeError{ErrorKind::InferenceError, "invalid ticket"});
    }

    {
        std::unique_lock lock(job->mu);
        bool done = job->done_cv.wait_until(lock, caller, job->deadline,
                                            [&] { return job->outcome.has_value(); });
        if (done) return std::move(*job->outcome);
    }

    bool cancelled = caller.stop_requested();
    bool removed = withdraw(job);
    job->abandoned.request_stop();

    // The worker may have delivered between the wait and the withdrawal.
    if (!removed) {
        std::lock_guard lock(job->mu);
        if (job->outcome) return std::move(*job->outcome);
    }

    if (cancelled) {
        log(std::format("job {} cancelled by caller ({})", job->id,
                        removed ? "withdrawn from queue" : "inference continues"));
        return std::unexpected(TranscribeError{ErrorKind::Cancelled, "request cancelled"});
    }

    uint64_t timeouts;
    {
        std::lock_guard lock(mu_);
        timeouts = ++consecutive_timeouts_;
    }
    std::println(stderr, "[localscribe] warning: job {} timed out after {}s ({}), {} consecutive timeouts",
                 job->id, options_.timeout.count() / 1000.0,
                 removed ? "never started" : "inference still running", timeouts);

    return std::unexpected(TranscribeError{
        ErrorKind::InferenceTimeout,
        std::format("transcription exceeded {}s", options_.timeout.count() / 1000.0)});
}

JobQueue::Outcome JobQueue::run(NormalizedAudio audio, std::string language,
                                std::stop_token caller) {
    auto ticket = submit(std::move(audio), std::move(language));
    if (!ticket) return std::unexpected(std::move(ticket.error()));
    return wait(*ticket, std::move(caller));
}

void JobQueue::shutdown() {
    std::deque<std::shared_ptr<Job>> orphans;
    {
        std::lock_guard lock(mu_);
        if (!accepting_) return;
        accepting_ = false;
        orphans.swap(queue_);
        pending_ -= orphans.size();
    }

    for (auto& job : orphans) {
        complete(*job, std::unexpected(TranscribeError{ErrorKind::InferenceError, "server is shutting down"}));
    }

    worker_.request_stop();
    if (worker_.joinable()) worker_.join();
}

size_t JobQueue::depth() const {
    std::lock_guard lock(mu_);
    return pending_;
}

uint64_t JobQueue::consecutive_timeouts() const {
    std::lock_guard lock(mu_);
    return consecutive_timeouts_;
}

bool JobQueue::supports_language(const std::string& language) const {
    // Read-only lookup that does not touch inference state.
    return engine_->supports_language(language);
}

void JobQueue::worker_loop(std::stop_token stop) {
    while (true) {
        std::shared_ptr<Job> job;
        {
            std::unique_lock lock(mu_);
            if (!cv_.wait(lock, stop, [this] { return !queue_.empty(); })) break;
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        Outcome outcome;
        if (job->abandoned.stop_requested() ||
            std::chrono::steady_clock::now() >= job->deadline) {
            outcome = std::unexpected(TranscribeError{ErrorKind::InferenceTimeout, "deadline passed while queued"});
        } else {
            log(std::format("job {}: {:.1f}s audio, language {}", job->id,
                            job->audio.duration_s, job->language));
            try {
                outcome = engine_->transcribe(job->audio, job->language, job->abandoned.get_token());
            } catch (const std::exception& e) {
                outcome = std::unexpected(TranscribeError{ErrorKind::InferenceError, e.what()});
            }
        }

        bool succeeded = outcome.has_value();
        complete(*job, std::move(outcome));

        std::lock_guard lock(mu_);
        pending_--;
        if (succeeded) consecutive_timeouts_ = 0;
    }
}

bool JobQueue::withdraw(const std::shared_ptr<Job>& job) {
    std::lock_guard lock(mu_);
    auto it = std::ranges::find(queue_, job);
    if (it == queue_.end()) return false;
    queue_.erase(it);
    pending_--;
    return true;
}

void JobQueue::complete(Job& job, Outcome outcome) {
    {
        std::lock_guard lock(job.mu);
        job.outcome = std::move(outcome);
    }
    job.done_cv.notify_all();
}

void JobQueue::log(const std::string& msg) {
    if (options_.verbose) {
        std::println(stderr, "[localscribe] {}", msg);
    }
}
