#include "platform/linux/linux_event_loop.hpp"

#include "job_queue.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <unistd.h>

namespace {

// Connection threads beyond the queue capacity, so /health and fast
// rejections are still served while every queue slot is held.
constexpr size_t kSpareHttpThreads = 4;

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, ModelLoader loader, bool verbose)
    : config_(std::move(config)), loader_(std::move(loader)), verbose_(verbose),
      health_(config_.model.name),
      handler_(health_, config_.languages, verbose_),
      http_(handler_, HttpService::Options{
                          .max_body_bytes = config_.server.max_body_bytes(),
                          .threads = config_.queue.max_depth + kSpareHttpThreads,
                          .verbose = verbose_,
                      }) {}

LinuxEventLoop::~LinuxEventLoop() {
    shutdown();

    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (wakeup_fd_ >= 0) ::close(wakeup_fd_);
}

bool LinuxEventLoop::init() {
    if (!http_.bind(config_.server.host, config_.server.port)) return false;
    log(std::format("HTTP listening on {}:{}", config_.server.host, http_.port()));

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    wakeup_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeup_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    auto add_fd = [this](int fd) {
        epoll_event ev{.events = EPOLLIN, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };
    if (!add_fd(signal_fd_) || !add_fd(wakeup_fd_)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    running_.store(true, std::memory_order_release);

    // Threads started after the mask is set inherit it, so signals only
    // arrive through signal_fd_.
    http_thread_ = std::jthread([this] {
        if (!http_.listen() && running_.load(std::memory_order_acquire)) {
            listener_failed_.store(true, std::memory_order_release);
            notify();
        }
    });

    // The model loads while /health already answers "loading".
    load_thread_ = std::jthread([this] {
        log("Loading model " + config_.model.name);
        auto start = std::chrono::steady_clock::now();
        auto engine = loader_();
        if (!engine) {
            load_error_ = engine.error();
            load_state_.store(LoadState::Failed, std::memory_order_release);
            notify();
            return;
        }

        JobQueue::Options options{
            .max_depth = config_.queue.max_depth,
            .timeout = std::chrono::seconds(config_.queue.timeout_seconds),
            .verbose = verbose_,
        };
        handler_.attach(std::make_unique<JobQueue>(std::move(*engine), options));

        double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        log(std::format("Model {} ready ({:.1f}s)", health_.model_name(), secs));
        load_state_.store(LoadState::Loaded, std::memory_order_release);
        notify();
    });

    return true;
}

int LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 4;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log("Received signal, shutting down");
                }
                running_.store(false, std::memory_order_release);
            } else if (fd == wakeup_fd_) {
                uint64_t val;
                while (::read(wakeup_fd_, &val, sizeof(val)) > 0) {}
                on_wakeup();
            }
        }
    }

    shutdown();
    return exit_code_;
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    notify();
}

void LinuxEventLoop::on_wakeup() {
    if (load_state_.load(std::memory_order_acquire) == LoadState::Failed && !load_reported_) {
        load_reported_ = true;
        std::println(stderr, "[localscribe] fatal: {}", load_error_);
        exit_code_ = 1;
        running_.store(false, std::memory_order_release);
    }

    if (listener_failed_.load(std::memory_order_acquire)) {
        std::println(stderr, "[localscribe] fatal: HTTP listener stopped");
        exit_code_ = 1;
        running_.store(false, std::memory_order_release);
    }
}

void LinuxEventLoop::shutdown() {
    running_.store(false, std::memory_order_release);

    // Let the model finish loading so the queue can be shut down with it.
    if (load_thread_.joinable()) load_thread_.join();

    // Queued requests fail first so their handler threads return and the
    // listener can drain.
    handler_.shutdown();
    http_.stop();
    if (http_thread_.joinable()) http_thread_.join();
}

void LinuxEventLoop::notify() {
    if (wakeup_fd_ < 0) return;
    uint64_t val = 1;
    if (::write(wakeup_fd_, &val, sizeof(val)) < 0 && errno != EAGAIN) {
        std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[localscribe] {}", msg);
    }
}
