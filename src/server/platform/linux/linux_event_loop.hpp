#pragma once

#include "config.hpp"
#include "health.hpp"
#include "http_service.hpp"
#include "request_handler.hpp"
#include "whisper/backend.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <thread>

// Owns the process lifecycle: the HTTP listener thread, the background
// model load and signal handling. The loop itself only waits on a signalfd
// and an eventfd; requests are served on the HTTP service's threads.
class LinuxEventLoop {
public:
    // Runs on a background thread; the listener is already up while it runs.
    using ModelLoader = std::function<std::expected<std::unique_ptr<InferenceEngine>, std::string>()>;

    LinuxEventLoop(Config config, ModelLoader loader, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();

    // Returns the process exit status: 0 after a signal or request_stop(),
    // 1 if the model failed to load or the listener died.
    int run();

    // Thread-safe.
    void request_stop();

    uint16_t port() const { return http_.port(); }

private:
    enum class LoadState { Loading, Loaded, Failed };

    void on_wakeup();
    void shutdown();
    void notify();
    void log(const std::string& msg);

    Config config_;
    ModelLoader loader_;
    bool verbose_;

    HealthReporter health_;
    RequestHandler handler_;
    HttpService http_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int wakeup_fd_ = -1;

    std::atomic<bool> running_{false};
    std::atomic<bool> listener_failed_{false};
    int exit_code_ = 0;

    std::jthread http_thread_;
    std::jthread load_thread_;
    std::atomic<LoadState> load_state_{LoadState::Loading};
    bool load_reported_ = false;
    std::string load_error_;
};
