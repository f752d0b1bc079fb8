#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <httplib.h>
#include <mutex>
#include <string>

class RequestHandler;

// HTTP front end: routes /health and /transcribe to the RequestHandler and
// renders every reply, including transport errors, as {ok:false, ...} JSON.
class HttpService {
public:
    struct Options {
        size_t max_body_bytes = 100 * 1024 * 1024;
        // Connection threads. Must exceed the queue capacity so /health
        // still gets a thread while every queue slot is waiting.
        size_t threads = 12;
        bool verbose = false;
    };

    // How often a waiting /transcribe checks whether its client is gone.
    static constexpr std::chrono::milliseconds kDisconnectPoll{50};

    HttpService(RequestHandler& handler, Options options);

    HttpService(const HttpService&) = delete;
    HttpService& operator=(const HttpService&) = delete;

    // Port 0 binds an ephemeral port; see port().
    bool bind(const std::string& host, uint16_t port);

    // Serves until stop(). Blocks the calling thread. Returns immediately
    // if stop() already ran.
    bool listen();

    // Thread-safe, may race with listen(). In-flight handlers finish
    // before listen() returns.
    void stop();

    uint16_t port() const { return port_; }

private:
    void install_routes();
    void handle_transcribe(const httplib::Request& req, httplib::Response& res);
    void log(const std::string& msg) const;

    RequestHandler& handler_;
    Options options_;
    httplib::Server server_;
    uint16_t port_ = 0;

    std::mutex state_mu_;
    bool listening_ = false;
    bool stopped_ = false;
};
