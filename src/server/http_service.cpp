#include "http_service.hpp"

#include "request_handler.hpp"

#include <condition_variable>
#include <exception>
#include <string_view>
#include <format>
#include <mutex>
#include <print>
#include <stop_token>
#include <thread>

namespace {

constexpr const char* kJson = "application/json";

void write_reply(httplib::Response& res, const Reply& reply) {
    res.status = reply.status;
    res.set_content(reply.text(), kJson);
}

Reply method_not_allowed(const char* allowed) {
    return {405, {{"ok", false}, {"errorKind", "MethodNotAllowed"},
                  {"error", std::format("use {}", allowed)}}};
}

} // namespace

HttpService::HttpService(RequestHandler& handler, Options options)
    : handler_(handler), options_(options) {
    server_.new_task_queue = [threads = options_.threads] {
        return new httplib::ThreadPool(threads);
    };
    server_.set_payload_max_length(options_.max_body_bytes);
    install_routes();
}

bool HttpService::bind(const std::string& host, uint16_t port) {
    if (port == 0) {
        int bound = server_.bind_to_any_port(host);
        if (bound < 0) {
            std::println(stderr, "http: cannot bind {}: no free port", host);
            return false;
        }
        port_ = static_cast<uint16_t>(bound);
        return true;
    }

    if (!server_.bind_to_port(host, port)) {
        std::println(stderr, "http: cannot bind {}:{}", host, port);
        return false;
    }
    port_ = port;
    return true;
}

bool HttpService::listen() {
    {
        std::lock_guard lock(state_mu_);
        if (stopped_) return true;
        listening_ = true;
    }
    bool ok = server_.listen_after_bind();

    std::lock_guard lock(state_mu_);
    listening_ = false;
    return ok;
}

void HttpService::stop() {
    {
        std::lock_guard lock(state_mu_);
        stopped_ = true;
        if (!listening_) return;
    }

    // httplib ignores stop() until its accept loop is running.
    while (!server_.is_running()) {
        {
            std::lock_guard lock(state_mu_);
            if (!listening_) return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_.stop();
}

void HttpService::install_routes() {
    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        write_reply(res, handler_.health());
    });
    server_.Post("/health", [](const httplib::Request&, httplib::Response& res) {
        write_reply(res, method_not_allowed("GET"));
    });

    server_.Post("/transcribe", [this](const httplib::Request& req, httplib::Response& res) {
        handle_transcribe(req, res);
    });
    server_.Get("/transcribe", [](const httplib::Request&, httplib::Response& res) {
        write_reply(res, method_not_allowed("POST"));
    });

    // Also runs for the replies above; only fill in responses that have no body yet.
    server_.set_error_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (!res.body.empty()) return;

        Reply reply;
        switch (res.status) {
            case 413:
                reply = RequestHandler::error_reply({
                    ErrorKind::PayloadTooLarge,
                    std::format("request body exceeds {} bytes", options_.max_body_bytes)});
                break;
            case 404:
                reply = {404, {{"ok", false}, {"errorKind", "NotFound"},
                               {"error", std::format("no route for {}", req.path)}}};
                break;
            case 400:
                reply = RequestHandler::error_reply({ErrorKind::InvalidRequest, "malformed HTTP request"});
                break;
            default:
                reply = {res.status, {{"ok", false}, {"errorKind", "InvalidRequest"},
                                      {"error", std::format("HTTP {}", res.status)}}};
                break;
        }
        log(std::format("{} {} -> {}", req.method, req.path, reply.status));
        write_reply(res, reply);
    });

    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                     std::exception_ptr ep) {
        std::string what;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "unknown exception";
        }
        std::println(stderr, "[localscribe] error: {} {} threw: {}", req.method, req.path, what);
        write_reply(res, RequestHandler::error_reply({ErrorKind::InferenceError, what}));
    });
}

void HttpService::handle_transcribe(const httplib::Request& req, httplib::Response& res) {
    // Watches the socket while the request waits so a client that hangs up
    // withdraws its job from the queue.
    std::stop_source client_gone;
    std::jthread watcher([&req, &client_gone](std::stop_token done) {
        std::mutex mu;
        std::condition_variable_any cv;
        std::unique_lock lock(mu);
        // Nothing notifies cv; it is a sleep that wakes early on stop.
        while (!cv.wait_for(lock, done, kDisconnectPoll, [] { return false; }) &&
               !done.stop_requested()) {
            if (req.is_connection_closed && req.is_connection_closed()) {
                client_gone.request_stop();
                return;
            }
        }
    });

    auto reply = handler_.transcribe(std::string_view(req.body), client_gone.get_token());

    watcher.request_stop();
    watcher.join();

    if (client_gone.stop_requested()) {
        log("client disconnected before the reply");
    }
    write_reply(res, reply);
}

void HttpService::log(const std::string& msg) const {
    if (options_.verbose) {
        std::println(stderr, "[localscribe] {}", msg);
    }
}
