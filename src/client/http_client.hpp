#pragma once

#include <expected>
#include <nlohmann/json.hpp>
#include <string>

struct HttpReply {
    long status = 0;
    nlohmann::json body;
};

// Blocking JSON-over-HTTP client for the transcription server.
class HttpClient {
public:
    explicit HttpClient(std::string base_url, long timeout_s = 600);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    std::expected<HttpReply, std::string> get(const std::string& path);
    std::expected<HttpReply, std::string> post(const std::string& path, const nlohmann::json& body);

private:
    std::expected<HttpReply, std::string> perform(const std::string& path, const std::string* body);

    std::string base_url_;
    long timeout_s_;
};
