#include "http_client.hpp"

#include <curl/curl.h>

static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

HttpClient::HttpClient(std::string base_url, long timeout_s)
    : base_url_(std::move(base_url)), timeout_s_(timeout_s) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpClient::~HttpClient() {
    curl_global_cleanup();
}

std::expected<HttpReply, std::string> HttpClient::get(const std::string& path) {
    return perform(path, nullptr);
}

std::expected<HttpReply, std::string> HttpClient::post(const std::string& path,
                                                       const nlohmann::json& body) {
    auto payload = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return perform(path, &payload);
}

std::expected<HttpReply, std::string> HttpClient::perform(const std::string& path,
                                                          const std::string* body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    auto url = base_url_ + path;
    std::string response_body;
    curl_slist* headers = nullptr;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    if (body) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        headers = curl_slist_append(headers, "Expect:");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body->size()));
    }

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }

    try {
        return HttpReply{
            .status = status,
            .body = nlohmann::json::parse(response_body),
        };
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(std::string("JSON parse error: ") + e.what());
    }
}
