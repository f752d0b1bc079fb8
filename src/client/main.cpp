#include "audio_format.hpp"
#include "base64.hpp"
#include "http_client.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} [--url URL] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  health                                    Check that the server is ready");
    std::println(stderr, "  transcribe FILE [--language L] [--format F]");
    std::println(stderr, "                                            Transcribe an audio file");
    std::println(stderr, "Default URL: http://127.0.0.1:5000");
}

static int print_error(const json& body) {
    std::println(stderr, "{}: {}", body.value("errorKind", "Error"),
                 body.value("error", "unknown error"));
    return 1;
}

static int run_health(HttpClient& client) {
    auto reply = client.get("/health");
    if (!reply) {
        std::println(stderr, "Cannot reach server: {}", reply.error());
        return 1;
    }
    if (!reply->body.value("ok", false)) {
        std::println(stderr, "Server not ready (model {} loading)", reply->body.value("model", "?"));
        return 1;
    }
    std::println("Ready, model: {}", reply->body.value("model", ""));
    return 0;
}

static int run_transcribe(HttpClient& client, const std::string& path,
                          std::string format, const std::string& language) {
    namespace fs = std::filesystem;

    if (format.empty()) format = fs::path(path).extension().string();
    auto parsed = parse_audio_format(format);
    if (!parsed) {
        std::println(stderr, "Unsupported audio format '{}' (mp3, wav, webm, m4a, flac)", format);
        return 1;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::println(stderr, "Cannot open {}", path);
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    json request = {
        {"filename", fs::path(path).filename().string()},
        {"data", base64::encode(bytes)},
        {"format", std::string(to_string(*parsed))},
        {"language", language},
    };

    auto reply = client.post("/transcribe", request);
    if (!reply) {
        std::println(stderr, "Request failed: {}", reply.error());
        return 1;
    }
    if (!reply->body.value("ok", false)) {
        return print_error(reply->body);
    }

    std::println("{}", reply->body.value("text", ""));
    return 0;
}

int main(int argc, char* argv[]) {
    std::string url = "http://127.0.0.1:5000";
    std::string command;
    std::string file;
    std::string language = "auto";
    std::string format;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            language = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        } else if (command.empty()) {
            command = arg;
        } else if (file.empty()) {
            file = arg;
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    HttpClient client(url);

    if (command == "health") {
        return run_health(client);
    }
    if (command == "transcribe" && !file.empty()) {
        return run_transcribe(client, file, format, language);
    }

    usage(argv[0]);
    return 1;
}
