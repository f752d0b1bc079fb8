#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct Config {
    struct Server {
        std::string host = "127.0.0.1";
        uint16_t port = 5000;
        uint32_t max_body_mb = 100;

        size_t max_body_bytes() const {
            return static_cast<size_t>(max_body_mb) * 1024 * 1024;
        }
    } server;

    struct Model {
        std::string name = "base";
        std::string path;       // explicit model file; derived from name when empty
        std::string models_dir; // platform default when empty
        int threads = 4;
        bool use_gpu = true;

        // Resolves the ggml file to load: explicit path, else
        // <models_dir>/ggml-<name>.bin.
        std::string resolved_path() const;
    } model;

    // Accepted language tags besides "auto". Empty means whatever the
    // model itself supports.
    std::vector<std::string> languages;

    struct Queue {
        uint32_t max_depth = 8;
        uint32_t timeout_seconds = 300;
    } queue;

    static Config load(const std::string& path);
    static Config load_default();

    // WHISPER_MODEL overrides model.name.
    void apply_environment();
};
