#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Integer field that must fall inside [lo, hi]. Out-of-range values are
// logged and the current value is kept; a non-number throws like any
// other type mismatch.
template <typename T>
void read_bounded(const json& obj, const char* key, T& out, int64_t lo, int64_t hi) {
    if (!obj.contains(key)) return;
    auto value = obj[key].get<int64_t>();
    if (value < lo || value > hi) {
        std::println(stderr, "config: {} = {} is outside [{}, {}], keeping {}", key, value, lo, hi, out);
        return;
    }
    out = static_cast<T>(value);
}

} // namespace

std::string Config::Model::resolved_path() const {
    if (!path.empty()) return path;
    auto dir = models_dir.empty() ? platform::models_dir() : models_dir;
    if (dir.empty()) dir = ".";
    return (fs::path(dir) / ("ggml-" + name + ".bin")).string();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("server")) {
            auto& s = j["server"];
            if (s.contains("host")) cfg.server.host = s["host"].get<std::string>();
            read_bounded(s, "port", cfg.server.port, 0, 65535);
            read_bounded(s, "max_body_mb", cfg.server.max_body_mb, 1, 4096);
        }

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("name")) cfg.model.name = m["name"].get<std::string>();
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
            if (m.contains("models_dir")) cfg.model.models_dir = m["models_dir"].get<std::string>();
            read_bounded(m, "threads", cfg.model.threads, 1, 256);
            if (m.contains("use_gpu")) cfg.model.use_gpu = m["use_gpu"].get<bool>();
        }

        if (j.contains("languages")) {
            cfg.languages = j["languages"].get<std::vector<std::string>>();
        }

        if (j.contains("queue")) {
            auto& q = j["queue"];
            read_bounded(q, "max_depth", cfg.queue.max_depth, 1, 1024);
            read_bounded(q, "timeout_seconds", cfg.queue.timeout_seconds, 1, 24 * 3600);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}

void Config::apply_environment() {
    const char* model_name = std::getenv("WHISPER_MODEL");
    if (model_name && *model_name) model.name = model_name;
}
