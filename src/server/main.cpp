#include "audio/normalizer.hpp"
#include "config.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "whisper/whisper_backend.hpp"

#include <cerrno>
#include <charconv>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <print>
#include <unistd.h>

static void daemonize() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0); // parent exits

    setsid();

    // Fork again to prevent reacquiring a controlling terminal
    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    // Redirect stdio to /dev/null
    if (!freopen("/dev/null", "r", stdin) || !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

static void usage() {
    std::println("Usage: localscribe-server [options]");
    std::println("Options:");
    std::println("  -f, --foreground        Run in foreground (don't daemonize)");
    std::println("  -v, --verbose           Enable verbose logging");
    std::println("  -c, --config PATH       Config file path");
    std::println("  -p, --port N            Listen port (default 5000)");
    std::println("  -m, --model NAME|PATH   Model name (ggml-NAME.bin) or model file");
    std::println("  -h, --help              Show this help");
}

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    std::string config_path;
    std::string port_arg;
    std::string model_arg;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 < argc) port_arg = argv[++i];
        } else if (arg == "--model" || arg == "-m") {
            if (i + 1 < argc) model_arg = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_environment();

    if (!port_arg.empty()) {
        uint16_t port = 0;
        auto [ptr, ec] = std::from_chars(port_arg.data(), port_arg.data() + port_arg.size(), port);
        if (ec != std::errc{} || ptr != port_arg.data() + port_arg.size()) {
            std::println(stderr, "Invalid port: {}", port_arg);
            return 1;
        }
        config.server.port = port;
    }

    if (!model_arg.empty()) {
        std::filesystem::path p(model_arg);
        if (p.has_extension() || p.has_parent_path()) {
            config.model.path = model_arg;
            config.model.name = p.stem().string();
        } else {
            config.model.name = model_arg;
            config.model.path.clear();
        }
    }

    if (!foreground) {
        daemonize();
    }

    audio::set_decoder_verbose(verbose);

    if (verbose && foreground) {
        std::println(stderr, "[localscribe] Starting (model: {} @ {})",
                     config.model.name, config.model.resolved_path());
    }

    WhisperBackend::Options options{
        .model_path = config.model.resolved_path(),
        .model_name = config.model.name,
        .threads = config.model.threads,
        .use_gpu = config.model.use_gpu,
        .verbose = verbose,
    };

    auto loader = [options]() -> std::expected<std::unique_ptr<InferenceEngine>, std::string> {
        auto backend = WhisperBackend::load(options);
        if (!backend) return std::unexpected(backend.error());
        return std::unique_ptr<InferenceEngine>(std::move(*backend));
    };

    LinuxEventLoop loop(std::move(config), loader, verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    return loop.run();
}
