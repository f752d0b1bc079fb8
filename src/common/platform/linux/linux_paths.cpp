#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>

namespace platform {

namespace {

namespace fs = std::filesystem;

// XDG base directory: the variable if it holds an absolute path, otherwise
// $HOME/<fallback>. Relative XDG values are ignored per XDG Base Directory.
fs::path xdg_base(const char* var, const char* fallback) {
    if (const char* value = std::getenv(var); value && *value == '/') {
        return value;
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return fs::path(home) / fallback;
}

std::string under(const fs::path& base, const fs::path& rel) {
    return base.empty() ? std::string() : (base / rel).string();
}

} // namespace

std::string config_dir() {
    return under(xdg_base("XDG_CONFIG_HOME", ".config"), "localscribe");
}

std::string models_dir() {
    return under(xdg_base("XDG_DATA_HOME", ".local/share"), "localscribe/models");
}

} // namespace platform
