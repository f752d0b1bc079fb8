#pragma once

#include <string>

namespace platform {

// Directory holding config.json. Empty if no home directory can be found.
std::string config_dir();

// Directory under which ggml model files are looked up by name.
std::string models_dir();

} // namespace platform
