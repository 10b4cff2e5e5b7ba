#pragma once

#include <string>

namespace platform {

// Empty when neither XDG_* nor HOME is set.
std::string config_dir();
std::string data_dir();

// Root for per-request scratch directories ($TMPDIR or /tmp).
std::string temp_dir();

} // namespace platform
