#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/ask-anywhere or ~/.config/ask-anywhere, empty if neither is set.
std::string config_dir();

// Directory holding the running executable, empty if it cannot be resolved.
std::string executable_dir();

} // namespace platform
