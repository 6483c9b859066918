#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/ask-anywhere";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/ask-anywhere";
}

std::string executable_dir() {
    std::error_code ec;
    auto exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return {};
    return exe.parent_path().string();
}

} // namespace platform
