#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/tapedeck";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/tapedeck";
}

std::string data_dir() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg) return std::string(xdg) + "/tapedeck";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.local/share/tapedeck";
}

std::string recordings_dir() {
    auto dir = data_dir();
    if (dir.empty()) return "/tmp/tapedeck-recordings";
    return dir + "/recordings";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg) return std::string(xdg) + "/tapedeck.sock";
    return "/tmp/tapedeck.sock";
}

} // namespace platform
