#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return std::string(xdg) + "/window-search";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/window-search";
}

std::string ipc_endpoint() {
    const char* xdg = std::getenv("XDG_RUNTIME_DIR");
    if (xdg && *xdg) return std::string(xdg) + "/window-search.sock";
    return "/tmp/window-search.sock";
}

} // namespace platform
