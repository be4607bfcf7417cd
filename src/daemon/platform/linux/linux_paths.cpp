#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// $<xdg_var>/mute, else $HOME/<home_fallback>/mute.
std::string xdg_app_dir(const char* xdg_var, const char* home_fallback) {
    if (const char* xdg = std::getenv(xdg_var); xdg && *xdg) {
        return std::string(xdg) + "/mute";
    }
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/" + home_fallback + "/mute";
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string ipc_endpoint() {
    if (const char* xdg = std::getenv("XDG_RUNTIME_DIR"); xdg && *xdg) {
        return std::string(xdg) + "/mute.sock";
    }
    return "/tmp/mute.sock";
}

} // namespace platform
