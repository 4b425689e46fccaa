#include "platform/platform_paths.hpp"

#include <cstdlib>

namespace platform {

namespace {

// An unset or empty XDG variable means the documented default under $HOME.
std::string xdg_app_dir(const char* var, const char* home_default) {
    const char* xdg = std::getenv(var);
    if (xdg && *xdg) return std::string(xdg) + "/wingman";
    const char* home = std::getenv("HOME");
    if (!home || !*home) return {};
    return std::string(home) + "/" + home_default + "/wingman";
}

} // namespace

std::string config_dir() {
    return xdg_app_dir("XDG_CONFIG_HOME", ".config");
}

std::string data_dir() {
    return xdg_app_dir("XDG_DATA_HOME", ".local/share");
}

std::string history_path() {
    auto dir = data_dir();
    if (dir.empty()) return "/tmp/wingman/history.db";
    return dir + "/history.db";
}

std::string ipc_endpoint() {
    const char* runtime = std::getenv("XDG_RUNTIME_DIR");
    if (runtime && *runtime) return std::string(runtime) + "/wingman.sock";
    return "/tmp/wingman.sock";
}

} // namespace platform
