#include "platform/linux/hyprland_tracker.hpp"

#include "platform/command_runner.hpp"

#include <chrono>

bool HyprlandTracker::connect() {
    hyprctl_ = platform::find_executable("hyprctl");
    return !hyprctl_.empty();
}

std::optional<WindowInfo> HyprlandTracker::get_focused_window() {
    if (hyprctl_.empty()) return std::nullopt;

    auto res = platform::run_command({hyprctl_, "activewindow", "-j"},
                                     {.timeout = std::chrono::milliseconds(1000)});
    if (!res || res->exit_code != 0) return std::nullopt;

    try {
        return parse_active_window(nlohmann::json::parse(res->output));
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<WindowInfo> HyprlandTracker::parse_active_window(const nlohmann::json& j) {
    // hyprctl prints {} when nothing has focus.
    if (!j.is_object() || j.empty()) return std::nullopt;

    WindowInfo info;
    info.window_class = j.value("class", "");
    if (info.window_class.empty()) info.window_class = j.value("initialClass", "");
    if (info.window_class.empty()) info.window_class = "Unknown";
    info.title = j.value("title", "");
    info.pid = j.value("pid", 0);
    info.process_name = info.window_class;

    auto pair = [&j](const char* key) -> std::optional<std::pair<int, int>> {
        if (!j.contains(key) || !j[key].is_array() || j[key].size() < 2) return std::nullopt;
        return std::pair{j[key][0].get<int>(), j[key][1].get<int>()};
    };

    auto at = pair("at");
    auto size = pair("size");
    if (at && size) {
        Geometry g{.x = at->first, .y = at->second, .width = size->first, .height = size->second};
        if (g.valid()) info.geometry = g;
    }
    return info;
}
