#pragma once

#include <optional>
#include <string>

struct Geometry {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool valid() const { return width > 0 && height > 0; }
    bool operator==(const Geometry&) const = default;
};

struct WindowInfo {
    std::string app_id;        // Wayland app_id (e.g. "kitty")
    std::string window_class;  // X11 class (e.g. "Firefox")
    std::string title;         // window title
    std::string process_name;  // /proc/{pid}/comm
    std::string command;       // program running inside a terminal window
    int pid = 0;
    std::optional<Geometry> geometry;

    const std::string& app_name() const {
        if (!command.empty()) return command;
        return !app_id.empty() ? app_id : window_class;
    }

    bool empty() const { return app_id.empty() && window_class.empty() && title.empty() && pid == 0; }
};
