#pragma once

#include "platform/window_tracker.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Focused window from `hyprctl activewindow -j`.
class HyprlandTracker : public WindowTracker {
public:
    bool connect() override;
    std::optional<WindowInfo> get_focused_window() override;
    std::string_view name() const override { return "hyprland"; }

    static std::optional<WindowInfo> parse_active_window(const nlohmann::json& j);

private:
    std::string hyprctl_;
};
