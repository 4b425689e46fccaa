#pragma once

#include "platform/window_tracker.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

// Display-server hints used to order the detection backends.
struct SessionEnvironment {
    std::string wayland_display;
    std::string sway_socket;
    std::string hyprland_signature;

    static SessionEnvironment from_process();
};

namespace tracking {

// Backend names in the order they should be tried: "sway", "hyprland", "x11".
std::vector<std::string> backend_order(const SessionEnvironment& env, std::string_view preference);

} // namespace tracking

class TrackerChain : public WindowTracker {
public:
    explicit TrackerChain(std::vector<std::unique_ptr<WindowTracker>> candidates);

    // Connects every candidate, keeping only those that succeed.
    bool connect() override;
    std::optional<WindowInfo> get_focused_window() override;
    std::string_view name() const override;

    bool tracking_supported() const { return !connected_.empty(); }
    std::vector<std::string> connected_names() const;

private:
    std::vector<std::unique_ptr<WindowTracker>> candidates_;
    std::vector<std::unique_ptr<WindowTracker>> connected_;
    std::string name_ = "none";
};
