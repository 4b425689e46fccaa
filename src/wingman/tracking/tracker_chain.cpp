#include "tracking/tracker_chain.hpp"

#include <cstdlib>

namespace {

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? v : "";
}

} // namespace

SessionEnvironment SessionEnvironment::from_process() {
    return {
        .wayland_display = env_or_empty("WAYLAND_DISPLAY"),
        .sway_socket = env_or_empty("SWAYSOCK"),
        .hyprland_signature = env_or_empty("HYPRLAND_INSTANCE_SIGNATURE"),
    };
}

namespace tracking {

std::vector<std::string> backend_order(const SessionEnvironment& env, std::string_view preference) {
    if (preference == "sway" || preference == "hyprland" || preference == "x11") {
        return {std::string(preference)};
    }

    if (env.wayland_display.empty()) return {"x11"};

    // XWayland is the generic fallback on every Wayland session.
    if (!env.hyprland_signature.empty()) return {"hyprland", "sway", "x11"};
    return {"sway", "hyprland", "x11"};
}

} // namespace tracking

TrackerChain::TrackerChain(std::vector<std::unique_ptr<WindowTracker>> candidates)
    : candidates_(std::move(candidates)) {}

bool TrackerChain::connect() {
    for (auto& c : candidates_) {
        if (c && c->connect()) connected_.push_back(std::move(c));
    }
    candidates_.clear();

    if (!connected_.empty()) {
        name_.clear();
        for (auto& t : connected_) {
            if (!name_.empty()) name_ += ",";
            name_ += t->name();
        }
    }
    return !connected_.empty();
}

std::optional<WindowInfo> TrackerChain::get_focused_window() {
    for (auto& t : connected_) {
        auto info = t->get_focused_window();
        if (info && !info->empty()) return info;
    }
    return std::nullopt;
}

std::string_view TrackerChain::name() const {
    return name_;
}

std::vector<std::string> TrackerChain::connected_names() const {
    std::vector<std::string> names;
    for (auto& t : connected_) names.emplace_back(t->name());
    return names;
}
