#include "tracking/placement.hpp"

#include <algorithm>

namespace placement {

const Monitor* primary_monitor(std::span<const Monitor> monitors) {
    if (monitors.empty()) return nullptr;
    auto it = std::ranges::find_if(monitors, [](const Monitor& m) { return m.primary; });
    return it != monitors.end() ? &*it : &monitors.front();
}

const Monitor* monitor_for(int x, int y, std::span<const Monitor> monitors) {
    auto it = std::ranges::find_if(monitors, [x, y](const Monitor& m) { return m.contains(x, y); });
    if (it != monitors.end()) return &*it;
    return primary_monitor(monitors);
}

std::optional<Geometry> panel_rect_for(const Geometry& window, std::span<const Monitor> monitors,
                                       const PanelLimits& limits) {
    const Monitor* monitor = monitor_for(window.x, window.y, monitors);
    if (!monitor) return std::nullopt;

    const auto& screen = monitor->bounds;
    Geometry panel{
        .x = window.x,
        .y = window.y,
        .width = std::clamp(window.width, limits.min_width, std::max(limits.min_width, limits.max_width)),
        .height = limits.height,
    };

    int right = screen.x + screen.width;
    int bottom = screen.y + screen.height;

    if (panel.x + panel.width > right) panel.x = right - panel.width;
    if (panel.x < screen.x) panel.x = screen.x;
    if (panel.y + panel.height > bottom) panel.y = bottom - panel.height;
    if (panel.y < screen.y) panel.y = screen.y;

    return panel;
}

Geometry edge_rect(Edge edge, const Monitor& monitor, int width, int height) {
    const auto& s = monitor.bounds;
    switch (edge) {
        case Edge::Top:
            return {s.x, s.y, width, height};
        case Edge::Bottom:
            return {s.x, s.y + s.height - height, width, height};
        case Edge::Left:
            return {s.x, s.y, width, s.height};
        case Edge::Right:
            return {s.x + s.width - width, s.y, width, s.height};
    }
    return {s.x, s.y, width, height};
}

std::optional<Edge> parse_edge(std::string_view name) {
    if (name == "top") return Edge::Top;
    if (name == "bottom") return Edge::Bottom;
    if (name == "left") return Edge::Left;
    if (name == "right") return Edge::Right;
    return std::nullopt;
}

std::string_view edge_name(Edge edge) {
    switch (edge) {
        case Edge::Top: return "top";
        case Edge::Bottom: return "bottom";
        case Edge::Left: return "left";
        case Edge::Right: return "right";
    }
    return "top";
}

} // namespace placement
