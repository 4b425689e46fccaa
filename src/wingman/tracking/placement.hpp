#pragma once

#include "tracking/window_info.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

struct Monitor {
    Geometry bounds;
    bool primary = false;
    std::string name;

    bool contains(int px, int py) const {
        return px >= bounds.x && px < bounds.x + bounds.width &&
               py >= bounds.y && py < bounds.y + bounds.height;
    }
};

struct PanelLimits {
    int min_width = 400;
    int max_width = 800;
    int height = 200;
};

enum class Edge { Top, Bottom, Left, Right };

namespace placement {

// Monitor containing the point, else the primary one, else the first one.
const Monitor* monitor_for(int x, int y, std::span<const Monitor> monitors);

const Monitor* primary_monitor(std::span<const Monitor> monitors);

// Panel rectangle aligned with the top-left corner of `window`, width clamped
// to the limits, kept inside the monitor that contains the window's origin.
std::optional<Geometry> panel_rect_for(const Geometry& window, std::span<const Monitor> monitors,
                                       const PanelLimits& limits);

Geometry edge_rect(Edge edge, const Monitor& monitor, int width, int height);

std::optional<Edge> parse_edge(std::string_view name);
std::string_view edge_name(Edge edge);

} // namespace placement
