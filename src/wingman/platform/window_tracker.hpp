#pragma once

#include "tracking/window_info.hpp"

#include <optional>
#include <string_view>

class WindowTracker {
public:
    virtual ~WindowTracker() = default;
    virtual bool connect() = 0;
    virtual std::optional<WindowInfo> get_focused_window() = 0;
    virtual std::string_view name() const = 0;
};
