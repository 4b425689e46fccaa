#pragma once

#include "platform/process_inspector.hpp"
#include "platform/window_tracker.hpp"

#include <X11/Xlib.h>
#include <optional>
#include <string>
#include <vector>

// Focused window through EWMH properties on the root window. Also serves
// XWayland clients on Wayland sessions.
class X11Tracker : public WindowTracker {
public:
    X11Tracker(const ProcessInspector& inspector, std::vector<std::string> terminals);
    ~X11Tracker() override;

    X11Tracker(const X11Tracker&) = delete;
    X11Tracker& operator=(const X11Tracker&) = delete;

    bool connect() override;
    std::optional<WindowInfo> get_focused_window() override;
    std::string_view name() const override { return "x11"; }

private:
    Window active_window();
    std::string window_title(Window window);
    std::string window_class(Window window);
    int window_pid(Window window);
    std::optional<Geometry> window_geometry(Window window);
    std::vector<unsigned long> cardinals(Window window, Atom property, long max_items);
    bool is_terminal(const std::string& process_name) const;

    const ProcessInspector& inspector_;
    std::vector<std::string> terminals_;

    Display* display_ = nullptr;
    Window root_ = 0;
    Atom net_active_window_ = 0;
    Atom net_wm_name_ = 0;
    Atom net_wm_pid_ = 0;
    Atom net_frame_extents_ = 0;
    Atom utf8_string_ = 0;
};
