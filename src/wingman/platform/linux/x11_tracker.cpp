#include "platform/linux/x11_tracker.hpp"

#include <X11/Xatom.h>
#include <X11/Xutil.h>
#include <algorithm>
#include <print>

namespace {

int ignore_x_error(Display*, XErrorEvent*) {
    // Windows can disappear between any two requests.
    return 0;
}

} // namespace

X11Tracker::X11Tracker(const ProcessInspector& inspector, std::vector<std::string> terminals)
    : inspector_(inspector), terminals_(std::move(terminals)) {}

X11Tracker::~X11Tracker() {
    if (display_) XCloseDisplay(display_);
}

bool X11Tracker::connect() {
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        std::println(stderr, "x11: cannot open display");
        return false;
    }

    root_ = DefaultRootWindow(display_);
    net_active_window_ = XInternAtom(display_, "_NET_ACTIVE_WINDOW", False);
    net_wm_name_ = XInternAtom(display_, "_NET_WM_NAME", False);
    net_wm_pid_ = XInternAtom(display_, "_NET_WM_PID", False);
    net_frame_extents_ = XInternAtom(display_, "_NET_FRAME_EXTENTS", False);
    utf8_string_ = XInternAtom(display_, "UTF8_STRING", False);
    XSetErrorHandler(ignore_x_error);
    return true;
}

std::optional<WindowInfo> X11Tracker::get_focused_window() {
    if (!display_) return std::nullopt;

    Window window = active_window();
    if (window == None || window == root_) return std::nullopt;

    WindowInfo info;
    info.title = window_title(window);
    info.window_class = window_class(window);
    info.pid = window_pid(window);
    info.geometry = window_geometry(window);

    info.process_name = inspector_.process_name(info.pid);
    if (info.process_name.empty()) info.process_name = "Unknown";
    if (info.window_class.empty()) info.window_class = "Unknown";

    if (is_terminal(info.process_name)) {
        info.command = inspector_.foreground_command(info.pid);
    }
    return info;
}

Window X11Tracker::active_window() {
    auto value = cardinals(root_, net_active_window_, 1);
    if (!value.empty() && value[0] != None) return static_cast<Window>(value[0]);

    // No EWMH window manager: ask the server directly.
    Window focus = None;
    int revert = 0;
    XGetInputFocus(display_, &focus, &revert);
    if (focus == PointerRoot) return None;
    return focus;
}

std::string X11Tracker::window_title(Window window) {
    Atom type = None;
    int format = 0;
    unsigned long length = 0, rest = 0;
    unsigned char* data = nullptr;
    if (XGetWindowProperty(display_, window, net_wm_name_, 0, 1024, False, utf8_string_,
                           &type, &format, &length, &rest, &data) == Success && data) {
        std::string title(reinterpret_cast<const char*>(data), length);
        XFree(data);
        if (!title.empty()) return title;
    }

    char* name = nullptr;
    if (XFetchName(display_, window, &name) && name) {
        std::string title(name);
        XFree(name);
        return title;
    }
    return {};
}

std::string X11Tracker::window_class(Window window) {
    XClassHint hint{};
    if (XGetClassHint(display_, window, &hint) == 0) return {};

    std::string result = hint.res_class ? hint.res_class : "";
    if (hint.res_name) XFree(hint.res_name);
    if (hint.res_class) XFree(hint.res_class);
    return result;
}

int X11Tracker::window_pid(Window window) {
    auto value = cardinals(window, net_wm_pid_, 1);
    return value.empty() ? 0 : static_cast<int>(value[0]);
}

std::optional<Geometry> X11Tracker::window_geometry(Window window) {
    Window geometry_root = None;
    int rel_x = 0, rel_y = 0;
    unsigned int width = 0, height = 0, border = 0, depth = 0;
    if (!XGetGeometry(display_, window, &geometry_root, &rel_x, &rel_y, &width, &height, &border, &depth)) {
        return std::nullopt;
    }

    int abs_x = 0, abs_y = 0;
    Window child = None;
    if (!XTranslateCoordinates(display_, window, root_, 0, 0, &abs_x, &abs_y, &child)) {
        return std::nullopt;
    }

    Geometry g{
        .x = abs_x,
        .y = abs_y,
        .width = static_cast<int>(width),
        .height = static_cast<int>(height),
    };

    // left, right, top, bottom
    auto extents = cardinals(window, net_frame_extents_, 4);
    if (extents.size() >= 4) {
        auto left = static_cast<int>(extents[0]);
        auto right = static_cast<int>(extents[1]);
        auto top = static_cast<int>(extents[2]);
        auto bottom = static_cast<int>(extents[3]);
        g.x -= left;
        g.y -= top;
        g.width += left + right;
        g.height += top + bottom;
    }

    if (!g.valid()) return std::nullopt;
    return g;
}

std::vector<unsigned long> X11Tracker::cardinals(Window window, Atom property, long max_items) {
    Atom type = None;
    int format = 0;
    unsigned long length = 0, rest = 0;
    unsigned char* data = nullptr;
    std::vector<unsigned long> values;

    if (XGetWindowProperty(display_, window, property, 0, max_items, False, AnyPropertyType,
                           &type, &format, &length, &rest, &data) != Success || !data) {
        return values;
    }

    // Format-32 items arrive as longs on the client side.
    if (format == 32) {
        auto* items = reinterpret_cast<unsigned long*>(data);
        values.assign(items, items + length);
    }
    XFree(data);
    return values;
}

bool X11Tracker::is_terminal(const std::string& process_name) const {
    return std::ranges::any_of(terminals_, [&](const std::string& t) {
        return !t.empty() && process_name.find(t) != std::string::npos;
    });
}
