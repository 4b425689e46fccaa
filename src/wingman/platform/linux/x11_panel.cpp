#include "platform/linux/x11_panel.hpp"

#include "docs/text_utils.hpp"

#include <X11/Xatom.h>
#include <X11/Xproto.h>
#include <X11/Xutil.h>
#include <X11/extensions/Xrandr.h>
#include <X11/keysym.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>
#include <print>
#include <unistd.h>

namespace {

bool grab_conflict = false;

// Xlib's default handler exits the process. Besides a taken shortcut, the
// only expected errors concern windows that vanished between requests.
int panel_x_error(Display*, XErrorEvent* ev) {
    if (ev->request_code == X_GrabKey && ev->error_code == BadAccess) grab_conflict = true;
    return 0;
}

} // namespace

X11Panel::X11Panel(double transparency, Shortcut shortcut)
    : transparency_(std::clamp(transparency, 0.1, 1.0)), shortcut_(std::move(shortcut)) {}

X11Panel::~X11Panel() {
    if (!display_) return;
    if (font_) XFreeFont(display_, font_);
    if (gc_) XFreeGC(display_, gc_);
    if (window_ != None) XDestroyWindow(display_, window_);
    if (has_argb_ && colormap_ != 0) XFreeColormap(display_, colormap_);
    XCloseDisplay(display_);
}

bool X11Panel::open() {
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        std::println(stderr, "panel: cannot open X display");
        return false;
    }
    root_ = DefaultRootWindow(display_);
    XSetErrorHandler(panel_x_error);

    font_ = XLoadQueryFont(display_, "fixed");
    if (!font_) {
        std::println(stderr, "panel: cannot load font 'fixed'");
        return false;
    }

    create_window();
    if (!grab_shortcut()) {
        std::println(stderr, "panel: global shortcut unavailable, toggle with 'wingmanctl toggle'");
    }
    rewrap();
    XFlush(display_);
    return true;
}

int X11Panel::fd() const {
    return display_ ? ConnectionNumber(display_) : -1;
}

void X11Panel::create_window() {
    int screen = DefaultScreen(display_);

    XVisualInfo vinfo;
    Visual* visual = nullptr;
    if (XMatchVisualInfo(display_, screen, 32, TrueColor, &vinfo)) {
        visual = vinfo.visual;
        colormap_ = XCreateColormap(display_, root_, visual, AllocNone);
        has_argb_ = true;
    } else {
        visual = DefaultVisual(display_, screen);
        colormap_ = DefaultColormap(display_, screen);
        has_argb_ = false;
    }

    XSetWindowAttributes attrs{};
    attrs.override_redirect = True;
    attrs.background_pixel = 0;
    attrs.border_pixel = 0;
    attrs.colormap = colormap_;
    attrs.event_mask = ExposureMask | KeyPressMask | ButtonPressMask | ButtonReleaseMask |
                       PointerMotionMask | StructureNotifyMask;

    window_ = XCreateWindow(display_, root_,
                            geometry_.x, geometry_.y,
                            static_cast<unsigned>(geometry_.width),
                            static_cast<unsigned>(geometry_.height),
                            0,
                            has_argb_ ? 32 : CopyFromParent,
                            InputOutput, visual,
                            CWOverrideRedirect | CWBackPixel | CWBorderPixel | CWColormap | CWEventMask,
                            &attrs);

    XClassHint class_hint{};
    std::string res_name = "wingman";
    std::string res_class = "Wingman";
    class_hint.res_name = res_name.data();
    class_hint.res_class = res_class.data();
    XSetClassHint(display_, window_, &class_hint);
    XStoreName(display_, window_, "Wingman");

    // Lets the focus tracker recognize the panel as ours.
    unsigned long pid = static_cast<unsigned long>(::getpid());
    XChangeProperty(display_, window_, XInternAtom(display_, "_NET_WM_PID", False), XA_CARDINAL,
                    32, PropModeReplace, reinterpret_cast<unsigned char*>(&pid), 1);

    if (!has_argb_) {
        // Compositors honour this on windows without an alpha channel.
        unsigned long opacity = static_cast<unsigned long>(transparency_ * 0xffffffffUL);
        XChangeProperty(display_, window_, XInternAtom(display_, "_NET_WM_WINDOW_OPACITY", False),
                        XA_CARDINAL, 32, PropModeReplace,
                        reinterpret_cast<unsigned char*>(&opacity), 1);
    }

    Atom window_type = XInternAtom(display_, "_NET_WM_WINDOW_TYPE", False);
    Atom utility_type = XInternAtom(display_, "_NET_WM_WINDOW_TYPE_UTILITY", False);
    XChangeProperty(display_, window_, window_type, XA_ATOM, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(&utility_type), 1);

    Atom state = XInternAtom(display_, "_NET_WM_STATE", False);
    Atom states[] = {
        XInternAtom(display_, "_NET_WM_STATE_ABOVE", False),
        XInternAtom(display_, "_NET_WM_STATE_STICKY", False),
    };
    XChangeProperty(display_, window_, state, XA_ATOM, 32, PropModeReplace,
                    reinterpret_cast<unsigned char*>(states), 2);

    gc_ = XCreateGC(display_, window_, 0, nullptr);
    XSetFont(display_, gc_, font_->fid);
}

bool X11Panel::grab_shortcut() {
    KeySym keysym = XStringToKeysym(shortcut_.key.c_str());
    if (keysym == NoSymbol) {
        std::string lower = text::to_lower(shortcut_.key);
        keysym = XStringToKeysym(lower.c_str());
    }
    if (keysym == NoSymbol) {
        std::println(stderr, "panel: unknown shortcut key '{}'", shortcut_.key);
        return false;
    }

    shortcut_keycode_ = XKeysymToKeycode(display_, keysym);
    if (shortcut_keycode_ == 0) {
        std::println(stderr, "panel: no keycode for shortcut key '{}'", shortcut_.key);
        return false;
    }

    shortcut_mask_ = 0;
    if (shortcut_.modifiers & Shortcut::Control) shortcut_mask_ |= ControlMask;
    if (shortcut_.modifiers & Shortcut::Shift) shortcut_mask_ |= ShiftMask;
    if (shortcut_.modifiers & Shortcut::Alt) shortcut_mask_ |= Mod1Mask;
    if (shortcut_.modifiers & Shortcut::Super) shortcut_mask_ |= Mod4Mask;

    // Grab with Num Lock and Caps Lock in every state.
    const unsigned int lock_mods[] = {0U, static_cast<unsigned>(Mod2Mask), static_cast<unsigned>(LockMask),
                                      static_cast<unsigned>(Mod2Mask | LockMask)};
    grab_conflict = false;
    for (unsigned int lock_mod : lock_mods) {
        XGrabKey(display_, shortcut_keycode_, shortcut_mask_ | lock_mod, root_, True,
                 GrabModeAsync, GrabModeAsync);
    }
    XSync(display_, False);

    if (grab_conflict) {
        // Another client (often an input method) owns the combination.
        for (unsigned int lock_mod : lock_mods) {
            XUngrabKey(display_, shortcut_keycode_, shortcut_mask_ | lock_mod, root_);
        }
        XSync(display_, False);
        std::println(stderr, "panel: shortcut key '{}' is grabbed by another client", shortcut_.key);
        shortcut_keycode_ = 0;
        return false;
    }
    return true;
}

std::vector<Monitor> X11Panel::monitors() const {
    std::vector<Monitor> result;
    if (!display_) return result;

    int event_base = 0, error_base = 0;
    if (XRRQueryExtension(display_, &event_base, &error_base)) {
        XRRScreenResources* resources = XRRGetScreenResourcesCurrent(display_, root_);
        if (resources) {
            RROutput primary_output = XRRGetOutputPrimary(display_, root_);
            for (int i = 0; i < resources->noutput; ++i) {
                RROutput output = resources->outputs[i];
                XRROutputInfo* output_info = XRRGetOutputInfo(display_, resources, output);
                if (!output_info) continue;

                if (output_info->connection == RR_Connected && output_info->crtc != None) {
                    XRRCrtcInfo* crtc_info = XRRGetCrtcInfo(display_, resources, output_info->crtc);
                    if (crtc_info) {
                        result.push_back({
                            .bounds = {crtc_info->x, crtc_info->y,
                                       static_cast<int>(crtc_info->width),
                                       static_cast<int>(crtc_info->height)},
                            .primary = output == primary_output,
                            .name = output_info->name ? output_info->name : "Unknown",
                        });
                        XRRFreeCrtcInfo(crtc_info);
                    }
                }
                XRRFreeOutputInfo(output_info);
            }
            XRRFreeScreenResources(resources);
        }
    }

    if (result.empty()) {
        int screen = DefaultScreen(display_);
        result.push_back({
            .bounds = {0, 0, DisplayWidth(display_, screen), DisplayHeight(display_, screen)},
            .primary = true,
            .name = "default",
        });
    }
    return result;
}

void X11Panel::set_geometry(const Geometry& geometry) {
    if (!geometry.valid()) return;
    bool width_changed = geometry.width != geometry_.width;
    geometry_ = geometry;
    if (!display_) return;

    XMoveResizeWindow(display_, window_, geometry_.x, geometry_.y,
                      static_cast<unsigned>(geometry_.width), static_cast<unsigned>(geometry_.height));
    if (width_changed) rewrap();
    redraw();
}

void X11Panel::show() {
    visible_ = true;
    if (!display_) return;
    XMapRaised(display_, window_);
    redraw();
}

void X11Panel::hide() {
    visible_ = false;
    dragging_ = false;
    if (!display_) return;
    if (pressed_) {
        XUngrabPointer(display_, CurrentTime);
        pressed_ = false;
    }
    XUnmapWindow(display_, window_);
    XFlush(display_);
}

void X11Panel::set_app_label(const std::string& text) {
    app_label_ = text;
    redraw();
}

void X11Panel::set_documentation(const std::string& text) {
    documentation_ = text;
    scroll_ = 0;
    rewrap();
    redraw();
}

void X11Panel::show_doc_prompt(const std::string& app_name) {
    prompt_app_ = app_name;
    redraw();
}

void X11Panel::hide_doc_prompt() {
    prompt_app_.clear();
    redraw();
}

void X11Panel::set_auto_position(bool enabled) {
    auto_position_ = enabled;
    redraw();
}

int X11Panel::line_height() const {
    return font_ ? font_->ascent + font_->descent + 2 : 14;
}

int X11Panel::visible_doc_lines() const {
    // Input row, label row and button row sit above the documentation.
    int available = geometry_.height - 2 * PADDING - 3 * line_height();
    return std::max(available / line_height(), 1);
}

void X11Panel::rewrap() {
    int char_width = font_ ? std::max<int>(font_->max_bounds.width, 1) : 6;
    auto columns = static_cast<size_t>(std::max((geometry_.width - 2 * PADDING) / char_width, 1));
    doc_lines_ = text::wrap_lines(documentation_, columns);
    int max_scroll = std::max(static_cast<int>(doc_lines_.size()) - visible_doc_lines(), 0);
    scroll_ = std::clamp(scroll_, 0, max_scroll);
}

unsigned long X11Panel::argb(unsigned r, unsigned g, unsigned b) const {
    if (!has_argb_) return (r << 16) | (g << 8) | b;
    // ARGB visuals expect premultiplied alpha.
    auto a = static_cast<unsigned>(transparency_ * 255.0);
    return (static_cast<unsigned long>(a) << 24) | ((r * a / 255) << 16) | ((g * a / 255) << 8) |
           (b * a / 255);
}

void X11Panel::redraw() {
    if (!display_ || !visible_) return;

    const int lh = line_height();
    const int ascent = font_ ? font_->ascent : 11;
    auto draw = [&](int x, int row_y, const std::string& s, unsigned long color) {
        XSetForeground(display_, gc_, color);
        XDrawString(display_, window_, gc_, x, row_y + ascent, s.data(), static_cast<int>(s.size()));
    };
    auto text_width = [&](const std::string& s) {
        return font_ ? XTextWidth(font_, s.data(), static_cast<int>(s.size()))
                     : static_cast<int>(s.size()) * 6;
    };

    XSetForeground(display_, gc_, argb(0x20, 0x20, 0x28));
    XFillRectangle(display_, window_, gc_, 0, 0, static_cast<unsigned>(geometry_.width),
                   static_cast<unsigned>(geometry_.height));

    int y = PADDING;

    // Command input
    XSetForeground(display_, gc_, argb(0x38, 0x38, 0x44));
    XFillRectangle(display_, window_, gc_, PADDING, y - 1,
                   static_cast<unsigned>(geometry_.width - 2 * PADDING), static_cast<unsigned>(lh));
    draw(PADDING + 2, y, "> " + input_ + "_", argb(0xff, 0xff, 0xff));
    y += lh;

    draw(PADDING, y, app_label_, argb(0xa0, 0xc8, 0xff));
    y += lh;

    // Buttons
    int x = PADDING;
    if (!prompt_app_.empty()) {
        auto label = std::format("[Load Docs for {}]", prompt_app_);
        load_button_ = {x, y, text_width(label), lh};
        draw(x, y, label, argb(0xff, 0xd0, 0x60));
        x += load_button_.width + PADDING;
    } else {
        load_button_ = {};
    }
    auto auto_label = std::format("[Auto-Position: {}]", auto_position_ ? "ON" : "OFF");
    auto_button_ = {x, y, text_width(auto_label), lh};
    draw(x, y, auto_label, auto_position_ ? argb(0x80, 0xe0, 0x80) : argb(0xc0, 0xc0, 0xc0));
    y += lh;

    // Documentation
    int rows = visible_doc_lines();
    for (int i = 0; i < rows && scroll_ + i < static_cast<int>(doc_lines_.size()); i++) {
        draw(PADDING, y, doc_lines_[static_cast<size_t>(scroll_ + i)], argb(0xe8, 0xe8, 0xe8));
        y += lh;
    }

    XFlush(display_);
}

void X11Panel::scroll(int lines) {
    int max_scroll = std::max(static_cast<int>(doc_lines_.size()) - visible_doc_lines(), 0);
    scroll_ = std::clamp(scroll_ + lines, 0, max_scroll);
    redraw();
}

void X11Panel::process_events() {
    if (!display_) return;

    while (XPending(display_) > 0) {
        XEvent ev;
        XNextEvent(display_, &ev);

        switch (ev.type) {
            case Expose:
                if (ev.xexpose.count == 0) redraw();
                break;
            case ButtonPress:
                on_button_press(ev.xbutton);
                break;
            case ButtonRelease:
                on_button_release(ev.xbutton);
                break;
            case MotionNotify:
                on_motion(ev.xmotion);
                break;
            case KeyPress:
                on_key_press(ev.xkey);
                break;
            default:
                break;
        }
    }
}

void X11Panel::on_button_press(const XButtonEvent& ev) {
    if (ev.button == Button4) {
        scroll(-3);
        return;
    }
    if (ev.button == Button5) {
        scroll(3);
        return;
    }
    if (ev.button != Button1) return;

    // Override-redirect windows never get focus from the window manager.
    XSetInputFocus(display_, window_, RevertToParent, CurrentTime);

    if (load_button_.contains(ev.x, ev.y)) {
        if (callbacks_.load_docs) callbacks_.load_docs();
        return;
    }
    if (auto_button_.contains(ev.x, ev.y)) {
        if (callbacks_.toggle_auto_position) callbacks_.toggle_auto_position();
        return;
    }

    pressed_ = true;
    press_root_x_ = ev.x_root;
    press_root_y_ = ev.y_root;
    drag_offset_x_ = ev.x_root - geometry_.x;
    drag_offset_y_ = ev.y_root - geometry_.y;
    XGrabPointer(display_, window_, False, ButtonReleaseMask | PointerMotionMask,
                 GrabModeAsync, GrabModeAsync, None, None, CurrentTime);
}

void X11Panel::on_motion(const XMotionEvent& ev) {
    if (!pressed_) return;

    if (!dragging_) {
        if (std::abs(ev.x_root - press_root_x_) < DRAG_THRESHOLD &&
            std::abs(ev.y_root - press_root_y_) < DRAG_THRESHOLD) {
            return;
        }
        dragging_ = true;
    }

    geometry_.x = ev.x_root - drag_offset_x_;
    geometry_.y = ev.y_root - drag_offset_y_;
    XMoveWindow(display_, window_, geometry_.x, geometry_.y);
    XFlush(display_);
}

void X11Panel::on_button_release(const XButtonEvent& ev) {
    if (ev.button != Button1 || !pressed_) return;

    XUngrabPointer(display_, CurrentTime);
    pressed_ = false;
    if (dragging_) {
        dragging_ = false;
        if (callbacks_.drag_finished) callbacks_.drag_finished();
    }
}

void X11Panel::on_key_press(XKeyEvent& ev) {
    constexpr unsigned int relevant = ShiftMask | ControlMask | Mod1Mask | Mod4Mask;
    if (shortcut_keycode_ != 0 && ev.keycode == shortcut_keycode_ &&
        (ev.state & relevant) == shortcut_mask_) {
        if (visible_) {
            hide();
        } else {
            show();
        }
        return;
    }

    char buf[32];
    KeySym keysym = NoSymbol;
    int len = XLookupString(&ev, buf, sizeof(buf), &keysym, nullptr);

    switch (keysym) {
        case XK_Return:
        case XK_KP_Enter: {
            std::string command(text::trim(input_));
            input_.clear();
            if (!command.empty() && callbacks_.command_entered) {
                callbacks_.command_entered(command);
            }
            break;
        }
        case XK_BackSpace:
            if (!input_.empty()) input_.pop_back();
            break;
        case XK_Escape:
            input_.clear();
            break;
        case XK_Page_Up:
            scroll(-visible_doc_lines());
            return;
        case XK_Page_Down:
            scroll(visible_doc_lines());
            return;
        default:
            for (int i = 0; i < len; i++) {
                auto c = static_cast<unsigned char>(buf[i]);
                if (std::isprint(c)) input_.push_back(static_cast<char>(c));
            }
            break;
    }
    redraw();
}
