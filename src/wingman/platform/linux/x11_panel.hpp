#pragma once

#include "platform/panel.hpp"
#include "shortcut.hpp"

#include <X11/Xlib.h>
#include <string>
#include <vector>

// Translucent override-redirect window drawn with core Xlib text.
class X11Panel : public Panel {
public:
    X11Panel(double transparency, Shortcut shortcut);
    ~X11Panel() override;

    X11Panel(const X11Panel&) = delete;
    X11Panel& operator=(const X11Panel&) = delete;

    // Fails only without a display or font. A shortcut that cannot be
    // grabbed is reported and left unbound.
    bool open();
    bool shortcut_bound() const { return shortcut_keycode_ != 0; }

    // X connection fd for the event loop, -1 before open().
    int fd() const;
    void process_events();

    void set_callbacks(Callbacks callbacks) override { callbacks_ = std::move(callbacks); }

    Geometry geometry() const override { return geometry_; }
    void set_geometry(const Geometry& geometry) override;
    std::vector<Monitor> monitors() const override;

    void show() override;
    void hide() override;
    bool visible() const override { return visible_; }

    void set_app_label(const std::string& text) override;
    void set_documentation(const std::string& text) override;
    void show_doc_prompt(const std::string& app_name) override;
    void hide_doc_prompt() override;
    void set_auto_position(bool enabled) override;

    bool is_being_moved() const override { return dragging_; }

private:
    struct Button {
        int x = 0, y = 0, width = 0, height = 0;
        bool contains(int px, int py) const {
            return px >= x && px < x + width && py >= y && py < y + height;
        }
    };

    void create_window();
    bool grab_shortcut();
    void rewrap();
    void redraw();
    int line_height() const;
    int visible_doc_lines() const;
    unsigned long argb(unsigned r, unsigned g, unsigned b) const;

    void on_button_press(const XButtonEvent& ev);
    void on_button_release(const XButtonEvent& ev);
    void on_motion(const XMotionEvent& ev);
    void on_key_press(XKeyEvent& ev);
    void scroll(int lines);

    static constexpr int PADDING = 6;
    static constexpr int DRAG_THRESHOLD = 4;

    double transparency_;
    Shortcut shortcut_;
    Callbacks callbacks_;

    Display* display_ = nullptr;
    Window root_ = 0;
    Window window_ = 0;
    Colormap colormap_ = 0;
    bool has_argb_ = false;
    GC gc_ = nullptr;
    XFontStruct* font_ = nullptr;

    KeyCode shortcut_keycode_ = 0;
    unsigned int shortcut_mask_ = 0;

    Geometry geometry_{0, 0, 600, 200};
    bool visible_ = false;

    std::string input_;
    std::string app_label_;
    std::string prompt_app_;
    bool auto_position_ = true;
    std::string documentation_;
    std::vector<std::string> doc_lines_;
    int scroll_ = 0;

    Button load_button_;
    Button auto_button_;

    bool pressed_ = false;
    bool dragging_ = false;
    int press_root_x_ = 0, press_root_y_ = 0;
    int drag_offset_x_ = 0, drag_offset_y_ = 0;
};
