#pragma once

#include "tracking/placement.hpp"
#include "tracking/window_info.hpp"

#include <functional>
#include <string>
#include <vector>

// The on-screen panel. Implementations own the window; WingmanCore decides
// where it goes and what it shows.
class Panel {
public:
    struct Callbacks {
        std::function<void(const std::string&)> command_entered;
        std::function<void()> load_docs;
        std::function<void()> toggle_auto_position;
        std::function<void()> drag_finished;
    };

    virtual ~Panel() = default;

    virtual void set_callbacks(Callbacks callbacks) = 0;

    virtual Geometry geometry() const = 0;
    virtual void set_geometry(const Geometry& geometry) = 0;
    virtual std::vector<Monitor> monitors() const = 0;

    virtual void show() = 0;
    virtual void hide() = 0;
    virtual bool visible() const = 0;

    virtual void set_app_label(const std::string& text) = 0;
    virtual void set_documentation(const std::string& text) = 0;
    virtual void show_doc_prompt(const std::string& app_name) = 0;
    virtual void hide_doc_prompt() = 0;
    virtual void set_auto_position(bool enabled) = 0;

    // True while the user drags the panel with the mouse.
    virtual bool is_being_moved() const = 0;
};
