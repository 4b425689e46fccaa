#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

struct Config {
    struct Panel {
        std::string position = "top"; // initial docking edge
        double transparency = 0.8;     // 0 = invisible, 1 = opaque
        int width = 600;               // docked width
        int height = 200;
        int min_width = 400;
        int max_width = 800;
        bool auto_position = true;
    } panel;

    struct Tracking {
        std::string backend = "auto"; // "auto", "sway", "hyprland" or "x11"
        uint32_t poll_interval_ms = 100;
        int stable_polls = 3;
        std::vector<std::string> terminals = {
            "gnome-terminal", "konsole", "xterm", "kitty", "alacritty", "foot", "wezterm"};
    } tracking;

    struct Docs {
        // "online" is opt-in: a search URL answers for any name.
        std::vector<std::string> sources = {"man", "help"};
        std::map<std::string, std::string> url_patterns = {
            {"default", "https://www.google.com/search?q={query}"}};
        uint32_t auto_prompt_delay_ms = 5000;
        uint32_t help_timeout_ms = 2000;
        std::vector<std::string> ignored_terms = {"wingman", "python", "main.py"};
    } docs;

    std::string shortcut = "<Control>+<space>";

    static Config load(const std::string& path);
    static Config load_default();
    static std::string default_path();

    bool save(const std::string& path) const;
};
