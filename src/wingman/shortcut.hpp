#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// A global key combination such as "<Control>+<space>" or "Super+F1".
struct Shortcut {
    enum Modifier : uint8_t {
        None = 0,
        Control = 1 << 0,
        Shift = 1 << 1,
        Alt = 1 << 2,
        Super = 1 << 3,
    };

    uint8_t modifiers = None;
    std::string key; // keysym name, e.g. "space", "F1", "a"

    bool operator==(const Shortcut&) const = default;
};

std::expected<Shortcut, std::string> parse_shortcut(std::string_view combo);
