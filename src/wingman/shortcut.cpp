#include "shortcut.hpp"

#include "docs/text_utils.hpp"

#include <format>

namespace {

std::string_view strip_brackets(std::string_view token) {
    if (token.size() >= 2 && token.front() == '<' && token.back() == '>') {
        token.remove_prefix(1);
        token.remove_suffix(1);
    }
    return token;
}

uint8_t modifier_for(std::string_view name) {
    auto lower = text::to_lower(name);
    if (lower == "control" || lower == "ctrl" || lower == "primary") return Shortcut::Control;
    if (lower == "shift") return Shortcut::Shift;
    if (lower == "alt" || lower == "mod1" || lower == "meta") return Shortcut::Alt;
    if (lower == "super" || lower == "mod4" || lower == "win") return Shortcut::Super;
    return Shortcut::None;
}

} // namespace

std::expected<Shortcut, std::string> parse_shortcut(std::string_view combo) {
    Shortcut shortcut;
    std::string_view rest = text::trim(combo);
    if (rest.empty()) return std::unexpected("empty shortcut");

    while (!rest.empty()) {
        // '+' on its own is a key, not a separator.
        auto plus = rest.size() > 1 ? rest.find('+', 1) : std::string_view::npos;
        auto token = text::trim(rest.substr(0, plus));
        rest = plus == std::string_view::npos ? std::string_view{} : rest.substr(plus + 1);

        auto name = strip_brackets(token);
        if (name.empty()) return std::unexpected(std::format("empty key in '{}'", combo));

        if (rest.empty()) {
            if (modifier_for(name) != Shortcut::None) {
                return std::unexpected(std::format("shortcut '{}' has no key", combo));
            }
            shortcut.key = std::string(name);
            break;
        }

        auto mod = modifier_for(name);
        if (mod == Shortcut::None) {
            return std::unexpected(std::format("unknown modifier '{}'", name));
        }
        shortcut.modifiers |= mod;
    }
    return shortcut;
}
