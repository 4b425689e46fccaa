#include <catch2/catch_test_macros.hpp>

#include "shortcut.hpp"

TEST_CASE("parse_shortcut", "[shortcut]") {

    SECTION("DefaultBinding") {
        auto s = parse_shortcut("<Control>+<space>");
        REQUIRE(s.has_value());
        REQUIRE(s->modifiers == Shortcut::Control);
        REQUIRE(s->key == "space");
    }

    SECTION("PlainNames") {
        auto s = parse_shortcut("Super+Shift+F1");
        REQUIRE(s.has_value());
        REQUIRE(s->modifiers == (Shortcut::Super | Shortcut::Shift));
        REQUIRE(s->key == "F1");
    }

    SECTION("ModifierAliasesCaseInsensitive") {
        auto a = parse_shortcut("ctrl+alt+h");
        auto b = parse_shortcut("<Primary>+<Mod1>+h");
        REQUIRE(a.has_value());
        REQUIRE(b.has_value());
        REQUIRE(*a == *b);
        REQUIRE(a->modifiers == (Shortcut::Control | Shortcut::Alt));
    }

    SECTION("KeyCaseKept") {
        auto s = parse_shortcut("Control+Return");
        REQUIRE(s.has_value());
        REQUIRE(s->key == "Return");
    }

    SECTION("WhitespaceAroundTokens") {
        auto s = parse_shortcut("  Control + space ");
        REQUIRE(s.has_value());
        REQUIRE(s->modifiers == Shortcut::Control);
        REQUIRE(s->key == "space");
    }

    SECTION("BareKey") {
        auto s = parse_shortcut("F12");
        REQUIRE(s.has_value());
        REQUIRE(s->modifiers == Shortcut::None);
        REQUIRE(s->key == "F12");
    }

    SECTION("PlusAsKey") {
        auto s = parse_shortcut("Control++");
        REQUIRE(s.has_value());
        REQUIRE(s->modifiers == Shortcut::Control);
        REQUIRE(s->key == "+");
    }

    SECTION("Errors") {
        REQUIRE_FALSE(parse_shortcut("").has_value());
        REQUIRE_FALSE(parse_shortcut("   ").has_value());
        REQUIRE_FALSE(parse_shortcut("Control+").has_value());
        REQUIRE_FALSE(parse_shortcut("Control+Shift").has_value());
        REQUIRE_FALSE(parse_shortcut("<>+space").has_value());

        auto bad = parse_shortcut("Hyper+space");
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error() == "unknown modifier 'Hyper'");
    }
}
