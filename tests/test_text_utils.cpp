#include <catch2/catch_test_macros.hpp>

#include "docs/text_utils.hpp"

#include <string>
#include <vector>

TEST_CASE("Text helpers", "[text]") {

    SECTION("Trim") {
        REQUIRE(text::trim("  ls \n") == "ls");
        REQUIRE(text::trim("\t\r\n ").empty());
        REQUIRE(text::trim("a b") == "a b");
    }

    SECTION("ToLower") {
        REQUIRE(text::to_lower("Firefox-ESR") == "firefox-esr");
    }

    SECTION("StripOverstrike") {
        // nroff bold "NAME" and underlined "ls"
        std::string bold = "N\bNA\bAM\bME\bE";
        std::string underline = "_\bl_\bs";
        REQUIRE(text::strip_overstrike(bold) == "NAME");
        REQUIRE(text::strip_overstrike(underline) == "ls");
        REQUIRE(text::strip_overstrike("plain text") == "plain text");
    }
}

TEST_CASE("HTML stripping", "[text]") {

    SECTION("TagsRemoved") {
        REQUIRE(text::strip_html("<b>grep</b> searches <i>files</i>") == "grep searches files");
    }

    SECTION("EntitiesDecoded") {
        REQUIRE(text::strip_html("a &lt;b&gt; &amp; &quot;c&quot; &#39;d&#39;") == "a <b> & \"c\" 'd'");
    }

    SECTION("ScriptAndStyleDropped") {
        auto out = text::strip_html(
            "<html><head><style>body { color: red; }</style>"
            "<script>var x = '<p>';</script></head>"
            "<body>Visible</body></html>");
        REQUIRE(out == "Visible");
    }

    SECTION("BlockTagsBreakLines") {
        auto out = text::strip_html("<p>first</p><p>second</p><div>third</div>line<br>break");
        REQUIRE(out == "first\n\nsecond\n\nthird\nline\nbreak");
    }

    SECTION("BlankLinesCollapsed") {
        auto out = text::strip_html("one\n\n\n\n\ntwo   \n");
        REQUIRE(out == "one\n\ntwo");
    }
}

TEST_CASE("Line wrapping", "[text]") {

    SECTION("ShortLinesUntouched") {
        REQUIRE(text::wrap_lines("ls\ncat", 80) == std::vector<std::string>{"ls", "cat"});
    }

    SECTION("BreaksAtLastSpace") {
        REQUIRE(text::wrap_lines("list directory contents", 10) ==
                std::vector<std::string>{"list", "directory", "contents"});
    }

    SECTION("HardBreakWithoutSpace") {
        REQUIRE(text::wrap_lines("abcdefghij", 4) == std::vector<std::string>{"abcd", "efgh", "ij"});
    }

    SECTION("TabsExpand") {
        REQUIRE(text::wrap_lines("a\tb", 80) == std::vector<std::string>{"a       b"});
    }

    SECTION("EmptyLinesKept") {
        REQUIRE(text::wrap_lines("a\n\nb", 80) == std::vector<std::string>{"a", "", "b"});
        REQUIRE(text::wrap_lines("", 80) == std::vector<std::string>{""});
    }

    SECTION("ZeroColumnsStillTerminates") {
        REQUIRE(text::wrap_lines("ab", 0) == std::vector<std::string>{"a", "b"});
    }
}
