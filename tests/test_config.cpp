#include <catch2/catch_test_macros.hpp>

#include "config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

// RAII temp file that auto-deletes.
struct TmpFile {
    std::string path;

    explicit TmpFile(const std::string& content) {
        path = std::filesystem::temp_directory_path() / "wingman_test_config_XXXXXX";
        // mkstemp needs a mutable char*
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        REQUIRE(::write(fd, content.data(), content.size()) == static_cast<ssize_t>(content.size()));
        ::close(fd);
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

} // namespace

TEST_CASE("Config", "[config]") {

    SECTION("DefaultValues") {
        Config cfg;
        REQUIRE(cfg.panel.position == "top");
        REQUIRE(cfg.panel.transparency == 0.8);
        REQUIRE(cfg.panel.min_width == 400);
        REQUIRE(cfg.panel.max_width == 800);
        REQUIRE(cfg.panel.height == 200);
        REQUIRE(cfg.panel.auto_position);
        REQUIRE(cfg.tracking.backend == "auto");
        REQUIRE(cfg.tracking.poll_interval_ms == 100);
        REQUIRE(cfg.tracking.stable_polls == 3);
        REQUIRE(cfg.docs.sources == std::vector<std::string>{"man", "help"});
        REQUIRE(cfg.docs.url_patterns.at("default") == "https://www.google.com/search?q={query}");
        REQUIRE(cfg.docs.auto_prompt_delay_ms == 5000);
        REQUIRE(cfg.docs.ignored_terms == std::vector<std::string>{"wingman", "python", "main.py"});
        REQUIRE(cfg.shortcut == "<Control>+<space>");
    }

    SECTION("LoadFullConfig") {
        TmpFile f(R"({
            "panel": {
                "position": "left",
                "transparency": 0.5,
                "width": 700,
                "height": 250,
                "min_width": 300,
                "max_width": 900,
                "auto_position": false
            },
            "tracking": {
                "backend": "sway",
                "poll_interval_ms": 250,
                "stable_polls": 5,
                "terminals": ["foot"]
            },
            "docs": {
                "sources": ["help", "man"],
                "url_patterns": { "git": "https://git-scm.com/docs/{query}" },
                "auto_prompt_delay_ms": 1000,
                "help_timeout_ms": 500,
                "ignored_terms": ["code"]
            },
            "shortcut": "<Super>+w"
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.panel.position == "left");
        REQUIRE(cfg.panel.transparency == 0.5);
        REQUIRE(cfg.panel.width == 700);
        REQUIRE(cfg.panel.height == 250);
        REQUIRE(cfg.panel.min_width == 300);
        REQUIRE(cfg.panel.max_width == 900);
        REQUIRE_FALSE(cfg.panel.auto_position);
        REQUIRE(cfg.tracking.backend == "sway");
        REQUIRE(cfg.tracking.poll_interval_ms == 250);
        REQUIRE(cfg.tracking.stable_polls == 5);
        REQUIRE(cfg.tracking.terminals == std::vector<std::string>{"foot"});
        REQUIRE(cfg.docs.sources == std::vector<std::string>{"help", "man"});
        REQUIRE(cfg.docs.url_patterns.size() == 1);
        REQUIRE(cfg.docs.url_patterns.at("git") == "https://git-scm.com/docs/{query}");
        REQUIRE(cfg.docs.auto_prompt_delay_ms == 1000);
        REQUIRE(cfg.docs.help_timeout_ms == 500);
        REQUIRE(cfg.docs.ignored_terms == std::vector<std::string>{"code"});
        REQUIRE(cfg.shortcut == "<Super>+w");
    }

    SECTION("LoadLegacyFlatKeys") {
        TmpFile f(R"({
            "screen_position": "bottom",
            "transparency": 0.6,
            "doc_sources": ["man"],
            "url_patterns": { "default": "https://example.org/?q={query}" },
            "shortcut": "<Control>+<Alt>+d"
        })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.panel.position == "bottom");
        REQUIRE(cfg.panel.transparency == 0.6);
        REQUIRE(cfg.docs.sources == std::vector<std::string>{"man"});
        REQUIRE(cfg.docs.url_patterns.at("default") == "https://example.org/?q={query}");
        REQUIRE(cfg.shortcut == "<Control>+<Alt>+d");
    }

    SECTION("SectionsOverrideFlatKeys") {
        TmpFile f(R"({ "screen_position": "bottom", "panel": { "position": "right" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.panel.position == "right");
    }

    SECTION("LoadPartialConfig") {
        TmpFile f(R"({ "tracking": { "backend": "x11" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.tracking.backend == "x11");
        // Other fields retain defaults
        REQUIRE(cfg.tracking.stable_polls == 3);
        REQUIRE(cfg.panel.position == "top");
        REQUIRE(cfg.docs.sources.size() == 3);
    }

    SECTION("LoadInvalidJson") {
        TmpFile f("not json {{{");

        auto cfg = Config::load(f.path);
        // Falls back to defaults
        REQUIRE(cfg.panel.position == "top");
        REQUIRE(cfg.tracking.poll_interval_ms == 100);
    }

    SECTION("LoadWrongTypes") {
        TmpFile f(R"({ "panel": { "width": "wide" } })");

        auto cfg = Config::load(f.path);
        REQUIRE(cfg.panel.width == 600);
    }

    SECTION("LoadMissingFile") {
        auto cfg = Config::load("/tmp/wingman_test_nonexistent_config_file.json");
        REQUIRE(cfg.panel.position == "top");
        REQUIRE(cfg.tracking.backend == "auto");
    }

    SECTION("SaveThenLoad") {
        auto dir = std::filesystem::temp_directory_path() /
                   ("wingman_test_save_" + std::to_string(getpid()));
        auto path = (dir / "nested" / "config.json").string();

        Config cfg;
        cfg.panel.position = "right";
        cfg.panel.transparency = 0.3;
        cfg.tracking.terminals = {"kitty"};
        cfg.docs.url_patterns["man"] = "https://man7.org/{query}";
        cfg.shortcut = "<Super>+<space>";
        REQUIRE(cfg.save(path));

        auto loaded = Config::load(path);
        REQUIRE(loaded.panel.position == "right");
        REQUIRE(loaded.panel.transparency == 0.3);
        REQUIRE(loaded.tracking.terminals == std::vector<std::string>{"kitty"});
        REQUIRE(loaded.docs.url_patterns == cfg.docs.url_patterns);
        REQUIRE(loaded.shortcut == "<Super>+<space>");

        std::filesystem::remove_all(dir);
    }
}
