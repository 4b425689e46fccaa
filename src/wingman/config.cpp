#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        // Flat keys written by earlier releases.
        if (j.contains("screen_position")) cfg.panel.position = j["screen_position"].get<std::string>();
        if (j.contains("transparency")) cfg.panel.transparency = j["transparency"].get<double>();
        if (j.contains("doc_sources")) cfg.docs.sources = j["doc_sources"].get<std::vector<std::string>>();
        if (j.contains("url_patterns")) {
            cfg.docs.url_patterns = j["url_patterns"].get<std::map<std::string, std::string>>();
        }

        if (j.contains("panel")) {
            auto& p = j["panel"];
            if (p.contains("position")) cfg.panel.position = p["position"].get<std::string>();
            if (p.contains("transparency")) cfg.panel.transparency = p["transparency"].get<double>();
            if (p.contains("width")) cfg.panel.width = p["width"].get<int>();
            if (p.contains("height")) cfg.panel.height = p["height"].get<int>();
            if (p.contains("min_width")) cfg.panel.min_width = p["min_width"].get<int>();
            if (p.contains("max_width")) cfg.panel.max_width = p["max_width"].get<int>();
            if (p.contains("auto_position")) cfg.panel.auto_position = p["auto_position"].get<bool>();
        }

        if (j.contains("tracking")) {
            auto& t = j["tracking"];
            if (t.contains("backend")) cfg.tracking.backend = t["backend"].get<std::string>();
            if (t.contains("poll_interval_ms")) cfg.tracking.poll_interval_ms = t["poll_interval_ms"].get<uint32_t>();
            if (t.contains("stable_polls")) cfg.tracking.stable_polls = t["stable_polls"].get<int>();
            if (t.contains("terminals")) cfg.tracking.terminals = t["terminals"].get<std::vector<std::string>>();
        }

        if (j.contains("docs")) {
            auto& d = j["docs"];
            if (d.contains("sources")) cfg.docs.sources = d["sources"].get<std::vector<std::string>>();
            if (d.contains("url_patterns")) {
                cfg.docs.url_patterns = d["url_patterns"].get<std::map<std::string, std::string>>();
            }
            if (d.contains("auto_prompt_delay_ms")) {
                cfg.docs.auto_prompt_delay_ms = d["auto_prompt_delay_ms"].get<uint32_t>();
            }
            if (d.contains("help_timeout_ms")) cfg.docs.help_timeout_ms = d["help_timeout_ms"].get<uint32_t>();
            if (d.contains("ignored_terms")) {
                cfg.docs.ignored_terms = d["ignored_terms"].get<std::vector<std::string>>();
            }
        }

        if (j.contains("shortcut")) cfg.shortcut = j["shortcut"].get<std::string>();

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    return cfg;
}

Config Config::load_default() {
    auto path = default_path();
    if (path.empty()) return Config{};

    if (fs::exists(path)) {
        return load(path);
    }
    return Config{};
}

std::string Config::default_path() {
    auto dir = platform::config_dir();
    if (dir.empty()) return {};
    return (fs::path(dir) / "config.json").string();
}

bool Config::save(const std::string& path) const {
    json j = {
        {"panel", {
            {"position", panel.position},
            {"transparency", panel.transparency},
            {"width", panel.width},
            {"height", panel.height},
            {"min_width", panel.min_width},
            {"max_width", panel.max_width},
            {"auto_position", panel.auto_position},
        }},
        {"tracking", {
            {"backend", tracking.backend},
            {"poll_interval_ms", tracking.poll_interval_ms},
            {"stable_polls", tracking.stable_polls},
            {"terminals", tracking.terminals},
        }},
        {"docs", {
            {"sources", docs.sources},
            {"url_patterns", docs.url_patterns},
            {"auto_prompt_delay_ms", docs.auto_prompt_delay_ms},
            {"help_timeout_ms", docs.help_timeout_ms},
            {"ignored_terms", docs.ignored_terms},
        }},
        {"shortcut", shortcut},
    };

    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);
    if (ec) {
        std::println(stderr, "config: cannot create {}: {}", parent.string(), ec.message());
        return false;
    }

    std::ofstream f(path, std::ios::trunc);
    if (!f.is_open()) {
        std::println(stderr, "config: cannot write {}", path);
        return false;
    }
    f << j.dump(4) << '\n';
    return f.good();
}
