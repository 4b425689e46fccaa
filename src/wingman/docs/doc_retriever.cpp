#include "docs/doc_retriever.hpp"

#include "docs/help_source.hpp"
#include "docs/man_source.hpp"
#include "docs/online_source.hpp"
#include "docs/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <format>
#include <print>

std::string Documentation::formatted() const {
    return docs::format_documentation(title, content);
}

DocRetriever::DocRetriever(std::vector<std::unique_ptr<DocSource>> sources)
    : sources_(std::move(sources)) {}

std::vector<std::unique_ptr<DocSource>> DocRetriever::make_sources(const Config::Docs& config) {
    std::vector<std::unique_ptr<DocSource>> sources;
    for (const auto& name : config.sources) {
        if (name == "man") {
            sources.push_back(std::make_unique<ManSource>());
        } else if (name == "help") {
            sources.push_back(std::make_unique<HelpSource>(
                std::chrono::milliseconds(config.help_timeout_ms)));
        } else if (name == "online") {
            sources.push_back(std::make_unique<OnlineSource>(config.url_patterns));
        } else {
            std::println(stderr, "docs: unknown source '{}', skipped", name);
        }
    }
    return sources;
}

std::expected<Documentation, std::string> DocRetriever::lookup(const std::string& command) {
    if (!docs::valid_command(command)) {
        return std::unexpected("Invalid command: " + command);
    }

    for (auto& source : sources_) {
        auto text = source->fetch(command);
        if (!text) continue;

        return Documentation{
            .command = command,
            .source = std::string(source->name()),
            .title = source->title_for(command),
            .content = std::move(*text),
        };
    }
    return std::unexpected("No documentation found for " + command);
}

std::string DocRetriever::get_documentation(const std::string& command) {
    auto doc = lookup(command);
    if (!doc) return doc.error();
    return doc->formatted();
}

std::vector<std::string> DocRetriever::source_names() const {
    std::vector<std::string> names;
    for (auto& s : sources_) names.emplace_back(s->name());
    return names;
}

namespace docs {

std::string format_documentation(std::string_view title, std::string_view content) {
    return std::format("--- {} ---\n\n{}", title, content);
}

bool valid_command(std::string_view command) {
    if (command.empty() || command.front() == '-') return false;
    return std::ranges::none_of(command, [](unsigned char c) {
        return std::isspace(c) || std::iscntrl(c);
    });
}

std::string clean_app_name(std::string_view app_name) {
    auto name = text::trim(app_name);

    auto space = name.find_first_of(" \t");
    if (space != std::string_view::npos) name = name.substr(0, space);

    auto slash = name.rfind('/');
    if (slash != std::string_view::npos) name = name.substr(slash + 1);

    auto dot = name.find('.');
    if (dot != std::string_view::npos) name = name.substr(0, dot);

    return std::string(name);
}

bool is_ignored(std::string_view app_name, std::span<const std::string> ignored_terms) {
    auto lower = text::to_lower(app_name);
    return std::ranges::any_of(ignored_terms, [&](const std::string& term) {
        return !term.empty() && lower.find(text::to_lower(term)) != std::string::npos;
    });
}

} // namespace docs
