#pragma once

#include "config.hpp"
#include "docs/doc_source.hpp"

#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

struct Documentation {
    std::string command;
    std::string source; // name of the DocSource that answered
    std::string title;
    std::string content;

    std::string formatted() const;
};

class DocRetriever {
public:
    explicit DocRetriever(std::vector<std::unique_ptr<DocSource>> sources);

    // Builds the sources named in the config, in order.
    static std::vector<std::unique_ptr<DocSource>> make_sources(const Config::Docs& config);

    // First source that has documentation for the command wins.
    std::expected<Documentation, std::string> lookup(const std::string& command);

    // Formatted documentation, or a message saying why there is none.
    std::string get_documentation(const std::string& command);

    std::vector<std::string> source_names() const;

private:
    std::vector<std::unique_ptr<DocSource>> sources_;
};

namespace docs {

std::string format_documentation(std::string_view title, std::string_view content);

// Rejects names that would be read as options or are not a single word.
bool valid_command(std::string_view command);

// "/usr/bin/vim file.txt" -> "vim", "code.desktop" -> "code".
std::string clean_app_name(std::string_view app_name);

// Case-insensitive substring match against the ignore list.
bool is_ignored(std::string_view app_name, std::span<const std::string> ignored_terms);

} // namespace docs
