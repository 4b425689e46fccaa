#pragma once

#include "docs/doc_source.hpp"

#include <map>
#include <string>

// Fetches a documentation page over HTTP. Patterns are keyed by command
// name with "default" as fallback; "{query}" is replaced by the command.
class OnlineSource : public DocSource {
public:
    explicit OnlineSource(std::map<std::string, std::string> url_patterns);
    ~OnlineSource() override;

    OnlineSource(const OnlineSource&) = delete;
    OnlineSource& operator=(const OnlineSource&) = delete;

    std::string_view name() const override { return "online"; }
    std::string title_for(const std::string& command) const override { return "Online docs for " + command; }
    std::expected<std::string, std::string> fetch(const std::string& command) override;

    // URL for a command, or empty when no pattern applies.
    std::string url_for(const std::string& command) const;

private:
    std::map<std::string, std::string> url_patterns_;
};
