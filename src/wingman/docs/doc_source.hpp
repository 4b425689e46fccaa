#pragma once

#include <expected>
#include <string>
#include <string_view>

class DocSource {
public:
    virtual ~DocSource() = default;
    virtual std::string_view name() const = 0;
    // Heading shown above the fetched text, e.g. "Man page for ls".
    virtual std::string title_for(const std::string& command) const = 0;
    virtual std::expected<std::string, std::string> fetch(const std::string& command) = 0;
};
