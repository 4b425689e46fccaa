#pragma once

#include "docs/doc_source.hpp"

#include <chrono>

// Runs `<command> --help`, then `<command> -h`.
class HelpSource : public DocSource {
public:
    explicit HelpSource(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

    std::string_view name() const override { return "help"; }
    std::string title_for(const std::string& command) const override { return "Help for " + command; }
    std::expected<std::string, std::string> fetch(const std::string& command) override;

private:
    std::chrono::milliseconds timeout_;
};
