#pragma once

#include "docs/doc_source.hpp"

class ManSource : public DocSource {
public:
    std::string_view name() const override { return "man"; }
    std::string title_for(const std::string& command) const override { return "Man page for " + command; }
    std::expected<std::string, std::string> fetch(const std::string& command) override;
};
