#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace text {

std::string_view trim(std::string_view s);
std::string to_lower(std::string_view s);

// Removes nroff bold/underline sequences ("a\ba", "_\ba") left by man.
std::string strip_overstrike(std::string_view s);

// Drops tags, script and style blocks, decodes the common entities and
// collapses runs of blank lines.
std::string strip_html(std::string_view html);

// Splits text into display lines no wider than `columns`, breaking at the
// last space when there is one. Tabs expand to 8-column stops.
std::vector<std::string> wrap_lines(std::string_view s, size_t columns);

} // namespace text
