#include "docs/text_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace text {

std::string_view trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string strip_overstrike(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '\b') {
            if (!out.empty()) out.pop_back();
            continue;
        }
        out.push_back(c);
    }
    return out;
}

namespace {

bool istarts_with(std::string_view s, size_t pos, std::string_view prefix) {
    if (s.size() - pos < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != prefix[i]) return false;
    }
    return true;
}

size_t ifind(std::string_view s, std::string_view needle, size_t from) {
    for (size_t i = from; i + needle.size() <= s.size(); i++) {
        if (istarts_with(s, i, needle)) return i;
    }
    return std::string_view::npos;
}

std::string collapse_blank_lines(const std::string& in) {
    std::string out;
    int newlines = 0;
    for (char c : in) {
        if (c == '\r') continue;
        if (c == '\n') {
            if (++newlines > 2) continue;
            // Drop trailing spaces before the line break.
            while (!out.empty() && (out.back() == ' ' || out.back() == '\t')) out.pop_back();
        } else if (c != ' ' && c != '\t') {
            newlines = 0;
        }
        out.push_back(c);
    }
    return std::string(trim(out));
}

} // namespace

std::string strip_html(std::string_view html) {
    static constexpr std::array<std::pair<std::string_view, std::string_view>, 6> entities{{
        {"&amp;", "&"}, {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"}, {"&nbsp;", " "},
    }};

    std::string out;
    out.reserve(html.size());

    size_t i = 0;
    while (i < html.size()) {
        char c = html[i];
        if (c == '<') {
            for (std::string_view block : {"script", "style"}) {
                if (istarts_with(html, i + 1, block)) {
                    auto close = ifind(html, std::string("</") + std::string(block), i);
                    i = close == std::string_view::npos ? html.size() : close;
                    break;
                }
            }
            auto end = html.find('>', i);
            if (end == std::string_view::npos) break;

            // Block-level tags end a line.
            if (istarts_with(html, i + 1, "br") || istarts_with(html, i + 1, "p") ||
                istarts_with(html, i + 1, "/p") || istarts_with(html, i + 1, "div") ||
                istarts_with(html, i + 1, "/div") || istarts_with(html, i + 1, "li") ||
                istarts_with(html, i + 1, "h") || istarts_with(html, i + 1, "/h") ||
                istarts_with(html, i + 1, "tr")) {
                out.push_back('\n');
            }
            i = end + 1;
            continue;
        }
        if (c == '&') {
            bool decoded = false;
            for (auto& [entity, value] : entities) {
                if (html.substr(i, entity.size()) == entity) {
                    out.append(value);
                    i += entity.size();
                    decoded = true;
                    break;
                }
            }
            if (decoded) continue;
        }
        out.push_back(c);
        i++;
    }

    return collapse_blank_lines(out);
}

std::vector<std::string> wrap_lines(std::string_view s, size_t columns) {
    columns = std::max<size_t>(columns, 1);
    std::vector<std::string> lines;

    size_t start = 0;
    while (start <= s.size()) {
        auto nl = s.find('\n', start);
        auto raw = s.substr(start, nl == std::string_view::npos ? std::string_view::npos : nl - start);

        std::string line;
        for (char c : raw) {
            if (c == '\t') {
                line.append(8 - line.size() % 8, ' ');
            } else if (c != '\r') {
                line.push_back(c);
            }
        }

        while (line.size() > columns) {
            auto cut = line.rfind(' ', columns);
            if (cut == std::string::npos || cut == 0) cut = columns;
            lines.push_back(line.substr(0, cut));
            auto next = line.find_first_not_of(' ', cut);
            line.erase(0, next == std::string::npos ? line.size() : next);
        }
        lines.push_back(std::move(line));

        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return lines;
}

} // namespace text
