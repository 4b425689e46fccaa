#include "docs/man_source.hpp"

#include "docs/text_utils.hpp"
#include "platform/command_runner.hpp"

#include <chrono>

std::expected<std::string, std::string> ManSource::fetch(const std::string& command) {
    auto res = platform::run_command({"man", command}, {
        .timeout = std::chrono::milliseconds(5000),
        .env = {{"MANPAGER", "cat"}, {"PAGER", "cat"}, {"MANWIDTH", "100"}},
    });
    if (!res) return std::unexpected(res.error());
    if (res->exit_code != 0) {
        return std::unexpected("man exited with code " + std::to_string(res->exit_code));
    }

    auto text = text::strip_overstrike(res->output);
    if (text::trim(text).empty()) return std::unexpected("empty man page");
    return text;
}
