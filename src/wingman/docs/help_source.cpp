#include "docs/help_source.hpp"

#include "docs/text_utils.hpp"
#include "platform/command_runner.hpp"

HelpSource::HelpSource(std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

std::expected<std::string, std::string> HelpSource::fetch(const std::string& command) {
    std::string last_error = "no help output";

    for (const char* flag : {"--help", "-h"}) {
        auto res = platform::run_command({command, flag}, {.timeout = timeout_});
        if (!res) {
            last_error = res.error();
            continue;
        }
        if (res->exit_code != 0) {
            last_error = command + " " + flag + " exited with code " + std::to_string(res->exit_code);
            continue;
        }
        if (text::trim(res->output).empty()) continue;
        return std::move(res->output);
    }
    return std::unexpected(last_error);
}
