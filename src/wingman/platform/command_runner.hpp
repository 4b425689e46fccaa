#pragma once

#include <chrono>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace platform {

struct CommandResult {
    int exit_code = -1;
    std::string output; // stdout, truncated to RunOptions::max_output
};

struct RunOptions {
    std::chrono::milliseconds timeout{5000};
    std::vector<std::pair<std::string, std::string>> env; // added to the child's environment
    size_t max_output = 4 * 1024 * 1024;
};

// Runs argv[0] (searched in $PATH) without a shell and captures stdout.
// Fails when the program cannot be started or exceeds the timeout; a
// non-zero exit status is reported through CommandResult::exit_code.
std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      const RunOptions& options = {});

// Absolute path of an executable found in $PATH, or empty.
std::string find_executable(std::string_view name);

} // namespace platform
