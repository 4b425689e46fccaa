#include "platform/command_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <optional>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

namespace {

using Clock = std::chrono::steady_clock;

int exit_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno == EINTR) continue;
        return -1;
    }
    return exit_status(status);
}

// Empty when the child is still running at the deadline. A child may close
// stdout long before it exits.
std::optional<int> wait_child_until(pid_t pid, Clock::time_point deadline) {
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) return exit_status(status);
        if (r < 0 && errno != EINTR) return -1;
        if (Clock::now() >= deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace

std::expected<CommandResult, std::string> run_command(const std::vector<std::string>& argv,
                                                      const RunOptions& options) {
    if (argv.empty() || argv[0].empty()) {
        return std::unexpected("empty command");
    }

    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) < 0) {
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    // Closed on a successful exec; carries errno back when exec fails.
    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(errno));
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(exec_pipe[0]);
        ::close(exec_pipe[1]);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::close(out_pipe[0]);
        ::close(exec_pipe[0]);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        for (auto& [key, value] : options.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(exec_pipe[1]);

    int exec_errno = 0;
    ssize_t n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    ::close(exec_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::close(out_pipe[0]);
        wait_child(pid);
        return std::unexpected(argv[0] + ": " + std::strerror(exec_errno));
    }

    CommandResult result;
    auto deadline = Clock::now() + options.timeout;
    pollfd pfd{.fd = out_pipe[0], .events = POLLIN, .revents = 0};
    char buf[4096];
    bool timed_out = false;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) {
            timed_out = true;
            break;
        }

        ssize_t r = ::read(out_pipe[0], buf, sizeof(buf));
        if (r < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (r == 0) break;

        size_t room = options.max_output - std::min(options.max_output, result.output.size());
        result.output.append(buf, std::min(room, static_cast<size_t>(r)));
    }
    ::close(out_pipe[0]);

    std::optional<int> status;
    if (!timed_out) status = wait_child_until(pid, deadline);
    if (!status) {
        ::kill(pid, SIGKILL);
        wait_child(pid);
        return std::unexpected(argv[0] + ": timed out");
    }

    result.exit_code = *status;
    return result;
}

std::string find_executable(std::string_view name) {
    if (name.empty()) return {};

    if (name.find('/') != std::string_view::npos) {
        std::string path(name);
        return ::access(path.c_str(), X_OK) == 0 ? path : std::string{};
    }

    const char* path_env = std::getenv("PATH");
    std::string_view dirs = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (!dirs.empty()) {
        auto sep = dirs.find(':');
        auto dir = dirs.substr(0, sep);
        dirs = sep == std::string_view::npos ? std::string_view{} : dirs.substr(sep + 1);
        if (dir.empty()) continue;

        auto candidate = fs::path(dir) / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return {};
}

} // namespace platform
