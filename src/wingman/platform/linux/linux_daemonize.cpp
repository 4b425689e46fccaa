#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

namespace {

void fork_and_exit_parent() {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        _exit(1);
    }
    if (pid > 0) _exit(0);
}

} // namespace

void daemonize() {
    fork_and_exit_parent();
    setsid();
    // Second fork: the session leader's child can never reacquire a terminal.
    fork_and_exit_parent();

    // History and socket stay private to the user.
    umask(077);
    if (chdir("/") < 0) _exit(1);

    if (!freopen("/dev/null", "r", stdin) ||
        !freopen("/dev/null", "w", stdout) ||
        !freopen("/dev/null", "w", stderr)) {
        _exit(1);
    }
}

} // namespace platform
