#include "platform/linux/linux_event_loop.hpp"

#include "platform/linux/hyprland_tracker.hpp"
#include "platform/linux/sway_tracker.hpp"
#include "platform/linux/x11_tracker.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

namespace {

std::vector<std::unique_ptr<WindowTracker>> make_trackers(const Config::Tracking& config,
                                                          const ProcessInspector& inspector) {
    std::vector<std::unique_ptr<WindowTracker>> trackers;
    for (const auto& name : tracking::backend_order(SessionEnvironment::from_process(), config.backend)) {
        if (name == "sway") {
            trackers.push_back(std::make_unique<SwayTracker>());
        } else if (name == "hyprland") {
            trackers.push_back(std::make_unique<HyprlandTracker>());
        } else if (name == "x11") {
            trackers.push_back(std::make_unique<X11Tracker>(inspector, config.terminals));
        }
    }
    return trackers;
}

} // namespace

LinuxEventLoop::LinuxEventLoop(Config config, Shortcut shortcut, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      tracker_(make_trackers(config_.tracking, inspector_)),
      panel_(config_.panel.transparency, std::move(shortcut)),
      core_(config_, verbose_, tracker_, panel_, ipc_server_,
            // DocSourceFactory
            [](const Config::Docs& docs) { return DocRetriever::make_sources(docs); },
            // NotifyCallback
            [this]() {
                uint64_t val = 1;
                if (::write(worker_event_fd_, &val, sizeof(val)) < 0) {
                    std::println(stderr, "eventfd write failed: {}", std::strerror(errno));
                }
            },
            // QuitCallback
            [this]() { request_stop(); }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
    if (worker_event_fd_ >= 0) ::close(worker_event_fd_);
}

bool LinuxEventLoop::init() {
    // Panel (required)
    if (!panel_.open()) {
        std::println(stderr, "The panel needs an X display (XWayland on Wayland sessions)");
        return false;
    }

    // Window tracking (optional)
    if (tracker_.connect()) {
        log("Window tracking via " + std::string(tracker_.name()));
    } else {
        std::println(stderr, "Warning: no window tracking backend available, auto-position disabled");
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    // Core init (doc sources, history db, initial docking)
    if (!core_.init()) return false;
    if (!tracker_.tracking_supported()) core_.set_auto_position(false);
    panel_.show();

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Tracking poll timer
    timer_fd_ = timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (timer_fd_ < 0) {
        std::println(stderr, "timerfd_create failed: {}", std::strerror(errno));
        return false;
    }
    auto interval_ms = std::max<uint32_t>(config_.tracking.poll_interval_ms, 10);
    timespec interval{
        .tv_sec = static_cast<time_t>(interval_ms / 1000),
        .tv_nsec = static_cast<long>(interval_ms % 1000) * 1000000L,
    };
    itimerspec spec{.it_interval = interval, .it_value = interval};
    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
        return false;
    }

    // Worker notification eventfd
    worker_event_fd_ = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (worker_event_fd_ < 0) {
        std::println(stderr, "eventfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0) return true;
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    };

    if (!add_fd(signal_fd_, EPOLLIN) ||
        !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(timer_fd_, EPOLLIN) ||
        !add_fd(worker_event_fd_, EPOLLIN) ||
        !add_fd(panel_.fd(), EPOLLIN)) {
        return false;
    }

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::on_timer() {
    uint64_t expirations;
    if (::read(timer_fd_, &expirations, sizeof(expirations)) < 0) return;
    core_.tick(WingmanCore::Clock::now());
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        // Xlib may already hold queued events that will never wake epoll.
        panel_.process_events();

        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == timer_fd_) {
                on_timer();
                continue;
            }

            if (fd == panel_.fd()) {
                panel_.process_events();
                continue;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev) < 0) {
                        ipc_server_.close_client(client_fd);
                    }
                }
                continue;
            }

            if (fd == worker_event_fd_) {
                uint64_t val;
                if (::read(worker_event_fd_, &val, sizeof(val)) > 0) {
                    core_.on_lookup_complete();
                }
                continue;
            }

            on_client_readable(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::on_client_readable(int fd) {
    // Level-triggered epoll will not fire again for lines already buffered,
    // so serve every complete one now.
    while (true) {
        nlohmann::json cmd;
        switch (ipc_server_.read_command(fd, cmd)) {
        case IpcServer::ReadResult::Command: {
            auto response = core_.handle_request(cmd);
            if (response.value("status", "") == "pending") {
                core_.add_waiting_client(fd);
            } else {
                ipc_server_.send_response(fd, response);
            }
            break;
        }
        case IpcServer::ReadResult::Invalid:
            ipc_server_.send_response(fd, {{"status", "error"}, {"message", "invalid command"}});
            break;
        case IpcServer::ReadResult::Incomplete:
            return;
        case IpcServer::ReadResult::Closed:
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
            ipc_server_.close_client(fd);
            core_.remove_waiting_client(fd);
            return;
        }
    }
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[wingman] {}", msg);
    }
}
