#pragma once

#include "config.hpp"
#include "platform/linux/procfs_inspector.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "platform/linux/x11_panel.hpp"
#include "tracking/tracker_chain.hpp"
#include "wingman_core.hpp"

#include <atomic>

class LinuxEventLoop {
public:
    LinuxEventLoop(Config config, Shortcut shortcut, bool verbose = false);
    ~LinuxEventLoop();

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

private:
    void on_timer();
    void on_client_readable(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    // Platform implementations (constructed before core_)
    ProcfsInspector inspector_;
    TrackerChain tracker_;
    X11Panel panel_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    WingmanCore core_;

    // Linux event loop
    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int timer_fd_ = -1;
    int worker_event_fd_ = -1;

    std::atomic<bool> running_{false};
};
