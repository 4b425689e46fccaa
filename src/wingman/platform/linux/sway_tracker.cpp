#include "platform/linux/sway_tracker.hpp"

#include "platform/command_runner.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <print>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

SwayTracker::SwayTracker() = default;

SwayTracker::~SwayTracker() {
    close_socket();
}

bool SwayTracker::connect() {
    if (const char* sock = std::getenv("SWAYSOCK")) {
        sway_sock_ = sock;
        query_fd_ = connect_socket(sway_sock_);
        if (query_fd_ < 0) {
            std::println(stderr, "sway: connect to {} failed: {}", sway_sock_, std::strerror(errno));
        }
    }

    swaymsg_ = platform::find_executable("swaymsg");
    return query_fd_ >= 0 || !swaymsg_.empty();
}

std::optional<WindowInfo> SwayTracker::get_focused_window() {
    auto payload = query_tree();
    if (!payload) return std::nullopt;

    try {
        auto tree = nlohmann::json::parse(*payload);
        return find_focused(tree);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<std::string> SwayTracker::query_tree() {
    if (query_fd_ < 0 && !sway_sock_.empty()) {
        // Sway restarted or dropped us; try once per poll.
        query_fd_ = connect_socket(sway_sock_);
    }

    if (query_fd_ >= 0) {
        uint32_t type;
        std::string payload;
        if (send_message(query_fd_, MSG_GET_TREE) && recv_message(query_fd_, type, payload)) {
            return payload;
        }
        close_socket();
    }

    if (swaymsg_.empty()) return std::nullopt;

    auto res = platform::run_command({swaymsg_, "-t", "get_tree"},
                                     {.timeout = std::chrono::milliseconds(1000)});
    if (!res || res->exit_code != 0) return std::nullopt;
    return std::move(res->output);
}

int SwayTracker::connect_socket(const std::string& path) {
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;

    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        ::close(fd);
        errno = err;
        return -1;
    }
    return fd;
}

void SwayTracker::close_socket() {
    if (query_fd_ >= 0) {
        ::close(query_fd_);
        query_fd_ = -1;
    }
}

bool SwayTracker::send_message(int fd, uint32_t type, const std::string& payload) {
    // Header: "i3-ipc" (6 bytes) + length (4 bytes) + type (4 bytes)
    uint32_t len = static_cast<uint32_t>(payload.size());
    char header[14];
    std::memcpy(header, MAGIC, 6);
    std::memcpy(header + 6, &len, 4);
    std::memcpy(header + 10, &type, 4);

    if (::send(fd, header, 14, MSG_NOSIGNAL) != 14) return false;
    if (len > 0) {
        if (::send(fd, payload.data(), len, MSG_NOSIGNAL) != static_cast<ssize_t>(len))
            return false;
    }
    return true;
}

bool SwayTracker::recv_message(int fd, uint32_t& type, std::string& payload) {
    char header[14];
    size_t read_total = 0;
    while (read_total < 14) {
        ssize_t n = ::recv(fd, header + read_total, 14 - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    if (std::memcmp(header, MAGIC, 6) != 0) return false;

    uint32_t len;
    std::memcpy(&len, header + 6, 4);
    std::memcpy(&type, header + 10, 4);

    payload.resize(len);
    read_total = 0;
    while (read_total < len) {
        ssize_t n = ::recv(fd, payload.data() + read_total, len - read_total, 0);
        if (n <= 0) return false;
        read_total += static_cast<size_t>(n);
    }

    return true;
}

std::optional<WindowInfo> SwayTracker::find_focused(const nlohmann::json& node) {
    if (!node.is_object()) return std::nullopt;

    if (node.value("focused", false)) {
        WindowInfo info;
        if (node.contains("app_id") && node["app_id"].is_string()) {
            info.app_id = node["app_id"].get<std::string>();
        }
        if (node.contains("window_properties") && node["window_properties"].is_object()) {
            info.window_class = node["window_properties"].value("class", "");
        }
        if (node.contains("name") && node["name"].is_string()) {
            info.title = node["name"].get<std::string>();
        }
        info.pid = node.value("pid", 0);

        // Workspaces and outputs can hold focus too; name them by title.
        if (info.app_id.empty() && info.window_class.empty()) {
            info.app_id = !info.title.empty() ? info.title : "Unknown";
        }
        info.process_name = info.app_name();

        if (node.contains("rect") && node["rect"].is_object()) {
            auto& r = node["rect"];
            Geometry g{
                .x = r.value("x", 0),
                .y = r.value("y", 0),
                .width = r.value("width", 0),
                .height = r.value("height", 0),
            };
            if (g.valid()) info.geometry = g;
        }
        return info;
    }

    for (const char* key : {"nodes", "floating_nodes"}) {
        if (!node.contains(key) || !node[key].is_array()) continue;
        for (auto& child : node[key]) {
            auto info = find_focused(child);
            if (info) return info;
        }
    }
    return std::nullopt;
}
