#pragma once

#include "platform/window_tracker.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// Focused window from Sway's layout tree. Talks i3-ipc over $SWAYSOCK and
// falls back to `swaymsg -t get_tree` when the socket is not reachable.
class SwayTracker : public WindowTracker {
public:
    SwayTracker();
    ~SwayTracker() override;

    SwayTracker(const SwayTracker&) = delete;
    SwayTracker& operator=(const SwayTracker&) = delete;

    bool connect() override;
    std::optional<WindowInfo> get_focused_window() override;
    std::string_view name() const override { return "sway"; }

    // Depth-first search of a GET_TREE reply for the focused node.
    static std::optional<WindowInfo> find_focused(const nlohmann::json& node);

private:
    static constexpr char MAGIC[] = "i3-ipc";
    static constexpr uint32_t MSG_GET_TREE = 4;

    std::optional<std::string> query_tree();
    bool send_message(int fd, uint32_t type, const std::string& payload = "");
    bool recv_message(int fd, uint32_t& type, std::string& payload);
    int connect_socket(const std::string& path);
    void close_socket();

    int query_fd_ = -1;
    std::string sway_sock_;
    std::string swaymsg_;
};
