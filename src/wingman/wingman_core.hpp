#pragma once

#include "config.hpp"
#include "docs/doc_retriever.hpp"
#include "platform/ipc_server.hpp"
#include "platform/panel.hpp"
#include "platform/window_tracker.hpp"
#include "storage/history_db.hpp"
#include "tracking/stability.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class WingmanCore {
public:
    using Clock = std::chrono::steady_clock;
    using DocSourceFactory =
        std::function<std::vector<std::unique_ptr<DocSource>>(const Config::Docs&)>;
    using NotifyCallback = std::function<void()>;
    using QuitCallback = std::function<void()>;

    // `notify` is called from the lookup worker thread once a result is
    // ready; the owner must then call on_lookup_complete() on the main thread.
    WingmanCore(Config config, bool verbose,
                WindowTracker& tracker, Panel& panel, IpcServer& ipc,
                DocSourceFactory doc_factory, NotifyCallback notify, QuitCallback quit);
    ~WingmanCore();

    WingmanCore(const WingmanCore&) = delete;
    WingmanCore& operator=(const WingmanCore&) = delete;

    // Empty history_path means the default location under data_dir().
    bool init(const std::string& history_path = {});

    // One tracking poll.
    void tick(Clock::time_point now);

    // A control request: {"cmd": name, ...}. Never throws.
    nlohmann::json handle_request(const nlohmann::json& cmd);
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Starts a lookup in the background. False if one is already running.
    bool request_documentation(const std::string& command);
    bool load_pending_documentation();
    void on_lookup_complete();
    bool lookup_in_progress() const { return lookup_running_; }

    void add_waiting_client(int fd);
    void remove_waiting_client(int fd);

    void set_auto_position(bool enabled);
    bool auto_position() const { return auto_position_; }

    bool dock(Edge edge);

    const std::optional<WindowInfo>& focused_window() const { return focused_; }
    const std::string& pending_doc_app() const { return pending_doc_app_; }
    bool doc_prompt_visible() const { return prompt_visible_; }

    void shutdown();

private:
    nlohmann::json dispatch(const std::string& cmd_str, const nlohmann::json& cmd);
    nlohmann::json handle_show(const nlohmann::json& cmd);
    nlohmann::json handle_hide(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_position(const nlohmann::json& cmd);
    nlohmann::json handle_auto(const nlohmann::json& cmd);
    nlohmann::json handle_doc(const nlohmann::json& cmd);
    nlohmann::json handle_load_docs(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_quit(const nlohmann::json& cmd);

    void on_app_changed(const WindowInfo& info, Clock::time_point now);
    void cancel_doc_prompt();
    void reposition(const Geometry& window);
    PanelLimits panel_limits() const;

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    WindowTracker& tracker_;
    Panel& panel_;
    IpcServer& ipc_;

    DocSourceFactory doc_factory_;
    NotifyCallback notify_;
    QuitCallback quit_;

    GeometryDebouncer debouncer_;
    HistoryDb history_db_;
    std::unique_ptr<DocRetriever> retriever_;

    bool auto_position_ = true;
    std::optional<Edge> docked_edge_;

    std::optional<WindowInfo> focused_;
    std::string last_app_name_;

    std::string pending_doc_app_;
    std::optional<Clock::time_point> prompt_due_;
    bool prompt_visible_ = false;

    struct LookupResult {
        std::string command;
        std::expected<Documentation, std::string> result = std::unexpected(std::string{});
        WindowInfo context;
    };
    LookupResult lookup_result_;
    bool lookup_running_ = false;
    std::vector<int> waiting_clients_;
    std::jthread worker_;
};
