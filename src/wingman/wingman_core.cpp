#include "wingman_core.hpp"

#include "platform/platform_paths.hpp"

#include <format>
#include <print>
#include <unistd.h>

namespace {

std::string app_label(const std::string& name, const std::optional<Geometry>& g) {
    if (!g) return std::format("Detected Application: {}", name);
    return std::format("Detected Application: {} ({},{} {}x{})", name, g->x, g->y, g->width,
                       g->height);
}

nlohmann::json geometry_json(const Geometry& g) {
    return {{"x", g.x}, {"y", g.y}, {"width", g.width}, {"height", g.height}};
}

} // namespace

WingmanCore::WingmanCore(Config config, bool verbose,
                         WindowTracker& tracker, Panel& panel, IpcServer& ipc,
                         DocSourceFactory doc_factory, NotifyCallback notify, QuitCallback quit)
    : config_(std::move(config)), verbose_(verbose),
      tracker_(tracker), panel_(panel), ipc_(ipc),
      doc_factory_(std::move(doc_factory)),
      notify_(std::move(notify)),
      quit_(std::move(quit)),
      debouncer_(config_.tracking.stable_polls),
      auto_position_(config_.panel.auto_position) {}

WingmanCore::~WingmanCore() = default;

bool WingmanCore::init(const std::string& history_path) {
    retriever_ = std::make_unique<DocRetriever>(doc_factory_(config_.docs));
    if (retriever_->source_names().empty()) {
        std::println(stderr, "Warning: no documentation sources configured");
    }

    // Open history DB
    std::string db_path = history_path.empty() ? platform::history_path() : history_path;
    if (!history_db_.open(db_path)) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    panel_.set_callbacks({
        .command_entered = [this](const std::string& command) {
            if (!request_documentation(command)) {
                panel_.set_documentation("A documentation lookup is already running.");
            }
        },
        .load_docs = [this]() { load_pending_documentation(); },
        .toggle_auto_position = [this]() { set_auto_position(!auto_position_); },
        .drag_finished = [this]() {
            // The user placed the panel by hand; stop moving it.
            if (auto_position_) set_auto_position(false);
        },
    });
    panel_.set_auto_position(auto_position_);
    panel_.set_app_label("Detected Application: None");

    auto edge = placement::parse_edge(config_.panel.position);
    if (!edge) {
        std::println(stderr, "Unknown panel position '{}', using top", config_.panel.position);
        edge = Edge::Top;
    }
    dock(*edge);

    return true;
}

void WingmanCore::tick(Clock::time_point now) {
    auto info = tracker_.get_focused_window();

    // Our own panel taking focus says nothing about the user's application.
    if (info && info->pid == ::getpid()) info.reset();

    if (info) {
        const auto& name = info->app_name();
        bool app_changed = !name.empty() && name != last_app_name_;
        bool geometry_changed = !focused_ || focused_->geometry != info->geometry;
        focused_ = info;

        if (app_changed) {
            on_app_changed(*info, now);
        } else if (geometry_changed && !last_app_name_.empty()) {
            panel_.set_app_label(app_label(last_app_name_, info->geometry));
        }
    }

    if (prompt_due_ && now >= *prompt_due_) {
        prompt_due_.reset();
        if (!pending_doc_app_.empty()) {
            log("Offering documentation for " + pending_doc_app_);
            panel_.show_doc_prompt(pending_doc_app_);
            prompt_visible_ = true;
        }
    }

    if (panel_.is_being_moved() || !auto_position_) return;

    // A failed query keeps the current state; the next tick retries.
    if (!info) return;

    if (auto target = debouncer_.observe(info->geometry)) {
        reposition(*target);
    }
}

void WingmanCore::on_app_changed(const WindowInfo& info, Clock::time_point now) {
    last_app_name_ = info.app_name();
    log("Focused application: " + last_app_name_);
    panel_.set_app_label(app_label(last_app_name_, info.geometry));

    cancel_doc_prompt();

    if (docs::is_ignored(last_app_name_, config_.docs.ignored_terms)) return;

    auto app = docs::clean_app_name(last_app_name_);
    if (!docs::valid_command(app)) return;

    pending_doc_app_ = app;
    prompt_due_ = now + std::chrono::milliseconds(config_.docs.auto_prompt_delay_ms);
}

void WingmanCore::cancel_doc_prompt() {
    pending_doc_app_.clear();
    prompt_due_.reset();
    if (prompt_visible_) {
        panel_.hide_doc_prompt();
        prompt_visible_ = false;
    }
}

PanelLimits WingmanCore::panel_limits() const {
    return {
        .min_width = config_.panel.min_width,
        .max_width = config_.panel.max_width,
        .height = config_.panel.height,
    };
}

void WingmanCore::reposition(const Geometry& window) {
    auto monitors = panel_.monitors();
    auto target = placement::panel_rect_for(window, monitors, panel_limits());
    if (!target) {
        log("No monitor information, not repositioning");
        return;
    }

    docked_edge_.reset();
    if (*target == panel_.geometry()) return;

    log(std::format("Repositioning panel to {},{} {}x{}", target->x, target->y, target->width,
                    target->height));
    panel_.set_geometry(*target);
}

bool WingmanCore::dock(Edge edge) {
    auto monitors = panel_.monitors();
    const auto* primary = placement::primary_monitor(monitors);
    if (!primary) {
        log("No monitor information, cannot dock panel");
        return false;
    }

    auto target = placement::edge_rect(edge, *primary, config_.panel.width, config_.panel.height);
    docked_edge_ = edge;
    if (target != panel_.geometry()) {
        log(std::format("Docking panel to {} edge", placement::edge_name(edge)));
        panel_.set_geometry(target);
    }
    return true;
}

void WingmanCore::set_auto_position(bool enabled) {
    auto_position_ = enabled;
    panel_.set_auto_position(enabled);

    // Re-enabling must be able to dock to a window that was docked to before.
    if (enabled) debouncer_.reset();
    log(std::string("Auto-position ") + (enabled ? "enabled" : "disabled"));
}

bool WingmanCore::request_documentation(const std::string& command) {
    if (lookup_running_) return false;

    if (worker_.joinable()) {
        worker_.join();
    }

    log("Looking up documentation for " + command);
    panel_.set_documentation(std::format("Loading documentation for {}...", command));

    lookup_running_ = true;
    lookup_result_ = {};

    worker_ = std::jthread([this, command, context = focused_.value_or(WindowInfo{})]
                           (std::stop_token) mutable {
        auto result = retriever_->lookup(command);
        lookup_result_ = LookupResult{
            .command = command,
            .result = std::move(result),
            .context = std::move(context),
        };

        notify_();
    });
    return true;
}

bool WingmanCore::load_pending_documentation() {
    if (pending_doc_app_.empty() || lookup_running_) return false;

    auto app = pending_doc_app_;
    cancel_doc_prompt();
    return request_documentation(app);
}

void WingmanCore::on_lookup_complete() {
    if (worker_.joinable()) {
        worker_.join();
    }
    lookup_running_ = false;

    auto& lr = lookup_result_;
    nlohmann::json response;

    if (lr.result.has_value()) {
        auto& doc = lr.result.value();
        log(std::format("Found {} documentation for {} ({} chars)", doc.source, doc.command,
                        doc.content.size()));
        panel_.set_documentation(doc.formatted());
        history_db_.insert(lr.command, doc.source, true, lr.context);

        response = {
            {"status", "ok"},
            {"command", doc.command},
            {"source", doc.source},
            {"title", doc.title},
            {"text", doc.formatted()},
        };
    } else {
        log("Lookup failed: " + lr.result.error());
        panel_.set_documentation(lr.result.error());
        history_db_.insert(lr.command, "", false, lr.context);
        response = {{"status", "error"}, {"message", lr.result.error()}};
    }

    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

void WingmanCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void WingmanCore::remove_waiting_client(int fd) {
    std::erase(waiting_clients_, fd);
}

nlohmann::json WingmanCore::handle_request(const nlohmann::json& cmd) {
    auto it = cmd.find("cmd");
    if (it == cmd.end() || !it->is_string()) {
        return {{"status", "error"}, {"message", "invalid command"}};
    }
    return handle_command(it->get<std::string>(), cmd);
}

nlohmann::json WingmanCore::handle_command(const std::string& cmd_str,
                                           const nlohmann::json& cmd) {
    // A well-formed object can still carry a field of the wrong type.
    try {
        return dispatch(cmd_str, cmd);
    } catch (const nlohmann::json::exception& e) {
        log(std::format("Rejected '{}' command: {}", cmd_str, e.what()));
        return {{"status", "error"}, {"message", "invalid command"}};
    }
}

nlohmann::json WingmanCore::dispatch(const std::string& cmd_str, const nlohmann::json& cmd) {
    if (cmd_str == "show") return handle_show(cmd);
    if (cmd_str == "hide") return handle_hide(cmd);
    if (cmd_str == "toggle") return handle_toggle(cmd);
    if (cmd_str == "position") return handle_position(cmd);
    if (cmd_str == "auto") return handle_auto(cmd);
    if (cmd_str == "doc") return handle_doc(cmd);
    if (cmd_str == "load-docs") return handle_load_docs(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    if (cmd_str == "history") return handle_history(cmd);
    if (cmd_str == "quit") return handle_quit(cmd);
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json WingmanCore::handle_show(const nlohmann::json& /*cmd*/) {
    panel_.show();
    return {{"status", "ok"}, {"visible", true}};
}

nlohmann::json WingmanCore::handle_hide(const nlohmann::json& /*cmd*/) {
    panel_.hide();
    return {{"status", "ok"}, {"visible", false}};
}

nlohmann::json WingmanCore::handle_toggle(const nlohmann::json& cmd) {
    if (panel_.visible()) return handle_hide(cmd);
    return handle_show(cmd);
}

nlohmann::json WingmanCore::handle_position(const nlohmann::json& cmd) {
    auto edge = placement::parse_edge(cmd.value("edge", ""));
    if (!edge) {
        return {{"status", "error"}, {"message", "edge must be top, bottom, left or right"}};
    }
    if (!dock(*edge)) {
        return {{"status", "error"}, {"message", "no monitor information"}};
    }
    return {{"status", "ok"}, {"edge", std::string(placement::edge_name(*edge))}};
}

nlohmann::json WingmanCore::handle_auto(const nlohmann::json& cmd) {
    auto mode = cmd.value("mode", "toggle");
    if (mode == "on") {
        set_auto_position(true);
    } else if (mode == "off") {
        set_auto_position(false);
    } else if (mode == "toggle") {
        set_auto_position(!auto_position_);
    } else {
        return {{"status", "error"}, {"message", "mode must be on, off or toggle"}};
    }
    return {{"status", "ok"}, {"auto_position", auto_position_}};
}

nlohmann::json WingmanCore::handle_doc(const nlohmann::json& cmd) {
    auto command = cmd.value("command", "");
    if (command.empty()) {
        return {{"status", "error"}, {"message", "missing command"}};
    }
    if (!request_documentation(command)) {
        return {{"status", "error"}, {"message", "lookup already in progress"}};
    }
    return {{"status", "pending"}, {"command", command}};
}

nlohmann::json WingmanCore::handle_load_docs(const nlohmann::json& /*cmd*/) {
    if (pending_doc_app_.empty()) {
        return {{"status", "error"}, {"message", "no application waiting for documentation"}};
    }
    auto app = pending_doc_app_;
    if (!load_pending_documentation()) {
        return {{"status", "error"}, {"message", "lookup already in progress"}};
    }
    return {{"status", "pending"}, {"command", app}};
}

nlohmann::json WingmanCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {
        {"status", "ok"},
        {"backend", std::string(tracker_.name())},
        {"visible", panel_.visible()},
        {"auto_position", auto_position_},
        {"moving", panel_.is_being_moved()},
        {"panel", geometry_json(panel_.geometry())},
        {"pending_doc_app", pending_doc_app_},
        {"lookup_running", lookup_running_},
    };
    if (docked_edge_) resp["edge"] = std::string(placement::edge_name(*docked_edge_));

    if (focused_) {
        nlohmann::json window = {
            {"app", focused_->app_name()},
            {"title", focused_->title},
            {"pid", focused_->pid},
        };
        window["geometry"] = focused_->geometry ? geometry_json(*focused_->geometry)
                                                : nlohmann::json(nullptr);
        resp["window"] = std::move(window);
    } else {
        resp["window"] = nullptr;
    }
    return resp;
}

nlohmann::json WingmanCore::handle_history(const nlohmann::json& cmd) {
    if (!history_db_.is_open()) {
        return {{"status", "error"}, {"message", "history is disabled"}};
    }
    if (cmd.value("clear", false)) {
        if (!history_db_.clear()) return {{"status", "error"}, {"message", "failed to clear history"}};
        log("History cleared");
        return {{"status", "ok"}, {"cleared", true}};
    }

    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"command", e.command},
            {"source", e.source},
            {"found", e.found},
            {"app_name", e.app_name},
            {"window_title", e.window_title},
        });
    }
    return resp;
}

nlohmann::json WingmanCore::handle_quit(const nlohmann::json& /*cmd*/) {
    log("Quit requested");
    if (quit_) quit_();
    return {{"status", "ok"}};
}

void WingmanCore::shutdown() {
    if (lookup_running_) {
        log("Waiting for pending lookup to complete...");
        on_lookup_complete();
    } else if (worker_.joinable()) {
        worker_.join();
    }
}

void WingmanCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[wingman] {}", msg);
    }
}
