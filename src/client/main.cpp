#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  show | hide | toggle                   Change panel visibility");
    std::println(stderr, "  position top|bottom|left|right         Dock the panel to a screen edge");
    std::println(stderr, "  auto [on|off|toggle]                   Follow the focused window");
    std::println(stderr, "  doc <command>                          Look up documentation");
    std::println(stderr, "  load-docs                              Load docs for the detected application");
    std::println(stderr, "  status                                 Show daemon status");
    std::println(stderr, "  history [--limit N] [--clear]          Show or clear lookup history");
    std::println(stderr, "  quit                                   Stop the daemon");
}

static void print_status(const json& response) {
    std::println("Backend: {}", response.value("backend", "none"));
    std::println("Visible: {}", response.value("visible", false) ? "yes" : "no");
    std::println("Auto-position: {}", response.value("auto_position", false) ? "on" : "off");
    if (response.contains("edge")) {
        std::println("Docked: {}", response["edge"].get<std::string>());
    }
    if (response.contains("panel")) {
        auto& p = response["panel"];
        std::println("Panel: {},{} {}x{}", p.value("x", 0), p.value("y", 0),
                     p.value("width", 0), p.value("height", 0));
    }

    auto window = response.value("window", json());
    if (window.is_object()) {
        std::println("Application: {}", window.value("app", ""));
        std::println("Title: {}", window.value("title", ""));
        auto geometry = window.value("geometry", json());
        if (geometry.is_object()) {
            std::println("Window: {},{} {}x{}", geometry.value("x", 0), geometry.value("y", 0),
                         geometry.value("width", 0), geometry.value("height", 0));
        }
    } else {
        std::println("Application: none");
    }

    auto pending = response.value("pending_doc_app", "");
    if (!pending.empty()) std::println("Docs offered for: {}", pending);
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string argument = argc > 2 ? argv[2] : "";
    int limit = 10;
    bool clear = false;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--clear") {
            clear = true;
        }
    }

    // Build command JSON
    json cmd;
    if (command == "show" || command == "hide" || command == "toggle" ||
        command == "load-docs" || command == "status" || command == "quit") {
        cmd = {{"cmd", command}};
    } else if (command == "position") {
        if (argument.empty()) {
            std::println(stderr, "position needs an edge");
            return 1;
        }
        cmd = {{"cmd", "position"}, {"edge", argument}};
    } else if (command == "auto") {
        cmd = {{"cmd", "auto"}, {"mode", argument.empty() ? "toggle" : argument}};
    } else if (command == "doc") {
        if (argument.empty()) {
            std::println(stderr, "doc needs a command name");
            return 1;
        }
        cmd = {{"cmd", "doc"}, {"command", argument}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
        if (clear) cmd["clear"] = true;
    } else if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}: {}", sock_path, std::strerror(errno));
        std::println(stderr, "Is wingman running?");
        return 1;
    }

    json response;
    if (!client.request(cmd, response)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    // Display response
    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        print_status(response);
    } else if (command == "history" && response.value("cleared", false)) {
        std::println("History cleared");
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] {} ({})", entry.value("timestamp", ""), entry.value("command", ""),
                         entry.value("found", false) ? entry.value("source", "") : "not found");
            auto app = entry.value("app_name", "");
            if (!app.empty()) std::println("  Application: {}", app);
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (command == "auto") {
        std::println("Auto-position: {}", response.value("auto_position", false) ? "on" : "off");
    } else {
        std::println("OK");
    }

    return 0;
}
