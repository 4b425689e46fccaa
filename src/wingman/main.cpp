#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"
#include "shortcut.hpp"

#include <expected>
#include <optional>
#include <print>
#include <string>

namespace {

struct Options {
    bool foreground = false;
    bool verbose = false;
    bool write_config = false;
    std::string config_path;
};

void usage() {
    std::println("Usage: wingman [options]");
    std::println("Options:");
    std::println("  -f, --foreground    Run in foreground (don't daemonize)");
    std::println("  -v, --verbose       Enable verbose logging");
    std::println("  -c, --config PATH   Config file path");
    std::println("      --write-config  Write the effective config and exit");
    std::println("  -h, --help          Show this help");
}

// Empty optional inside: --help was handled.
std::expected<std::optional<Options>, std::string> parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            opts.foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) return std::unexpected(arg + " needs a path");
            opts.config_path = argv[++i];
        } else if (arg == "--write-config") {
            opts.write_config = true;
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return std::optional<Options>{};
        } else {
            return std::unexpected("unknown option: " + arg);
        }
    }
    return opts;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::println(stderr, "wingman: {}", parsed.error());
        return 1;
    }
    if (!*parsed) return 0;
    auto opts = std::move(**parsed);

    Config config = opts.config_path.empty() ? Config::load_default() : Config::load(opts.config_path);

    if (opts.write_config) {
        auto path = opts.config_path.empty() ? Config::default_path() : opts.config_path;
        if (path.empty() || !config.save(path)) {
            std::println(stderr, "wingman: could not write config to '{}'", path);
            return 1;
        }
        std::println("Wrote {}", path);
        return 0;
    }

    auto shortcut = parse_shortcut(config.shortcut);
    if (!shortcut) {
        std::println(stderr, "Invalid shortcut '{}': {}, using <Control>+<space>",
                     config.shortcut, shortcut.error());
        shortcut = Shortcut{.modifiers = Shortcut::Control, .key = "space"};
    }

    if (!opts.foreground) {
        platform::daemonize();
    }

    if (opts.verbose && opts.foreground) {
        std::println(stderr, "[wingman] Starting (backend preference: {}, docs: {} sources)",
                     config.tracking.backend, config.docs.sources.size());
    }

    LinuxEventLoop loop(std::move(config), std::move(*shortcut), opts.verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
