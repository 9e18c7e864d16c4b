#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    bool check_only = false;
    std::string config_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--check-config") {
            check_only = true;
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: whisperd [options]");
            std::println("Options:");
            std::println("  -f, --foreground    Run in foreground (don't daemonize)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -c, --config PATH   Config file path");
            std::println("      --check-config  Validate the config and exit");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 2;
        }
    }

    // Load config
    Config config;
    if (!config_path.empty()) {
        config = Config::load(config_path);
    } else {
        config = Config::load_default();
    }

    // Refuse to start on an invalid config rather than fail on the first request.
    if (auto valid = config.validate(); !valid) {
        std::println(stderr, "Invalid configuration: {}", valid.error().message);
        return 1;
    }
    if (check_only) {
        std::println("Configuration OK");
        return 0;
    }

    if (!foreground) {
        platform::daemonize(config.daemon.resolved_log_file());
    }

    if (verbose && foreground) {
        std::println(stderr, "[whisperd] Starting (backend: {}, chunking: {}, {}s/{}s overlap)",
                     config.backend.type, config.chunking.enabled ? "on" : "off",
                     config.chunking.duration_seconds, config.chunking.overlap_seconds);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
