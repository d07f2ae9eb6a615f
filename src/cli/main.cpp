#include "config.hpp"
#include "platform/linux/linux_call_loop.hpp"

#include <chrono>
#include <cstdlib>
#include <optional>
#include <print>
#include <string>

static void usage() {
    std::println("Usage: callscribe [options]");
    std::println("Options:");
    std::println("  -c, --config PATH      Config file path");
    std::println("  -v, --verbose          Enable verbose logging");
    std::println("  -d, --duration SECS    Stop the call after SECS seconds");
    std::println("  --simulate             Use the simulated decoder");
    std::println("  --json                 Print transcripts and metrics as JSON lines");
    std::println("  --record DIR           Write per-source WAV recordings to DIR");
    std::println("  --history [N]          Show the last N recorded calls and exit");
    std::println("  -h, --help             Show this help");
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    bool simulate = false;
    std::string config_path;
    std::optional<std::chrono::seconds> duration;
    std::optional<int> history;
    CallCore::Options options;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--duration" || arg == "-d") {
            if (i + 1 < argc) {
                int secs = std::atoi(argv[++i]);
                if (secs <= 0) {
                    std::println(stderr, "Invalid duration: {}", argv[i]);
                    return 1;
                }
                duration = std::chrono::seconds(secs);
            }
        } else if (arg == "--simulate") {
            simulate = true;
        } else if (arg == "--json") {
            options.json_output = true;
        } else if (arg == "--record") {
            if (i + 1 < argc) options.record_dir = argv[++i];
        } else if (arg == "--history") {
            history = 10;
            if (i + 1 < argc && argv[i + 1][0] != '-') history = std::atoi(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            usage();
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage();
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (simulate) config.decoder.type = "simulated";

    if (history) {
        // Listing needs only the store; skip probing the decoder.
        config.decoder.type = "simulated";
        config.storage.enabled = true;
    }

    if (verbose) {
        std::println(stderr, "[callscribe] Starting (decoder: {} @ {}, window {:.1f}s)",
                     config.decoder.type, config.decoder.url, config.transcription.window_seconds);
    }

    LinuxCallLoop loop(std::move(config), verbose, std::move(options));
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize");
        return 1;
    }

    if (history) {
        loop.print_history(*history);
        return 0;
    }

    return loop.run(duration);
}
