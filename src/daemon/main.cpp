#include "config.hpp"
#include "platform/daemonizer.hpp"
#include "platform/platform_paths.hpp"
#include "platform/linux/linux_event_loop.hpp"

#include <print>
#include <string>

int main(int argc, char* argv[]) {
    bool foreground = false;
    bool verbose = false;
    bool no_transcribe = false;
    std::string config_path;
    std::string recordings_dir;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--foreground" || arg == "-f") {
            foreground = true;
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--recordings" || arg == "-r") {
            if (i + 1 < argc) recordings_dir = argv[++i];
        } else if (arg == "--no-transcribe") {
            no_transcribe = true;
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: tapedeck [options]");
            std::println("Options:");
            std::println("  -f, --foreground      Run in foreground (don't daemonize)");
            std::println("  -v, --verbose         Enable verbose logging");
            std::println("  -c, --config PATH     Config file path");
            std::println("  -r, --recordings DIR  Directory for recorded audio");
            std::println("      --no-transcribe   Only record, never transcribe");
            std::println("  -h, --help            Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (!recordings_dir.empty()) config.recorder.recordings_dir = recordings_dir;
    if (no_transcribe) config.recorder.auto_transcribe = false;

    if (!foreground) {
        auto data = platform::data_dir();
        platform::daemonize(data.empty() ? std::string() : data + "/tapedeck.log");
    }

    if (verbose) {
        std::println(stderr, "[tapedeck] Starting (backend: {} @ {}, transcribe: {})",
                     config.backend.type, config.backend.url, config.recorder.auto_transcribe);
    }

    LinuxEventLoop loop(std::move(config), verbose);
    if (!loop.init()) {
        std::println(stderr, "Failed to initialize event loop");
        return 1;
    }

    loop.run();
    return 0;
}
