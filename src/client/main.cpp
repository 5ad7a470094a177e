#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>

using json = nlohmann::json;

// Toggles and waits can span a whole recording plus transcription.
constexpr int LONG_TIMEOUT_MS = 10 * 60 * 1000;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  toggle [--output clipboard|type|none]  Start or stop recording");
    std::println(stderr, "  start [--output clipboard|type|none]   Start recording");
    std::println(stderr, "  stop                                   Stop recording");
    std::println(stderr, "  status                                 Show recorder status");
    std::println(stderr, "  history [--limit N]                    Show recent recordings");
    std::println(stderr, "  recover                                Retry saving unsaved recordings");
    std::println(stderr, "  wait                                   Wait for the current recording to settle");
    std::println(stderr, "  watch                                  Print recording state changes");
}

static void print_status(const json& response) {
    std::println("State: {}", response.value("state", "unknown"));
    if (response.contains("surface")) {
        auto& s = response["surface"];
        if (s.value("visible", false)) {
            std::println("Status: {}", s.value("status", ""));
            if (s.value("recording", false)) {
                std::println("Elapsed: {:.1f}s", s.value("elapsed", 0.0));
            }
        }
    }
    if (response.contains("last_recording")) {
        std::println("Last recording: {}", response["last_recording"].get<std::string>());
    }
    auto unsaved = response.value("unsaved", 0);
    if (unsaved > 0) {
        std::println("Unsaved recordings in memory: {} (run 'recover')", unsaved);
    }
}

static void print_history(const json& response) {
    if (!response.contains("entries")) return;
    for (auto& entry : response["entries"]) {
        std::println("[{}] {} ({:.1f}s, {})", entry.value("timestamp", ""), entry.value("path", ""),
                     entry.value("duration_ms", 0) / 1000.0, entry.value("stop_reason", ""));
        auto text = entry.value("text", "");
        if (!text.empty()) {
            std::println("  {}", text);
        }
        if (!entry.value("audio_kept", true)) {
            std::println("  (audio removed)");
        }
    }
}

static int watch(UnixSocketClient& client) {
    json event;
    while (client.recv(event, -1)) {
        if (event.value("event", "") == "recording") {
            std::println("{}", event.value("recording", false) ? "recording" : "stopped");
        } else if (event.contains("state")) {
            std::println("{}", event.value("state", "unknown"));
        }
        std::fflush(stdout);
    }
    std::println(stderr, "Connection to daemon closed");
    return 1;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string output_method;
    int limit = 10;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--output" && i + 1 < argc) {
            output_method = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        }
    }

    json cmd;
    int timeout_ms = 30000;
    if (command == "toggle" || command == "start") {
        cmd = {{"cmd", command}};
        if (!output_method.empty()) cmd["output"] = output_method;
        timeout_ms = LONG_TIMEOUT_MS;
    } else if (command == "stop") {
        cmd = {{"cmd", "stop"}};
        timeout_ms = LONG_TIMEOUT_MS;
    } else if (command == "status" || command == "recover") {
        cmd = {{"cmd", command}};
    } else if (command == "history") {
        cmd = {{"cmd", "history"}, {"limit", limit}};
    } else if (command == "wait") {
        cmd = {{"cmd", "wait"}};
        timeout_ms = LONG_TIMEOUT_MS;
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is tapedeck running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, timeout_ms)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (command == "watch") {
        std::println("{}", response.value("recording", false) ? "recording" : "stopped");
        std::fflush(stdout);
        return watch(client);
    }

    if (command == "status") {
        print_status(response);
    } else if (command == "history") {
        print_history(response);
    } else if (command == "recover") {
        std::println("Recovered {}, still unsaved {}", response.value("recovered", 0),
                     response.value("unsaved", 0));
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (status == "ok") {
        std::println("{}", response.value("state", "ok"));
    } else {
        std::println("{}", response.dump(2));
    }

    return 0;
}
