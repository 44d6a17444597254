#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <set>
#include <string>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                                  Show daemon status");
    std::println(stderr, "  warmup [--language L]                   Open a streaming connection ahead of need");
    std::println(stderr, "  dictate FILE [--language L]             Stream a WAV file for real-time transcription");
    std::println(stderr, "  finalize                                Flush the current dictation");
    std::println(stderr, "  transcribe FILE [--backend B] [--model M] [--language L] [--prompt P]");
    std::println(stderr, "                                          Transcribe a WAV file locally");
    std::println(stderr, "  models                                  List known models");
    std::println(stderr, "  download MODEL [--backend B]            Download and install a model");
    std::println(stderr, "  cancel-download                         Cancel the running download");
    std::println(stderr, "  remove-model MODEL [--backend B]        Delete an installed model");
    std::println(stderr, "  server-start [--backend B] [--model M]  Start a local inference server");
    std::println(stderr, "  server-stop [--backend B]               Stop a local inference server");
    std::println(stderr, "  history [--limit N]                     Show transcription history");
    std::println(stderr, "Backends: whisper (default), parakeet");
}

static void print_server(const std::string& family, const json& s) {
    std::println("  {:<9} {} ({})", family, s.value("state", "unknown"), s.value("name", ""));
    if (s.contains("port")) {
        std::println("            pid {} port {}{}", s.value("pid", 0), s.value("port", 0),
                     s.value("gpu", false) ? " gpu" : "");
        std::println("            model {}", s.value("model", ""));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        usage(argv[0]);
        return 0;
    }

    static const std::set<std::string> known = {
        "status", "warmup", "dictate", "finalize", "transcribe", "models", "download",
        "cancel-download", "remove-model", "server-start", "server-stop", "history",
    };
    if (!known.contains(command)) {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    json cmd = {{"cmd", command}};

    // Parse optional args; the first bare argument is the file or model
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            cmd["limit"] = std::atoi(argv[++i]);
        } else if (arg == "--backend" && i + 1 < argc) {
            cmd["backend"] = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            cmd["model"] = argv[++i];
        } else if (arg == "--language" && i + 1 < argc) {
            cmd["language"] = argv[++i];
        } else if (arg == "--prompt" && i + 1 < argc) {
            cmd["prompt"] = argv[++i];
        } else if (!arg.starts_with("--")) {
            if (command == "dictate" || command == "transcribe") {
                cmd["file"] = arg;
            } else if (command == "download" || command == "remove-model") {
                cmd["model"] = arg;
            }
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    if ((command == "dictate" || command == "transcribe") && !cmd.contains("file")) {
        std::println(stderr, "{} needs a WAV file", command);
        return 1;
    }
    if ((command == "download" || command == "remove-model") && !cmd.contains("model")) {
        std::println(stderr, "{} needs a model id", command);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}: {}", sock_path, client.last_error());
        std::println(stderr, "Is speechlinkd running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command: {}", client.last_error());
        return 1;
    }

    // Downloads, server starts and transcriptions can take minutes
    static const std::set<std::string> quick = {"status", "finalize", "models", "cancel-download", "history"};
    json response;
    if (!client.recv(response, quick.contains(command) ? 30000 : -1)) {
        std::println(stderr, "No response from daemon: {}", client.last_error());
        return 1;
    }

    // Display response
    auto status = response.value("status", "");

    if (status == "error") {
        std::println(stderr, "Error [{}]: {}", response.value("code", "unknown"),
                     response.value("message", "unknown error"));
        return 1;
    }

    if (command == "status") {
        if (response.contains("streaming")) {
            auto& s = response["streaming"];
            std::println("Streaming: {}{}", s.value("state", "unknown"),
                         s.value("warm", false) ? " (warm)" : "");
        }
        if (response.contains("local")) {
            std::println("Local servers:");
            for (auto& [family, s] : response["local"].items()) print_server(family, s);
        }
        if (response.contains("download")) {
            auto& d = response["download"];
            auto done = d.value("downloaded", uint64_t{0});
            auto total = d.value("total", uint64_t{0});
            if (total > 0) {
                std::println("Downloading {}: {:.1f}%", d.value("model", ""), 100.0 * done / total);
            } else {
                std::println("Downloading {}: {} bytes", d.value("model", ""), done);
            }
        }
    } else if (command == "models") {
        for (auto& m : response["models"]) {
            std::println("{:<9} {:<22} {:>7.0f} MB  {}", m.value("backend", ""), m.value("id", ""),
                         m.value("size_bytes", uint64_t{0}) / 1e6,
                         m.value("installed", false) ? "installed" : "-");
        }
    } else if (command == "history") {
        for (auto& entry : response["entries"]) {
            std::println("[{}] {}", entry.value("timestamp", ""), entry.value("text", ""));
            if (entry.contains("backend") && !entry["backend"].get<std::string>().empty()) {
                std::println("  Backend: {} {}", entry["backend"].get<std::string>(),
                             entry.value("model", ""));
            }
        }
    } else if (command == "server-start" && response.contains("server")) {
        print_server(cmd.value("backend", "local"), response["server"]);
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.contains("path")) {
        std::println("Installed at {}", response["path"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
