#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <algorithm>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

// stop waits for the transcript; the daemon gives up on its own well before this.
constexpr int kStopTimeoutMs = 120000;

void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  start [session options]           Start a session");
    std::println(stderr, "  stop                              Stop recording and print the transcript");
    std::println(stderr, "  toggle [session options]          Start, or stop when recording");
    std::println(stderr, "  cancel                            Abandon the current session");
    std::println(stderr, "  status                            Show session, connection and backend status");
    std::println(stderr, "  devices                           List input devices");
    std::println(stderr, "  select-device [UID]               Select an input device (none: default)");
    std::println(stderr, "  models                            List backend models");
    std::println(stderr, "  load-model MODEL                  Load a model");
    std::println(stderr, "  download-model                    Download the default model");
    std::println(stderr, "  clear-cache                       Clear the backend model cache");
    std::println(stderr, "  keep-warm MODEL... [--duration D] Keep models loaded");
    std::println(stderr, "  restart-backend                   Restart the inference backend");
    std::println(stderr, "  resume                            Run wake-from-sleep recovery");
    std::println(stderr, "  history [--limit N]               Show transcript history");
    std::println(stderr, "  logs [--limit N]                  Show recent backend output");
    std::println(stderr, "  watch                             Stream daemon events");
    std::println(stderr, "Session options:");
    std::println(stderr, "  --mode quick|continuous  --model NAME  --device UID  --diarization");
}

void print_status(const json& r) {
    auto session = r.value("session", json::object());
    auto conn = r.value("connection", json::object());
    auto sup = r.value("supervisor", json::object());
    auto backend = r.value("backend", json::object());

    std::println("Session:    {} ({})", session.value("state", "unknown"), session.value("mode", ""));
    if (session.contains("error")) std::println("  Error:    {}", session["error"].get<std::string>());
    if (session.contains("duration")) {
        std::println("  Duration: {:.1f}s", session["duration"].get<double>());
    }
    std::println("Connection: {}", conn.value("state", "unknown"));
    if (conn.contains("error")) std::println("  Error:    {}", conn["error"].get<std::string>());
    std::println("Backend:    {} (pid {})", sup.value("state", "unknown"), sup.value("pid", -1));
    if (sup.contains("error")) std::println("  Error:    {}", sup["error"].get<std::string>());
    std::println("Model:      {} [{}]", backend.value("active_model", ""), backend.value("model_state", ""));
    auto device = r.value("device", "");
    std::println("Device:     {}", device.empty() ? "default" : device);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    int limit = 10;
    std::string duration;
    json session_opts = json::object();
    std::vector<std::string> positional;

    // Parse optional args
    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--mode" && i + 1 < argc) {
            session_opts["mode"] = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            session_opts["model"] = argv[++i];
        } else if (arg == "--device" && i + 1 < argc) {
            session_opts["device"] = argv[++i];
        } else if (arg == "--diarization") {
            session_opts["diarization"] = true;
        } else if (arg == "--duration" && i + 1 < argc) {
            duration = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    // Build command JSON
    json cmd;
    if (command == "start" || command == "toggle") {
        cmd = session_opts;
        cmd["cmd"] = command;
    } else if (command == "stop" || command == "cancel" || command == "status" ||
               command == "devices" || command == "models" || command == "resume") {
        cmd = {{"cmd", command}};
    } else if (command == "download-model" || command == "clear-cache" ||
               command == "restart-backend") {
        std::string name = command;
        std::ranges::replace(name, '-', '_');
        cmd = {{"cmd", name}};
    } else if (command == "select-device") {
        cmd = {{"cmd", "select_device"}, {"uid", positional.empty() ? "" : positional[0]}};
    } else if (command == "load-model") {
        if (positional.empty()) {
            std::println(stderr, "load-model needs a model name");
            return 1;
        }
        cmd = {{"cmd", "load_model"}, {"model", positional[0]}};
    } else if (command == "keep-warm") {
        cmd = {{"cmd", "keep_warm"}, {"models", positional}};
        if (!duration.empty()) cmd["duration"] = duration;
    } else if (command == "history" || command == "logs") {
        cmd = {{"cmd", command}, {"limit", limit}};
    } else if (command == "watch") {
        cmd = {{"cmd", "subscribe"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    // Connect and send
    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is mute-daemon running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    bool waits = command == "stop" || command == "toggle";
    json response;
    if (!client.recv(response, waits ? kStopTimeoutMs : 30000)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    auto status = response.value("status", "");
    if (status == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    // Display response
    if (command == "watch") {
        json event;
        while (client.recv(event, -1)) {
            std::println("{}", event.dump());
        }
        return 0;
    }

    if (command == "status") {
        print_status(response);
    } else if (command == "devices") {
        auto selected = response.value("selected", "");
        for (auto& d : response.value("devices", json::array())) {
            auto uid = d.value("uid", "");
            std::println("{} {}  {}", uid == selected ? "*" : " ", uid, d.value("name", ""));
        }
        if (selected.empty()) std::println("* default input");
    } else if (command == "models") {
        for (auto& m : response.value("models", json::array())) {
            std::println("{:<20} {:<8} {}{}", m.value("id", ""), m.value("size", ""),
                         m.value("downloaded", false) ? "downloaded" : "not downloaded",
                         m.value("loaded", false) ? ", loaded" : "");
        }
    } else if (command == "history") {
        for (auto& entry : response.value("entries", json::array())) {
            std::println("[{}] ({}, {}) {}", entry.value("timestamp", ""), entry.value("mode", ""),
                         entry.value("model", ""), entry.value("text", ""));
        }
    } else if (command == "logs") {
        for (auto& line : response.value("lines", json::array())) {
            std::println("{}", line.get<std::string>());
        }
    } else if (response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.contains("state")) {
        std::println("{}", response["state"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
