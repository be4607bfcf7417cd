#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& section, const char* key, T& out) {
    if (section.contains(key)) out = section[key].get<T>();
}

} // namespace

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    Config parsed;
    try {
        auto j = json::parse(f);

        if (j.contains("backend")) {
            auto& b = j["backend"];
            read(b, "python", parsed.backend.python);
            read(b, "script", parsed.backend.script);
            read(b, "venv", parsed.backend.venv);
            read(b, "host", parsed.backend.host);
            read(b, "port", parsed.backend.port);
            read(b, "path", parsed.backend.path);
            read(b, "library_path", parsed.backend.library_path);
            read(b, "env", parsed.backend.env);
            read(b, "autostart", parsed.backend.autostart);
            read(b, "max_restarts", parsed.backend.max_restarts);
            read(b, "startup_delay_ms", parsed.backend.startup_delay_ms);
            read(b, "restart_pause_ms", parsed.backend.restart_pause_ms);
        }

        if (j.contains("connection")) {
            auto& c = j["connection"];
            read(c, "heartbeat_s", parsed.connection.heartbeat_s);
            read(c, "stale_threshold_s", parsed.connection.stale_threshold_s);
            read(c, "probe_timeout_ms", parsed.connection.probe_timeout_ms);
            read(c, "reconnect_delay_ms", parsed.connection.reconnect_delay_ms);
            read(c, "max_reconnect_attempts", parsed.connection.max_reconnect_attempts);
            read(c, "wake_settle_ms", parsed.connection.wake_settle_ms);
            read(c, "wake_probe_timeout_ms", parsed.connection.wake_probe_timeout_ms);
        }

        if (j.contains("session")) {
            auto& s = j["session"];
            read(s, "mode", parsed.session.mode);
            read(s, "model", parsed.session.model);
            read(s, "device", parsed.session.device);
            read(s, "diarization", parsed.session.diarization);
            read(s, "ready_timeout_s", parsed.session.ready_timeout_s);
            read(s, "processing_timeout_s", parsed.session.processing_timeout_s);
            read(s, "interval_s", parsed.session.interval_s);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "sample_rate", parsed.audio.sample_rate);
            read(a, "chunk_ms", parsed.audio.chunk_ms);
            read(a, "start_attempts", parsed.audio.start_attempts);
            read(a, "restart_start_attempts", parsed.audio.restart_start_attempts);
            read(a, "flow_wait_ms", parsed.audio.flow_wait_ms);
            read(a, "retry_pause_ms", parsed.audio.retry_pause_ms);
            read(a, "max_format_restarts", parsed.audio.max_format_restarts);
            read(a, "restart_debounce_ms", parsed.audio.restart_debounce_ms);
            read(a, "restart_settle_ms", parsed.audio.restart_settle_ms);
            read(a, "format_tolerance_hz", parsed.audio.format_tolerance_hz);
        }

        if (j.contains("devices")) {
            read(j["devices"], "poll_interval_ms", parsed.devices.poll_interval_ms);
        }

        if (j.contains("history")) {
            read(j["history"], "enabled", parsed.history.enabled);
            read(j["history"], "path", parsed.history.path);
        }

        cfg = std::move(parsed);
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
