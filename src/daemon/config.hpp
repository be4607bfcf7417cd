#pragma once

#include <cstdint>
#include <map>
#include <string>

struct Config {
    struct Backend {
        std::string python;          // empty: venv interpreter, else python3 from PATH
        std::string script;          // empty: <data dir>/backend/main.py
        std::string venv;            // empty: <data dir>/venv
        std::string host = "127.0.0.1";
        uint16_t port = 9877;
        std::string path = "/ws";
        std::string library_path;
        std::map<std::string, std::string> env;
        bool autostart = true;
        int max_restarts = 5;
        uint32_t startup_delay_ms = 3000;
        uint32_t restart_pause_ms = 1000;

        std::string url() const {
            return "ws://" + host + ":" + std::to_string(port) + path;
        }
    } backend;

    struct Connection {
        uint32_t heartbeat_s = 30;
        uint32_t stale_threshold_s = 120;
        uint32_t probe_timeout_ms = 2000;
        uint32_t reconnect_delay_ms = 2000;
        int max_reconnect_attempts = 5;
        uint32_t wake_settle_ms = 2000;
        uint32_t wake_probe_timeout_ms = 3000;
    } connection;

    struct Session {
        std::string mode = "quick";
        std::string model = "parakeet";
        std::string device;
        bool diarization = false;
        uint32_t ready_timeout_s = 30;
        uint32_t processing_timeout_s = 15;
        uint32_t interval_s = 30;
    } session;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t chunk_ms = 400;
        int start_attempts = 3;
        int restart_start_attempts = 2;
        uint32_t flow_wait_ms = 500;
        uint32_t retry_pause_ms = 300;
        int max_format_restarts = 2;
        uint32_t restart_debounce_ms = 500;
        uint32_t restart_settle_ms = 300;
        double format_tolerance_hz = 100.0;
    } audio;

    struct Devices {
        uint32_t poll_interval_ms = 2000;
    } devices;

    struct History {
        bool enabled = true;
        std::string path;            // empty: <data dir>/history.db
    } history;

    static Config load(const std::string& path);
    static Config load_default();
};
