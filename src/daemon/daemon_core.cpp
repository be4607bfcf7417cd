#include "daemon_core.hpp"

#include "platform/platform_paths.hpp"

#include <chrono>
#include <format>
#include <print>

using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

double seconds_between(Scheduler::Clock::time_point from, Scheduler::Clock::time_point to) {
    if (from == Scheduler::Clock::time_point{} || to < from) return 0.0;
    return std::chrono::duration<double>(to - from).count();
}

std::string data_path(const std::string& name) {
    auto dir = platform::data_dir();
    return (dir.empty() ? std::string("/tmp/mute") : dir) + "/" + name;
}

} // namespace

// --- Settings ---

SessionSettings DaemonCore::session_settings(const Config& c) {
    return {
        .ready_timeout = seconds(c.session.ready_timeout_s),
        .processing_timeout = seconds(c.session.processing_timeout_s),
        .interval = seconds(c.session.interval_s),
    };
}

ConnectionSettings DaemonCore::connection_settings(const Config& c) {
    return {
        .url = c.backend.url(),
        .heartbeat_interval = seconds(c.connection.heartbeat_s),
        .stale_threshold = seconds(c.connection.stale_threshold_s),
        .probe_timeout = milliseconds(c.connection.probe_timeout_ms),
        .reconnect_delay = milliseconds(c.connection.reconnect_delay_ms),
        .max_reconnect_attempts = c.connection.max_reconnect_attempts,
        .wake_settle = milliseconds(c.connection.wake_settle_ms),
        .wake_probe_timeout = milliseconds(c.connection.wake_probe_timeout_ms),
    };
}

CaptureSettings DaemonCore::capture_settings(const Config& c) {
    CaptureSettings s;
    s.target_rate = c.audio.sample_rate;
    s.chunk_ms = c.audio.chunk_ms;
    s.start_attempts = c.audio.start_attempts;
    s.restart_start_attempts = c.audio.restart_start_attempts;
    s.flow_wait = milliseconds(c.audio.flow_wait_ms);
    s.retry_pause = milliseconds(c.audio.retry_pause_ms);
    s.max_format_restarts = c.audio.max_format_restarts;
    s.restart_debounce = milliseconds(c.audio.restart_debounce_ms);
    s.restart_settle = milliseconds(c.audio.restart_settle_ms);
    s.format_tolerance_hz = c.audio.format_tolerance_hz;
    return s;
}

SupervisorSettings DaemonCore::supervisor_settings(const Config& c) {
    SupervisorSettings s;
    s.python = c.backend.python;
    s.script = c.backend.script.empty() ? data_path("backend/main.py") : c.backend.script;
    s.venv_dir = c.backend.venv.empty() ? data_path("venv") : c.backend.venv;
    s.port = c.backend.port;
    s.library_path = c.backend.library_path;
    s.env = c.backend.env;
    s.max_restarts = c.backend.max_restarts;
    s.startup_delay = milliseconds(c.backend.startup_delay_ms);
    s.restart_pause = milliseconds(c.backend.restart_pause_ms);
    return s;
}

// --- Lifecycle ---

DaemonCore::DaemonCore(Config config, bool verbose, Platform platform)
    : config_(std::move(config)), verbose_(verbose),
      scheduler_(platform.scheduler), ipc_(platform.ipc),
      connection_(platform.channel, platform.scheduler, connection_settings(config_), verbose_),
      engine_(platform.capture, platform.devices, capture_settings(config_), verbose_),
      supervisor_(platform.launcher, platform.reaper, connection_, platform.scheduler,
                  supervisor_settings(config_), verbose_),
      sessions_(platform.scheduler, connection_, engine_, std::move(platform.run_blocking),
                session_settings(config_), verbose_),
      monitor_(platform.devices, platform.scheduler,
               milliseconds(config_.devices.poll_interval_ms), verbose_),
      resume_(platform.scheduler, std::move(platform.suspend_clock),
              [this]() { connection_.on_system_resume(); }) {
    connection_.add_listener(this);
    sessions_.add_observer(this);
    sessions_.select_device(config_.session.device);

    if (config_.backend.autostart) {
        connection_.set_recovery_hooks(
            [this]() { return supervisor_.is_running(); },
            [this]() { supervisor_.start(); },
            [this]() { supervisor_.restart(); });
    } else {
        // Externally managed backend: recovery can only reconnect.
        connection_.set_recovery_hooks(
            []() { return true; },
            [this]() { connection_.reconnect(); },
            [this]() { connection_.reconnect(); });
    }

    supervisor_.set_state_callback([this](SupervisorState, const std::string&) {
        broadcast("supervisor", supervisor_json());
    });

    monitor_.subscribe([this](const std::vector<AudioDevice>& devices) {
        sessions_.on_devices_changed(devices);
        broadcast("devices", devices_json());
    });
}

DaemonCore::~DaemonCore() {
    connection_.remove_listener(this);
}

bool DaemonCore::init() {
    if (config_.history.enabled) {
        auto path = config_.history.path.empty() ? data_path("history.db") : config_.history.path;
        if (!history_db_.open(path)) {
            std::println(stderr, "Warning: history DB failed to open, history disabled");
        }
    }

    monitor_.start();
    resume_.start();

    if (config_.backend.autostart) {
        supervisor_.start();
    } else {
        log("backend autostart disabled, connecting to " + config_.backend.url());
        connection_.connect();
    }
    return true;
}

void DaemonCore::shutdown() {
    if (sessions_.is_active()) {
        log("shutdown: cancelling active session");
        sessions_.cancel_session();
    }
    answer_waiting({{"status", "error"}, {"message", "daemon shutting down"}});

    resume_.stop();
    monitor_.stop();
    supervisor_.stop();
    connection_.disconnect();
    history_db_.close();
}

// --- IPC ---

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str, const nlohmann::json& cmd) {
    try {
        if (cmd_str == "start") return handle_start(cmd);
        if (cmd_str == "stop") return handle_stop(cmd);
        if (cmd_str == "cancel") return handle_cancel(cmd);
        if (cmd_str == "toggle") return handle_toggle(cmd);
        if (cmd_str == "status") return handle_status(cmd);
        if (cmd_str == "devices") return handle_devices(cmd);
        if (cmd_str == "select_device") return handle_select_device(cmd);
        if (cmd_str == "models") return handle_models(cmd);
        if (cmd_str == "load_model") return handle_load_model(cmd);
        if (cmd_str == "download_model") {
            connection_.download_model();
            return {{"status", "ok"}};
        }
        if (cmd_str == "clear_cache") {
            connection_.clear_cache();
            return {{"status", "ok"}};
        }
        if (cmd_str == "keep_warm") return handle_keep_warm(cmd);
        if (cmd_str == "restart_backend") {
            if (config_.backend.autostart) supervisor_.restart();
            else connection_.reconnect();
            return {{"status", "ok"}};
        }
        if (cmd_str == "resume") {
            connection_.on_system_resume();
            return {{"status", "ok"}};
        }
        if (cmd_str == "history") return handle_history(cmd);
        if (cmd_str == "logs") return handle_logs(cmd);
        if (cmd_str == "subscribe") return {{"status", "subscribed"}};
    } catch (const nlohmann::json::exception& e) {
        return {{"status", "error"}, {"message", std::format("bad arguments: {}", e.what())}};
    }
    return {{"status", "error"}, {"message", "unknown command"}};
}

nlohmann::json DaemonCore::handle_start(const nlohmann::json& cmd) {
    auto mode_name = cmd.value("mode", config_.session.mode);
    auto mode = parse_session_mode(mode_name);
    if (!mode) {
        return {{"status", "error"}, {"message", "unknown mode: " + mode_name}};
    }

    auto started = sessions_.start_session(*mode, cmd.value("model", config_.session.model),
                                           cmd.value("device", std::string{}),
                                           cmd.value("diarization", config_.session.diarization));
    if (!started) {
        return {{"status", "error"}, {"message", started.error()}};
    }

    const auto& s = sessions_.session();
    return {
        {"status", "ok"},
        {"state", std::string(to_string(s.state))},
        {"session", s.generation},
    };
}

nlohmann::json DaemonCore::handle_stop(const nlohmann::json& /*cmd*/) {
    if (sessions_.state() != SessionState::Recording) {
        return {{"status", "error"}, {"message", "not recording"}};
    }
    sessions_.stop_session();
    return {{"status", "processing"}};
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& /*cmd*/) {
    sessions_.cancel_session();
    return {{"status", "ok"}, {"state", std::string(to_string(sessions_.state()))}};
}

nlohmann::json DaemonCore::handle_toggle(const nlohmann::json& cmd) {
    if (sessions_.state() == SessionState::Recording) {
        return handle_stop(cmd);
    }
    return handle_start(cmd);
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    return {
        {"status", "ok"},
        {"session", session_json(sessions_.session())},
        {"connection", connection_json(connection_.state())},
        {"backend", backend_json(connection_.backend_status())},
        {"supervisor", supervisor_json()},
        {"device", sessions_.selected_device()},
    };
}

nlohmann::json DaemonCore::handle_devices(const nlohmann::json& /*cmd*/) {
    auto resp = devices_json();
    resp["status"] = "ok";
    return resp;
}

nlohmann::json DaemonCore::handle_select_device(const nlohmann::json& cmd) {
    auto uid = cmd.value("uid", std::string{});
    if (!uid.empty() && !monitor_.contains(uid)) {
        return {{"status", "error"}, {"message", "unknown device: " + uid}};
    }
    sessions_.select_device(uid);
    log("device selected: " + (uid.empty() ? std::string("default") : uid));
    return {{"status", "ok"}, {"device", uid}};
}

nlohmann::json DaemonCore::handle_models(const nlohmann::json& /*cmd*/) {
    connection_.refresh_models();
    auto resp = backend_json(connection_.backend_status());
    resp["status"] = "ok";
    return resp;
}

nlohmann::json DaemonCore::handle_load_model(const nlohmann::json& cmd) {
    auto model = cmd.value("model", std::string{});
    if (model.empty()) {
        return {{"status", "error"}, {"message", "missing model"}};
    }
    connection_.load_model(model);
    return {{"status", "ok"}, {"model", model}};
}

nlohmann::json DaemonCore::handle_keep_warm(const nlohmann::json& cmd) {
    auto models = cmd.value("models", std::vector<std::string>{});
    auto duration = cmd.value("duration", std::string("1h"));
    connection_.set_keep_warm(models, duration);
    return {{"status", "ok"}};
}

nlohmann::json DaemonCore::handle_history(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", 10);
    auto entries = history_db_.recent(limit);

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"text", e.text},
            {"mode", e.mode},
            {"model", e.model},
            {"device", e.device},
            {"diarization", e.diarization},
            {"audio_duration", e.audio_duration},
            {"processing_time", e.processing_time},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_logs(const nlohmann::json& cmd) {
    int limit = cmd.value("limit", 50);
    return {
        {"status", "ok"},
        {"lines", supervisor_.recent_logs(limit > 0 ? static_cast<size_t>(limit) : 0)},
    };
}

void DaemonCore::add_waiting_client(int fd) {
    waiting_clients_.push_back(fd);
}

void DaemonCore::add_subscriber(int fd) {
    subscribers_.push_back(fd);
}

void DaemonCore::remove_client(int fd) {
    std::erase(waiting_clients_, fd);
    std::erase(subscribers_, fd);
}

// --- Observers ---

void DaemonCore::on_session_changed(const Session& session) {
    broadcast("session", session_json(session));

    switch (session.state) {
        case SessionState::Done:
            record_history(session);
            answer_waiting({
                {"status", "ok"},
                {"text", session.transcript},
                {"model", session.model},
                {"duration", seconds_between(session.recording_at, session.stopped_at)},
                {"processing_time", seconds_between(session.stopped_at, session.finished_at)},
            });
            break;
        case SessionState::Error:
            answer_waiting({{"status", "error"}, {"message", session.error}});
            break;
        case SessionState::Idle:
            answer_waiting({{"status", "error"}, {"message", "cancelled"}});
            break;
        default:
            break;
    }
}

void DaemonCore::on_transcript(const Session& session) {
    broadcast("transcript", {
        {"session", session.generation},
        {"partial", session.partial},
        {"transcript", session.transcript},
    });
}

void DaemonCore::on_connection_changed(const ConnectionState& state) {
    broadcast("connection", connection_json(state));
}

void DaemonCore::on_backend_status(const BackendStatus& status) {
    broadcast("backend", backend_json(status));
}

void DaemonCore::record_history(const Session& session) {
    if (!history_db_.is_open() || session.transcript.empty()) return;

    bool ok = history_db_.insert({
        .text = session.transcript,
        .mode = std::string(to_string(session.mode)),
        .model = session.model,
        .device = session.device_uid,
        .diarization = session.diarization,
        .audio_duration = seconds_between(session.recording_at, session.stopped_at),
        .processing_time = seconds_between(session.stopped_at, session.finished_at),
    });
    if (!ok) std::println(stderr, "history: failed to store session {}", session.generation);
}

void DaemonCore::answer_waiting(const nlohmann::json& response) {
    for (int fd : waiting_clients_) {
        ipc_.send_response(fd, response);
    }
    waiting_clients_.clear();
}

void DaemonCore::broadcast(const std::string& event, nlohmann::json body) {
    if (subscribers_.empty()) return;
    body["event"] = event;

    std::vector<int> dead;
    for (int fd : subscribers_) {
        if (!ipc_.send_response(fd, body)) dead.push_back(fd);
    }
    for (int fd : dead) {
        log(std::format("ipc: dropping subscriber {}", fd));
        remove_client(fd);
        ipc_.close_client(fd);
    }
}

// --- JSON views ---

nlohmann::json DaemonCore::session_json(const Session& s) const {
    nlohmann::json j = {
        {"state", std::string(to_string(s.state))},
        {"mode", std::string(to_string(s.mode))},
        {"model", s.model},
        {"device", s.device_uid},
        {"device_fell_back", s.device_fell_back},
        {"diarization", s.diarization},
        {"session", s.generation},
        {"partial", s.partial},
        {"transcript", s.transcript},
    };
    if (!s.error.empty()) j["error"] = s.error;
    if (s.state == SessionState::Recording) {
        j["duration"] = seconds_between(s.recording_at, scheduler_.now());
    }
    return j;
}

nlohmann::json DaemonCore::connection_json(const ConnectionState& state) const {
    nlohmann::json j = {
        {"state", std::string(to_string(state.phase))},
        {"reconnect_attempts", state.reconnect_attempts},
        {"queued", state.queued},
        {"stale", connection_.is_stale()},
    };
    if (!state.error.empty()) j["error"] = state.error;
    if (state.last_pong) {
        j["last_pong_s"] = seconds_between(*state.last_pong, scheduler_.now());
    }
    return j;
}

nlohmann::json DaemonCore::backend_json(const BackendStatus& status) const {
    nlohmann::json models = nlohmann::json::array();
    for (const auto& m : status.models) {
        models.push_back({
            {"id", m.id},
            {"name", m.name},
            {"description", m.description},
            {"size", m.size},
            {"downloaded", m.downloaded},
            {"loaded", m.loaded},
            {"available", m.available},
        });
    }

    nlohmann::json j = {
        {"model_state", std::string(to_string(status.model_state))},
        {"download_progress", status.download_progress},
        {"whisper_available", status.whisper_available},
        {"active_model", status.active_model},
        {"loaded_models", status.loaded_models},
        {"models", std::move(models)},
        {"keep_warm", {{"models", status.keep_warm_models}, {"duration", status.keep_warm_duration}}},
    };
    if (!status.model_error.empty()) j["model_error"] = status.model_error;
    return j;
}

nlohmann::json DaemonCore::supervisor_json() const {
    const auto& h = supervisor_.handle();
    nlohmann::json j = {
        {"state", std::string(to_string(supervisor_.state()))},
        {"managed", config_.backend.autostart},
        {"pid", h.pid},
        {"running", h.running},
        {"restart_attempts", h.restart_attempts},
    };
    if (!supervisor_.error().empty()) j["error"] = supervisor_.error();
    return j;
}

nlohmann::json DaemonCore::devices_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& d : monitor_.devices()) {
        list.push_back({{"uid", d.uid}, {"name", d.name}});
    }
    return {{"devices", std::move(list)}, {"selected", sessions_.selected_device()}};
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
