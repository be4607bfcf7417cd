#pragma once

#include "audio/audio_format.hpp"
#include "backend/protocol.hpp"
#include "platform/message_channel.hpp"
#include "scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class ConnectionPhase { Disconnected, Connecting, Connected, Error };

std::string_view to_string(ConnectionPhase phase);

struct ConnectionState {
    ConnectionPhase phase = ConnectionPhase::Disconnected;
    std::string error;
    std::optional<Scheduler::Clock::time_point> last_pong;
    int reconnect_attempts = 0;
    size_t queued = 0;
};

enum class ModelState { Unknown, Ready, NotDownloaded, Downloading, Downloaded, Error };

std::string_view to_string(ModelState state);

struct BackendStatus {
    ModelState model_state = ModelState::Unknown;
    std::string model_error;
    double download_progress = 0.0;
    bool whisper_available = false;
    std::string active_model;
    std::vector<std::string> loaded_models;
    std::vector<protocol::ModelInfo> models;
    std::vector<std::string> keep_warm_models;
    std::string keep_warm_duration;
};

struct ConnectionSettings {
    std::string url = "ws://127.0.0.1:9877/ws";
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds stale_threshold{120000};
    std::chrono::milliseconds probe_timeout{2000};
    std::chrono::milliseconds reconnect_delay{2000};
    int max_reconnect_attempts = 5;
    std::chrono::milliseconds wake_settle{2000};
    std::chrono::milliseconds wake_probe_timeout{3000};
};

// Receives inbound traffic and connection changes on the control context.
class ConnectionListener {
public:
    virtual ~ConnectionListener() = default;
    virtual void on_connection_changed(const ConnectionState& /*state*/) {}
    virtual void on_backend_greeting() {}
    virtual void on_backend_status(const BackendStatus& /*status*/) {}
    virtual void on_partial(const std::string& /*text*/) {}
    virtual void on_final(const std::string& /*text*/, const std::string& /*model*/) {}
    virtual void on_interval(const std::string& /*text*/) {}
    virtual void on_backend_error(const std::string& /*message*/) {}
};

struct RecordingRequest {
    std::string model;
    bool diarization = false;
    bool continuous = false;
};

class ConnectionManager {
public:
    using RequestId = uint64_t;
    // Carries the model the backend is recording with, or the failure reason.
    using ReadyCallback = std::function<void(std::expected<std::string, std::string>)>;

    ConnectionManager(MessageChannel& channel, Scheduler& scheduler,
                      ConnectionSettings settings = {}, bool verbose = false);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    void add_listener(ConnectionListener* listener);
    void remove_listener(ConnectionListener* listener);

    // Wake-from-sleep recovery needs to reach the process supervisor.
    void set_recovery_hooks(std::function<bool()> process_running,
                            std::function<void()> start_backend,
                            std::function<void()> restart_backend);

    void connect();
    // Closes the channel and drops queued messages. Ends retrying.
    void disconnect();
    // Drops the channel and connects again with a fresh attempt budget.
    void reconnect();

    // Queued while not connected, flushed in order on (re)connect.
    void send(const nlohmann::json& message);
    void send_audio(const AudioChunk& chunk);
    void send_stop();

    // Calls done(true) when connected and either fresh or answering a probe ping.
    void verify(std::function<void(bool)> done);
    bool is_stale() const;

    // Pre-flight check, then a start message. The callback fires at most once,
    // on the control context: recording_ready, an error message, lost connection.
    RequestId request_recording(const RecordingRequest& request, ReadyCallback callback);
    // Messages already sent are not recalled.
    void cancel_recording_request(RequestId id);
    bool has_pending_request() const { return pending_.has_value(); }

    void on_system_resume();

    void refresh_models();
    void load_model(const std::string& model);
    void download_model();
    void clear_cache();
    void set_keep_warm(const std::vector<std::string>& models, const std::string& duration);

    const ConnectionState& state() const { return state_; }
    const BackendStatus& backend_status() const { return status_; }
    bool is_connected() const { return state_.phase == ConnectionPhase::Connected; }
    const ConnectionSettings& settings() const { return settings_; }

private:
    struct PendingRequest {
        RequestId id;
        ReadyCallback callback;
    };

    void open_channel();
    void handle_open(uint64_t epoch);
    void handle_message(uint64_t epoch, const std::string& text);
    void handle_failure(const std::string& reason);
    void close_channel();

    void dispatch(const protocol::Inbound& msg);
    bool flush_queue();
    void send_text(std::string text);
    void probe(std::chrono::milliseconds timeout, std::function<void(bool)> done);
    void resolve_probes(bool healthy);
    void fail_pending(RequestId id, const std::string& reason);
    void fail_any_pending(const std::string& reason);
    void schedule_heartbeat();
    void wake_check();

    void set_phase(ConnectionPhase phase, std::string error = {});
    void notify_state();
    void notify_status();
    template <typename F>
    void for_each_listener(F&& f);

    void log(const std::string& msg);

    MessageChannel& channel_;
    Scheduler& scheduler_;
    ConnectionSettings settings_;
    bool verbose_;

    ConnectionState state_;
    BackendStatus status_;
    std::deque<std::string> queue_;
    std::vector<ConnectionListener*> listeners_;

    // Bumped whenever the channel is replaced; events from older channels are dropped.
    uint64_t epoch_ = 0;
    bool channel_open_ = false;

    std::optional<PendingRequest> pending_;
    RequestId next_request_id_ = 0;
    std::vector<std::function<void(bool)>> probes_;

    ScopedTimer heartbeat_timer_;
    ScopedTimer reconnect_timer_;
    ScopedTimer probe_timer_;
    ScopedTimer wake_timer_;

    std::function<bool()> process_running_;
    std::function<void()> start_backend_;
    std::function<void()> restart_backend_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
