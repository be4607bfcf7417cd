#pragma once

#include "audio/capture_engine.hpp"
#include "audio/device_monitor.hpp"
#include "backend/connection_manager.hpp"
#include "backend/process_supervisor.hpp"
#include "config.hpp"
#include "platform/audio_capture.hpp"
#include "platform/device_enumerator.hpp"
#include "platform/ipc_server.hpp"
#include "platform/message_channel.hpp"
#include "platform/port_reaper.hpp"
#include "platform/process_launcher.hpp"
#include "resume_detector.hpp"
#include "scheduler.hpp"
#include "session_controller.hpp"
#include "storage/history_db.hpp"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Platform-independent daemon: owns the orchestrator components and maps IPC
// commands onto them. Runs entirely on the control context.
class DaemonCore : public SessionObserver, public ConnectionListener {
public:
    struct Platform {
        Scheduler& scheduler;
        AudioCapture& capture;
        DeviceEnumerator& devices;
        MessageChannel& channel;
        ProcessLauncher& launcher;
        PortReaper& reaper;
        IpcServer& ipc;
        BlockingRunner run_blocking;
        ResumeDetector::SuspendClock suspend_clock;
    };

    DaemonCore(Config config, bool verbose, Platform platform);
    ~DaemonCore() override;

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // A reply with status "processing" is sent later, once the session ends;
    // "subscribed" keeps the client open for event lines.
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    void add_waiting_client(int fd);
    void add_subscriber(int fd);
    void remove_client(int fd);

    void shutdown();

    const SessionController& sessions() const { return sessions_; }
    const ConnectionManager& connection() const { return connection_; }
    const ProcessSupervisor& supervisor() const { return supervisor_; }

    void on_session_changed(const Session& session) override;
    void on_transcript(const Session& session) override;
    void on_connection_changed(const ConnectionState& state) override;
    void on_backend_status(const BackendStatus& status) override;

    static SessionSettings session_settings(const Config& config);
    static ConnectionSettings connection_settings(const Config& config);
    static CaptureSettings capture_settings(const Config& config);
    static SupervisorSettings supervisor_settings(const Config& config);

private:
    nlohmann::json handle_start(const nlohmann::json& cmd);
    nlohmann::json handle_stop(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_toggle(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);
    nlohmann::json handle_devices(const nlohmann::json& cmd);
    nlohmann::json handle_select_device(const nlohmann::json& cmd);
    nlohmann::json handle_models(const nlohmann::json& cmd);
    nlohmann::json handle_load_model(const nlohmann::json& cmd);
    nlohmann::json handle_keep_warm(const nlohmann::json& cmd);
    nlohmann::json handle_history(const nlohmann::json& cmd);
    nlohmann::json handle_logs(const nlohmann::json& cmd);

    nlohmann::json session_json(const Session& session) const;
    nlohmann::json connection_json(const ConnectionState& state) const;
    nlohmann::json backend_json(const BackendStatus& status) const;
    nlohmann::json supervisor_json() const;
    nlohmann::json devices_json() const;

    void record_history(const Session& session);
    void answer_waiting(const nlohmann::json& response);
    void broadcast(const std::string& event, nlohmann::json body);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    Scheduler& scheduler_;
    IpcServer& ipc_;

    ConnectionManager connection_;
    AudioCaptureEngine engine_;
    ProcessSupervisor supervisor_;
    SessionController sessions_;
    DeviceMonitor monitor_;
    ResumeDetector resume_;
    HistoryDb history_db_;

    std::vector<int> waiting_clients_;
    std::vector<int> subscribers_;
};
