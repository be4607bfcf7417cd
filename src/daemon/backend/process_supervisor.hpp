#pragma once

#include "backend/connection_manager.hpp"
#include "platform/port_reaper.hpp"
#include "platform/process_launcher.hpp"
#include "scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

enum class SupervisorState { Stopped, Starting, Running, Crashed };

std::string_view to_string(SupervisorState state);

struct ProcessHandle {
    int pid = -1;
    bool running = false;
    int restart_attempts = 0;
};

struct SupervisorSettings {
    std::string python;   // empty: the venv interpreter, else python3 from PATH
    std::string script;
    std::string venv_dir;
    uint16_t port = 9877;
    std::string library_path;
    std::map<std::string, std::string> env;
    int max_restarts = 5;
    std::chrono::milliseconds startup_delay{3000};
    std::chrono::milliseconds restart_pause{1000};
    std::chrono::milliseconds restart_backoff{1000};
    size_t log_capacity = 200;
};

// Owns the inference backend process: spawn, crash detection with bounded
// restarts, and the connection handoff once the process is up.
class ProcessSupervisor : public ConnectionListener {
public:
    using StateCallback = std::function<void(SupervisorState, const std::string& error)>;

    ProcessSupervisor(ProcessLauncher& launcher, PortReaper& reaper,
                      ConnectionManager& connection, Scheduler& scheduler,
                      SupervisorSettings settings, bool verbose = false);
    ~ProcessSupervisor() override;

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    void start();
    // Safe in every state.
    void stop();
    // Stop, pause, start with a fresh restart budget.
    void restart();

    SupervisorState state() const { return state_; }
    const std::string& error() const { return error_; }
    const ProcessHandle& handle() const { return handle_; }
    bool is_running() const;

    std::vector<std::string> recent_logs(size_t limit) const;
    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }

    std::expected<LaunchSpec, std::string>
    build_launch_spec(const std::map<std::string, std::string>& base_env) const;

    static std::map<std::string, std::string> current_environment();

    void on_backend_greeting() override;

private:
    void launch();
    void handle_exit(int pid, int exit_code);
    void append_log(std::string line);
    void set_state(SupervisorState state, std::string error = {});
    void log(const std::string& msg);

    ProcessLauncher& launcher_;
    PortReaper& reaper_;
    ConnectionManager& connection_;
    Scheduler& scheduler_;
    SupervisorSettings settings_;
    bool verbose_;

    SupervisorState state_ = SupervisorState::Stopped;
    std::string error_;
    ProcessHandle handle_;
    std::deque<std::string> logs_;
    StateCallback on_state_;

    ScopedTimer connect_timer_;
    ScopedTimer restart_timer_;

    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};
