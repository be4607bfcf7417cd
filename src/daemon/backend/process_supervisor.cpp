#include "backend/process_supervisor.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>
#include <ranges>

extern char** environ;

namespace fs = std::filesystem;

namespace {

std::string find_in_path(const std::string& name, const std::string& path) {
    if (name.find('/') != std::string::npos) {
        return fs::exists(name) ? name : std::string{};
    }
    for (auto dir : std::views::split(path, ':')) {
        fs::path candidate = fs::path(std::string_view(dir)) / name;
        std::error_code ec;
        if (!candidate.empty() && fs::is_regular_file(candidate, ec)) return candidate.string();
    }
    return {};
}

std::string find_site_packages(const fs::path& venv) {
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(venv / "lib", ec)) {
        auto name = entry.path().filename().string();
        if (!name.starts_with("python3")) continue;
        auto site = entry.path() / "site-packages";
        if (fs::is_directory(site, ec)) return site.string();
    }
    return {};
}

} // namespace

std::string_view to_string(SupervisorState state) {
    switch (state) {
        case SupervisorState::Stopped: return "stopped";
        case SupervisorState::Starting: return "starting";
        case SupervisorState::Running: return "running";
        case SupervisorState::Crashed: return "crashed";
    }
    return "unknown";
}

ProcessSupervisor::ProcessSupervisor(ProcessLauncher& launcher, PortReaper& reaper,
                                     ConnectionManager& connection, Scheduler& scheduler,
                                     SupervisorSettings settings, bool verbose)
    : launcher_(launcher), reaper_(reaper), connection_(connection),
      scheduler_(scheduler), settings_(std::move(settings)), verbose_(verbose),
      connect_timer_(scheduler), restart_timer_(scheduler) {
    connection_.add_listener(this);
}

ProcessSupervisor::~ProcessSupervisor() {
    *alive_ = false;
    connection_.remove_listener(this);
}

void ProcessSupervisor::start() {
    if (state_ == SupervisorState::Starting || state_ == SupervisorState::Running) return;

    restart_timer_.reset();
    handle_.restart_attempts = 0;
    launch();
}

void ProcessSupervisor::stop() {
    restart_timer_.reset();
    connect_timer_.reset();

    if (state_ != SupervisorState::Stopped) set_state(SupervisorState::Stopped);
    connection_.disconnect();

    if (handle_.running) {
        log(std::format("backend: terminating pid {}", handle_.pid));
        launcher_.terminate(handle_.pid);
    }
    handle_.pid = -1;
    handle_.running = false;

    int killed = reaper_.free_port(settings_.port);
    if (killed > 0) log(std::format("backend: killed {} stale listener(s) on port {}", killed, settings_.port));
}

void ProcessSupervisor::restart() {
    log("backend: restarting");
    stop();
    handle_.restart_attempts = 0;
    set_state(SupervisorState::Starting);
    restart_timer_.arm(settings_.restart_pause, [this]() { launch(); });
}

void ProcessSupervisor::launch() {
    set_state(SupervisorState::Starting);
    connection_.disconnect();

    int killed = reaper_.free_port(settings_.port);
    if (killed > 0) {
        std::println(stderr, "backend: killed {} stale process(es) on port {}", killed, settings_.port);
    }

    auto spec = build_launch_spec(current_environment());
    if (!spec) {
        std::println(stderr, "backend: {}", spec.error());
        set_state(SupervisorState::Crashed, spec.error());
        return;
    }

    std::weak_ptr<bool> alive = alive_;
    auto pid = launcher_.spawn(
        *spec,
        [this, alive](std::string line) {
            scheduler_.post([this, alive, line = std::move(line)]() mutable {
                if (auto a = alive.lock(); a && *a) append_log(std::move(line));
            });
        },
        [this, alive](int pid, int exit_code) {
            scheduler_.post([this, alive, pid, exit_code]() {
                if (auto a = alive.lock(); a && *a) handle_exit(pid, exit_code);
            });
        });

    if (!pid) {
        std::println(stderr, "backend: spawn failed: {}", pid.error());
        set_state(SupervisorState::Crashed, "Failed to start backend: " + pid.error());
        return;
    }

    handle_.pid = *pid;
    handle_.running = true;
    log(std::format("backend: started pid {} on port {}", handle_.pid, settings_.port));
    set_state(SupervisorState::Running);

    connect_timer_.arm(settings_.startup_delay, [this]() { connection_.connect(); });
}

void ProcessSupervisor::handle_exit(int pid, int exit_code) {
    if (pid != handle_.pid) return;

    handle_.pid = -1;
    handle_.running = false;
    connect_timer_.reset();

    if (state_ == SupervisorState::Stopped) return;

    std::println(stderr, "backend: process {} exited with code {}", pid, exit_code);
    connection_.disconnect();

    if (handle_.restart_attempts >= settings_.max_restarts) {
        std::println(stderr, "backend: giving up after {} restarts", handle_.restart_attempts);
        set_state(SupervisorState::Crashed, "Backend crashed. Please restart.");
        return;
    }

    ++handle_.restart_attempts;
    auto delay = settings_.restart_backoff * handle_.restart_attempts;
    log(std::format("backend: restart {}/{} in {} ms", handle_.restart_attempts,
                    settings_.max_restarts, delay.count()));
    set_state(SupervisorState::Starting);
    restart_timer_.arm(delay, [this]() { launch(); });
}

void ProcessSupervisor::on_backend_greeting() {
    if (handle_.restart_attempts > 0) {
        log("backend: healthy again, restart budget reset");
    }
    handle_.restart_attempts = 0;
}

bool ProcessSupervisor::is_running() const {
    return handle_.running && launcher_.is_running(handle_.pid);
}

std::expected<LaunchSpec, std::string>
ProcessSupervisor::build_launch_spec(const std::map<std::string, std::string>& base_env) const {
    auto env = base_env;
    env.erase("PYTHONHOME");
    env["PYTHONUNBUFFERED"] = "1";

    std::error_code ec;
    bool has_venv = !settings_.venv_dir.empty() && fs::is_directory(settings_.venv_dir, ec);
    if (has_venv) {
        env["VIRTUAL_ENV"] = settings_.venv_dir;
        auto path = env["PATH"];
        env["PATH"] = settings_.venv_dir + "/bin" + (path.empty() ? "" : ":" + path);
        auto site = find_site_packages(settings_.venv_dir);
        if (!site.empty()) env["PYTHONPATH"] = site;
    }

    if (!settings_.library_path.empty()) {
        env["LD_LIBRARY_PATH"] = settings_.library_path;
    }

    for (const auto& [key, value] : settings_.env) {
        env[key] = value;
    }

    std::string python = settings_.python;
    if (python.empty()) {
        auto venv_python = fs::path(settings_.venv_dir) / "bin" / "python3";
        python = has_venv && fs::exists(venv_python, ec) ? venv_python.string() : "python3";
    }
    auto executable = find_in_path(python, env["PATH"]);
    if (executable.empty()) {
        return std::unexpected("Python not found: " + python);
    }

    if (settings_.script.empty() || !fs::is_regular_file(settings_.script, ec)) {
        return std::unexpected("Backend script not found at " + settings_.script);
    }

    return LaunchSpec{
        .executable = executable,
        .args = {settings_.script, "--port", std::to_string(settings_.port)},
        .env = std::move(env),
        .working_dir = fs::path(settings_.script).parent_path().string(),
    };
}

std::map<std::string, std::string> ProcessSupervisor::current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto eq = entry.find('=');
        if (eq == std::string_view::npos) continue;
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

std::vector<std::string> ProcessSupervisor::recent_logs(size_t limit) const {
    size_t n = std::min(limit, logs_.size());
    return {logs_.end() - static_cast<std::ptrdiff_t>(n), logs_.end()};
}

void ProcessSupervisor::append_log(std::string line) {
    if (verbose_) {
        std::println(stderr, "[backend] {}", line);
    }
    logs_.push_back(std::move(line));
    while (logs_.size() > settings_.log_capacity) logs_.pop_front();
}

void ProcessSupervisor::set_state(SupervisorState state, std::string error) {
    state_ = state;
    error_ = std::move(error);
    if (on_state_) on_state_(state_, error_);
}

void ProcessSupervisor::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
