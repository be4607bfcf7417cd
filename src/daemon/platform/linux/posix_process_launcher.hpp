#pragma once

#include "platform/process_launcher.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

// fork/execve launcher. One reader thread pumps merged stdout/stderr into the
// line sink, reaps exited children and escalates terminate() to SIGKILL.
class PosixProcessLauncher : public ProcessLauncher {
public:
    explicit PosixProcessLauncher(std::chrono::milliseconds kill_grace = std::chrono::milliseconds(3000));
    ~PosixProcessLauncher() override;

    PosixProcessLauncher(const PosixProcessLauncher&) = delete;
    PosixProcessLauncher& operator=(const PosixProcessLauncher&) = delete;

    std::expected<int, std::string> spawn(const LaunchSpec& spec, LineSink on_line,
                                          ExitCallback on_exit) override;
    void terminate(int pid) override;
    bool is_running(int pid) const override;

private:
    using Clock = std::chrono::steady_clock;

    struct Child {
        int fd = -1;
        std::string partial;
        LineSink on_line;
        ExitCallback on_exit;
        std::optional<int> exit_code;
        std::optional<Clock::time_point> kill_at;
    };

    void run(std::stop_token stop);
    void wake();

    std::chrono::milliseconds kill_grace_;
    mutable std::mutex mutex_;
    std::map<int, Child> children_;
    int wake_fd_ = -1;
    std::jthread reader_;
};
