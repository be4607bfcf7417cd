#pragma once

#include "config.hpp"
#include "daemon_core.hpp"
#include "platform/linux/ix_websocket_channel.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/pipewire_devices.hpp"
#include "platform/linux/posix_process_launcher.hpp"
#include "platform/linux/procfs_port_reaper.hpp"
#include "platform/linux/unix_socket_server.hpp"
#include "scheduler.hpp"
#include "worker.hpp"

#include <atomic>
#include <deque>
#include <map>
#include <mutex>

// The control context: an epoll loop over signals, IPC clients, posted tasks
// and a single timerfd armed for the earliest pending timer.
class LinuxEventLoop : public Scheduler {
public:
    explicit LinuxEventLoop(Config config, bool verbose = false);
    ~LinuxEventLoop() override;

    LinuxEventLoop(const LinuxEventLoop&) = delete;
    LinuxEventLoop& operator=(const LinuxEventLoop&) = delete;

    bool init();
    void run();
    void request_stop();

    void post(Task task) override;
    TimerId schedule(std::chrono::milliseconds delay, Task task) override;
    void cancel(TimerId id) override;
    Clock::time_point now() const override { return Clock::now(); }

private:
    struct Timer {
        Clock::time_point deadline;
        Task task;
    };

    void run_posted();
    void run_timers();
    void rearm_timer();
    void handle_client(int fd);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    int epoll_fd_ = -1;
    int signal_fd_ = -1;
    int post_fd_ = -1;
    int timer_fd_ = -1;

    std::mutex post_mutex_;
    std::deque<Task> posted_;

    std::map<TimerId, Timer> timers_;
    TimerId next_timer_ = 0;

    // Platform implementations (constructed before core_)
    PipeWireCapture capture_;
    PipeWireDeviceEnumerator devices_;
    IxWebSocketChannel channel_;
    PosixProcessLauncher launcher_;
    ProcfsPortReaper reaper_;
    UnixSocketServer ipc_server_;

    // Portable business logic
    DaemonCore core_;

    // Destroyed first so no blocking job outlives the core.
    Worker worker_;

    std::atomic<bool> running_{false};
};
