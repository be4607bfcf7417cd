#include "platform/linux/linux_event_loop.hpp"

#include "platform/platform_paths.hpp"
#include "platform/suspend_clock.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <format>
#include <print>
#include <signal.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/signalfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

LinuxEventLoop::LinuxEventLoop(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      post_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)),
      timer_fd_(::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC)),
      core_(config_, verbose_,
            DaemonCore::Platform{
                .scheduler = *this,
                .capture = capture_,
                .devices = devices_,
                .channel = channel_,
                .launcher = launcher_,
                .reaper = reaper_,
                .ipc = ipc_server_,
                .run_blocking = [this](std::function<void()> job) { worker_.submit(std::move(job)); },
                .suspend_clock = platform::suspended_time,
            }) {}

LinuxEventLoop::~LinuxEventLoop() {
    if (epoll_fd_ >= 0) ::close(epoll_fd_);
    if (signal_fd_ >= 0) ::close(signal_fd_);
    if (post_fd_ >= 0) ::close(post_fd_);
    if (timer_fd_ >= 0) ::close(timer_fd_);
}

bool LinuxEventLoop::init() {
    if (post_fd_ < 0 || timer_fd_ < 0) {
        std::println(stderr, "eventfd/timerfd failed: {}", std::strerror(errno));
        return false;
    }

    // IPC socket
    auto ipc_path = platform::ipc_endpoint();
    if (!ipc_server_.start(ipc_path)) return false;
    log("IPC listening on " + ipc_path);

    if (!devices_.connected()) {
        std::println(stderr, "Warning: PipeWire registry unavailable, device list will be empty");
    }

    // epoll setup
    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        std::println(stderr, "epoll_create1 failed: {}", std::strerror(errno));
        return false;
    }

    // Signal handling via signalfd
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, SIGINT);
    sigaddset(&mask, SIGTERM);
    sigprocmask(SIG_BLOCK, &mask, nullptr);

    signal_fd_ = signalfd(-1, &mask, SFD_NONBLOCK | SFD_CLOEXEC);
    if (signal_fd_ < 0) {
        std::println(stderr, "signalfd failed: {}", std::strerror(errno));
        return false;
    }

    // Register FDs with epoll
    auto add_fd = [this](int fd, uint32_t events) {
        epoll_event ev{.events = events, .data = {.fd = fd}};
        return epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd, &ev) == 0;
    };

    if (!add_fd(signal_fd_, EPOLLIN) || !add_fd(ipc_server_.server_fd(), EPOLLIN) ||
        !add_fd(post_fd_, EPOLLIN) || !add_fd(timer_fd_, EPOLLIN)) {
        std::println(stderr, "epoll_ctl failed: {}", std::strerror(errno));
        return false;
    }

    // Core init (history db, device monitor, backend)
    if (!core_.init()) return false;

    running_.store(true, std::memory_order_release);
    return true;
}

void LinuxEventLoop::run() {
    constexpr int MAX_EVENTS = 16;
    epoll_event events[MAX_EVENTS];

    while (running_.load(std::memory_order_relaxed)) {
        int n = epoll_wait(epoll_fd_, events, MAX_EVENTS, -1);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::println(stderr, "epoll_wait error: {}", std::strerror(errno));
            break;
        }

        for (int i = 0; i < n; i++) {
            int fd = events[i].data.fd;

            if (fd == signal_fd_) {
                signalfd_siginfo info;
                if (::read(signal_fd_, &info, sizeof(info)) > 0) {
                    log(std::format("Received signal {}, shutting down", info.ssi_signo));
                }
                running_.store(false, std::memory_order_release);
                break;
            }

            if (fd == ipc_server_.server_fd()) {
                int client_fd = ipc_server_.accept_client();
                if (client_fd >= 0) {
                    epoll_event ev{.events = EPOLLIN, .data = {.fd = client_fd}};
                    epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, client_fd, &ev);
                }
                continue;
            }

            if (fd == post_fd_) {
                run_posted();
                continue;
            }

            if (fd == timer_fd_) {
                run_timers();
                continue;
            }

            handle_client(fd);
        }
    }

    // Clean shutdown
    core_.shutdown();
}

void LinuxEventLoop::request_stop() {
    running_.store(false, std::memory_order_release);
    post([] {});
}

void LinuxEventLoop::handle_client(int fd) {
    std::vector<nlohmann::json> cmds;
    bool open = ipc_server_.read_commands(fd, cmds);

    for (const auto& cmd : cmds) {
        if (!cmd.is_object()) {
            ipc_server_.send_response(fd, {{"status", "error"}, {"message", "expected a JSON object"}});
            continue;
        }

        auto response = core_.handle_command(cmd.value("cmd", ""), cmd);
        auto status = response.value("status", "");

        if (status == "processing") {
            core_.add_waiting_client(fd);
        } else if (status == "subscribed") {
            core_.add_subscriber(fd);
            ipc_server_.send_response(fd, response);
        } else {
            ipc_server_.send_response(fd, response);
        }
    }

    if (!open) {
        epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, fd, nullptr);
        core_.remove_client(fd);
        ipc_server_.close_client(fd);
    }
}

// --- Scheduler ---

void LinuxEventLoop::post(Task task) {
    {
        std::lock_guard lock(post_mutex_);
        posted_.push_back(std::move(task));
    }
    uint64_t one = 1;
    if (::write(post_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::println(stderr, "post: eventfd write failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::run_posted() {
    uint64_t val;
    while (::read(post_fd_, &val, sizeof(val)) > 0) {}

    std::deque<Task> batch;
    {
        std::lock_guard lock(post_mutex_);
        batch.swap(posted_);
    }
    for (auto& task : batch) {
        if (task) task();
    }
}

Scheduler::TimerId LinuxEventLoop::schedule(std::chrono::milliseconds delay, Task task) {
    TimerId id = ++next_timer_;
    timers_[id] = Timer{.deadline = Clock::now() + delay, .task = std::move(task)};
    rearm_timer();
    return id;
}

void LinuxEventLoop::cancel(TimerId id) {
    if (timers_.erase(id) > 0) rearm_timer();
}

void LinuxEventLoop::run_timers() {
    uint64_t expirations;
    while (::read(timer_fd_, &expirations, sizeof(expirations)) > 0) {}

    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.deadline <= now) due.emplace_back(timer.deadline, id);
    }
    std::ranges::sort(due);

    for (const auto& [deadline, id] : due) {
        // An earlier task may have cancelled this one.
        auto it = timers_.find(id);
        if (it == timers_.end()) continue;
        Task task = std::move(it->second.task);
        timers_.erase(it);
        if (task) task();
    }

    rearm_timer();
}

void LinuxEventLoop::rearm_timer() {
    itimerspec spec{};

    auto earliest = std::ranges::min_element(timers_, {}, [](const auto& entry) {
        return entry.second.deadline;
    });
    if (earliest != timers_.end()) {
        auto delay = earliest->second.deadline - Clock::now();
        // A zero it_value would disarm the timer.
        auto ns = std::max<int64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(delay).count(), 1);
        spec.it_value.tv_sec = static_cast<time_t>(ns / 1'000'000'000);
        spec.it_value.tv_nsec = static_cast<long>(ns % 1'000'000'000);
    }

    if (timerfd_settime(timer_fd_, 0, &spec, nullptr) < 0) {
        std::println(stderr, "timerfd_settime failed: {}", std::strerror(errno));
    }
}

void LinuxEventLoop::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[mute] {}", msg);
    }
}
