#include "platform/linux/posix_process_launcher.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <print>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {

constexpr int kPollTimeoutMs = 200;

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

PosixProcessLauncher::PosixProcessLauncher(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace) {
    wake_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    reader_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

PosixProcessLauncher::~PosixProcessLauncher() {
    {
        std::lock_guard lock(mutex_);
        for (auto& [pid, child] : children_) {
            if (!child.exit_code) ::kill(pid, SIGKILL);
        }
    }
    reader_.request_stop();
    wake();
    if (reader_.joinable()) reader_.join();

    for (auto& [pid, child] : children_) {
        if (child.fd >= 0) ::close(child.fd);
        if (!child.exit_code) ::waitpid(pid, nullptr, 0);
    }
    if (wake_fd_ >= 0) ::close(wake_fd_);
}

std::expected<int, std::string> PosixProcessLauncher::spawn(const LaunchSpec& spec, LineSink on_line,
                                                            ExitCallback on_exit) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) < 0) {
        return std::unexpected(std::format("pipe failed: {}", std::strerror(errno)));
    }

    // Everything the child needs is prepared before fork.
    std::vector<std::string> env_strings;
    env_strings.reserve(spec.env.size());
    for (const auto& [k, v] : spec.env) env_strings.push_back(k + "=" + v);

    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<std::string> arg_strings;
    arg_strings.push_back(spec.executable);
    arg_strings.insert(arg_strings.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& s : arg_strings) argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        return std::unexpected(std::format("fork failed: {}", std::strerror(err)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) < 0) ::_exit(126);
        ::execve(spec.executable.c_str(), argv.data(), envp.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    ::fcntl(fds[0], F_SETFL, ::fcntl(fds[0], F_GETFL) | O_NONBLOCK);

    {
        std::lock_guard lock(mutex_);
        children_[pid] = Child{
            .fd = fds[0],
            .partial = {},
            .on_line = std::move(on_line),
            .on_exit = std::move(on_exit),
            .exit_code = std::nullopt,
            .kill_at = std::nullopt,
        };
    }
    wake();
    return pid;
}

void PosixProcessLauncher::terminate(int pid) {
    std::lock_guard lock(mutex_);
    auto it = children_.find(pid);
    if (it == children_.end() || it->second.exit_code) return;

    ::kill(pid, SIGTERM);
    if (!it->second.kill_at) it->second.kill_at = Clock::now() + kill_grace_;
}

bool PosixProcessLauncher::is_running(int pid) const {
    std::lock_guard lock(mutex_);
    auto it = children_.find(pid);
    return it != children_.end() && !it->second.exit_code;
}

void PosixProcessLauncher::wake() {
    uint64_t one = 1;
    if (::write(wake_fd_, &one, sizeof(one)) < 0 && errno != EAGAIN) {
        std::println(stderr, "launcher: wake failed: {}", std::strerror(errno));
    }
}

void PosixProcessLauncher::run(std::stop_token stop) {
    while (!stop.stop_requested()) {
        std::vector<pollfd> pfds;
        pfds.push_back({.fd = wake_fd_, .events = POLLIN, .revents = 0});
        {
            std::lock_guard lock(mutex_);
            for (auto& [pid, child] : children_) {
                if (child.fd >= 0) pfds.push_back({.fd = child.fd, .events = POLLIN, .revents = 0});
            }
        }

        int n = ::poll(pfds.data(), pfds.size(), kPollTimeoutMs);
        if (n < 0 && errno != EINTR) {
            std::println(stderr, "launcher: poll failed: {}", std::strerror(errno));
            return;
        }

        if (pfds[0].revents & POLLIN) {
            uint64_t val;
            while (::read(wake_fd_, &val, sizeof(val)) > 0) {}
        }

        // Sinks run outside the lock.
        std::vector<std::pair<LineSink, std::string>> lines;
        std::vector<std::pair<ExitCallback, std::pair<int, int>>> exits;

        {
            std::lock_guard lock(mutex_);
            auto now = Clock::now();

            for (auto it = children_.begin(); it != children_.end();) {
                int pid = it->first;
                Child& child = it->second;

                if (child.fd >= 0) {
                    char buf[4096];
                    while (true) {
                        ssize_t r = ::read(child.fd, buf, sizeof(buf));
                        if (r > 0) {
                            child.partial.append(buf, static_cast<size_t>(r));
                            continue;
                        }
                        if (r < 0 && errno == EINTR) continue;
                        if (r == 0 || (errno != EAGAIN && errno != EWOULDBLOCK)) {
                            ::close(child.fd);
                            child.fd = -1;
                        }
                        break;
                    }

                    size_t pos;
                    while ((pos = child.partial.find('\n')) != std::string::npos) {
                        if (child.on_line) lines.emplace_back(child.on_line, child.partial.substr(0, pos));
                        child.partial.erase(0, pos + 1);
                    }
                }

                if (!child.exit_code) {
                    int status = 0;
                    pid_t r = ::waitpid(pid, &status, WNOHANG);
                    if (r == pid) {
                        child.exit_code = decode_status(status);
                    } else if (r < 0 && errno == ECHILD) {
                        child.exit_code = -1;
                    } else if (child.kill_at && now >= *child.kill_at) {
                        ::kill(pid, SIGKILL);
                        child.kill_at.reset();
                    }
                }

                // Exited and output drained. A grandchild holding the pipe open
                // must not keep the exit from being reported.
                if (child.exit_code) {
                    if (child.fd >= 0) {
                        ::close(child.fd);
                        child.fd = -1;
                    }
                    if (!child.partial.empty() && child.on_line) {
                        lines.emplace_back(child.on_line, std::move(child.partial));
                    }
                    if (child.on_exit) exits.emplace_back(child.on_exit, std::pair{pid, *child.exit_code});
                    it = children_.erase(it);
                    continue;
                }
                ++it;
            }
        }

        for (auto& [sink, line] : lines) sink(std::move(line));
        for (auto& [cb, result] : exits) cb(result.first, result.second);
    }
}
