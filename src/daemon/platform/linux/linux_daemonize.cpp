#include "platform/daemonizer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <print>
#include <sys/stat.h>
#include <unistd.h>

namespace platform {

bool daemonize(const std::string& log_path) {
    pid_t pid = fork();
    if (pid < 0) {
        std::println(stderr, "fork() failed: {}", std::strerror(errno));
        return false;
    }
    if (pid > 0) _exit(0);

    setsid();

    pid = fork();
    if (pid < 0) _exit(1);
    if (pid > 0) _exit(0);

    umask(022);

    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd >= 0) {
        ::dup2(null_fd, STDIN_FILENO);
        ::dup2(null_fd, STDOUT_FILENO);
    }

    // stderr carries warnings and backend output: keep it in a log file.
    int err_fd = -1;
    if (!log_path.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(log_path).parent_path(), ec);
        err_fd = ::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    }
    if (err_fd >= 0) {
        ::dup2(err_fd, STDERR_FILENO);
        ::close(err_fd);
    } else if (null_fd >= 0) {
        ::dup2(null_fd, STDERR_FILENO);
    }

    if (null_fd > STDERR_FILENO) ::close(null_fd);
    return true;
}

} // namespace platform
