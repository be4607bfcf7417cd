#pragma once

#include <expected>
#include <functional>
#include <map>
#include <string>
#include <vector>

struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env; // the complete child environment
    std::string working_dir;
};

class ProcessLauncher {
public:
    // Both callbacks fire on a launcher-owned thread. on_exit fires once per
    // process, terminated ones included.
    using LineSink = std::function<void(std::string line)>;
    using ExitCallback = std::function<void(int pid, int exit_code)>;

    virtual ~ProcessLauncher() = default;
    virtual std::expected<int, std::string> spawn(const LaunchSpec& spec, LineSink on_line,
                                                  ExitCallback on_exit) = 0;
    // SIGTERM, then SIGKILL after the grace period.
    virtual void terminate(int pid) = 0;
    virtual bool is_running(int pid) const = 0;
};
