#pragma once

#include "platform/port_reaper.hpp"

#include <chrono>
#include <string>
#include <unordered_set>

// Finds TCP listeners through /proc/net/tcp{,6} and /proc/<pid>/fd.
class ProcfsPortReaper : public PortReaper {
public:
    explicit ProcfsPortReaper(std::string proc_root = "/proc",
                              std::chrono::milliseconds pass_pause = std::chrono::milliseconds(500));

    std::vector<int> listeners(uint16_t port) const override;
    int free_port(uint16_t port) override;

    // Socket inodes listening on port in one /proc/net/tcp style table.
    static std::unordered_set<unsigned long> parse_listen_inodes(const std::string& table,
                                                                 uint16_t port);

private:
    std::unordered_set<unsigned long> listen_inodes(uint16_t port) const;
    std::vector<int> pids_holding(const std::unordered_set<unsigned long>& inodes) const;

    std::string proc_root_;
    std::chrono::milliseconds pass_pause_;
};
