#pragma once

#include <cstdint>
#include <vector>

class PortReaper {
public:
    virtual ~PortReaper() = default;
    // Pids of processes listening on the TCP port.
    virtual std::vector<int> listeners(uint16_t port) const = 0;
    // Kills stale listeners. Returns how many processes were signalled.
    virtual int free_port(uint16_t port) = 0;
};
