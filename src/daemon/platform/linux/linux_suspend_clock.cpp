#include "platform/suspend_clock.hpp"

#include <ctime>

namespace platform {

namespace {

std::chrono::nanoseconds read_clock(clockid_t id) {
    timespec ts{};
    if (::clock_gettime(id, &ts) != 0) return {};
    return std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec);
}

} // namespace

// CLOCK_BOOTTIME keeps counting through suspend, CLOCK_MONOTONIC does not.
std::chrono::milliseconds suspended_time() {
    auto boot = read_clock(CLOCK_BOOTTIME);
    auto mono = read_clock(CLOCK_MONOTONIC);
    return std::chrono::duration_cast<std::chrono::milliseconds>(boot - mono);
}

} // namespace platform
