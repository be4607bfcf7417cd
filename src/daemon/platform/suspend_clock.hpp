#pragma once

#include <chrono>

namespace platform {

// Total time the machine has spent suspended since boot.
std::chrono::milliseconds suspended_time();

} // namespace platform
