#pragma once

#include <string>

namespace platform {

// Detaches from the controlling terminal; returns in the grandchild only.
// stderr is appended to log_path when it can be opened.
bool daemonize(const std::string& log_path);

} // namespace platform
