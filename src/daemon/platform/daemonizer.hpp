#pragma once

#include <string>

namespace platform {

// Double-forks away from the controlling terminal. stdin and stdout go to
// /dev/null; stderr, which carries every whisperd log line, is appended to
// log_path (or /dev/null if it cannot be opened). Only the grandchild returns.
void daemonize(const std::string& log_path);

} // namespace platform
