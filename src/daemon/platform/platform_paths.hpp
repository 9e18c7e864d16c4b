#pragma once

#include <string>

namespace platform {

// Per-user config directory, empty if it cannot be determined.
std::string config_dir();

// Per-user data directory (job database), empty if it cannot be determined.
std::string data_dir();

std::string ipc_endpoint();

} // namespace platform
