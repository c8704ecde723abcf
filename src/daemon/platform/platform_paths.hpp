#pragma once

#include <string>

namespace platform {

std::string config_dir();
std::string data_dir();
std::string cache_dir();
// Packaged resources (sidecar binaries) installed next to the daemon.
std::string resource_dir();
std::string ipc_endpoint();

} // namespace platform
