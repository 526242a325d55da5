#pragma once

#include <string>

namespace platform {

// Empty when no home directory can be determined.
std::string config_dir();
std::string data_dir();

std::string ipc_endpoint();

// Directory containing the running executable, empty if unknown.
std::string executable_dir();

} // namespace platform
