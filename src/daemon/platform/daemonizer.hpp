#pragma once

namespace platform {

// Detach from the controlling terminal: double fork, stdio to /dev/null,
// owner-only umask. The working directory is left unchanged.
void daemonize();

} // namespace platform
