#pragma once

namespace platform {

// Detaches from the terminal. Only the grandchild returns, with cwd "/",
// a 077 umask and stdio on /dev/null.
void daemonize();

} // namespace platform
