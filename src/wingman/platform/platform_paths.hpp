#pragma once

#include <string>

namespace platform {

// Empty when neither the XDG variable nor $HOME is set.
std::string config_dir();
std::string data_dir();

// Lookup history database; falls back to /tmp when there is no data dir.
std::string history_path();

// Control socket of the running daemon.
std::string ipc_endpoint();

} // namespace platform
