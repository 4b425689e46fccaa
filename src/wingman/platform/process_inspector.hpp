#pragma once

#include <string>

class ProcessInspector {
public:
    virtual ~ProcessInspector() = default;

    // Short process name, empty if the process is gone.
    virtual std::string process_name(int pid) const = 0;

    // Command line of the program running inside a terminal emulator
    // (terminal -> shell -> command), empty if none.
    virtual std::string foreground_command(int terminal_pid) const = 0;
};
