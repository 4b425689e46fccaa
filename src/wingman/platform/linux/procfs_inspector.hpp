#pragma once

#include "platform/process_inspector.hpp"

#include <string>
#include <vector>

class ProcfsInspector : public ProcessInspector {
public:
    std::string process_name(int pid) const override;
    std::string foreground_command(int terminal_pid) const override;

    // Arguments joined by spaces.
    static std::string read_cmdline(int pid);
    static std::vector<int> get_children(int pid);

private:
    static std::string read_comm(int pid);
};
