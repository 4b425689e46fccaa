#include "platform/linux/procfs_inspector.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

std::string ProcfsInspector::process_name(int pid) const {
    if (pid <= 0) return {};
    return read_comm(pid);
}

std::string ProcfsInspector::foreground_command(int terminal_pid) const {
    if (terminal_pid <= 0) return {};

    auto shells = get_children(terminal_pid);
    if (shells.empty()) return {};

    auto commands = get_children(shells.front());
    if (commands.empty()) return {};

    return read_cmdline(commands.front());
}

std::string ProcfsInspector::read_comm(int pid) {
    std::ifstream f(std::format("/proc/{}/comm", pid));
    if (!f.is_open()) return {};
    std::string comm;
    std::getline(f, comm);
    return comm;
}

std::string ProcfsInspector::read_cmdline(int pid) {
    std::ifstream f(std::format("/proc/{}/cmdline", pid), std::ios::binary);
    if (!f.is_open()) return {};

    std::string cmdline{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    while (!cmdline.empty() && cmdline.back() == '\0') cmdline.pop_back();
    std::ranges::replace(cmdline, '\0', ' ');
    return cmdline;
}

std::vector<int> ProcfsInspector::get_children(int pid) {
    std::vector<int> children;

    std::string task_path = std::format("/proc/{}/task", pid);
    std::error_code ec;
    for (auto& entry : fs::directory_iterator(task_path, ec)) {
        auto children_file = entry.path() / "children";
        std::ifstream f(children_file);
        if (!f.is_open()) continue;

        int child;
        while (f >> child) {
            children.push_back(child);
        }
    }

    return children;
}
