#include "process/process_tree.hpp"

#include <cctype>
#include <cerrno>
#include <deque>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <unordered_set>

namespace overseer::process {

namespace {

struct StatEntry {
    char state = '?';
    pid_t ppid = 0;
};

bool is_numeric(const std::string& value) {
    if (value.empty()) {
        return false;
    }
    for (const char c : value) {
        if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

// /proc/<pid>/stat is "pid (comm) state ppid ..."; comm may contain spaces
// and parentheses, so fields are read after the last ')'.
bool read_stat(const pid_t pid, StatEntry& entry) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    if (!in.is_open()) {
        return false;
    }
    std::string line;
    if (!std::getline(in, line)) {
        return false;
    }
    const auto end_paren = line.rfind(')');
    if (end_paren == std::string::npos || end_paren + 2 >= line.size()) {
        return false;
    }

    std::istringstream fields(line.substr(end_paren + 2));
    long ppid = 0;
    if (!(fields >> entry.state >> ppid)) {
        return false;
    }
    entry.ppid = static_cast<pid_t>(ppid);
    return true;
}

std::unordered_map<pid_t, std::vector<pid_t>> snapshot_children() {
    std::unordered_map<pid_t, std::vector<pid_t>> children;
    std::error_code ec;
    const auto options = std::filesystem::directory_options::skip_permission_denied;
    for (std::filesystem::directory_iterator it("/proc", options, ec), end;
         !ec && it != end; it.increment(ec)) {
        const std::string entry_name = it->path().filename().string();
        if (!is_numeric(entry_name)) {
            continue;
        }
        const auto pid = static_cast<pid_t>(std::stol(entry_name));
        StatEntry entry;
        if (!read_stat(pid, entry)) {
            continue;  // exited while we were scanning
        }
        children[entry.ppid].push_back(pid);
    }
    return children;
}

}  // namespace

std::string read_process_name(const pid_t pid) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/comm");
    if (!in.is_open()) {
        return "";
    }
    std::string name;
    std::getline(in, name);
    return name;
}

ProcessTree discover_descendants(const pid_t root_pid) {
    ProcessTree tree;
    if (root_pid <= 0) {
        return tree;
    }

    const auto children = snapshot_children();
    std::unordered_set<pid_t> seen{root_pid};
    std::deque<pid_t> pending{root_pid};
    while (!pending.empty()) {
        const pid_t current = pending.front();
        pending.pop_front();

        const auto it = children.find(current);
        if (it == children.end()) {
            continue;
        }
        for (const pid_t child : it->second) {
            if (!seen.insert(child).second) {
                continue;
            }
            tree.push_back(ProcessHandle{child, read_process_name(child)});
            pending.push_back(child);
        }
    }
    return tree;
}

bool is_running(const pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    if (kill(pid, 0) != 0 && errno == ESRCH) {
        return false;
    }
    StatEntry entry;
    if (!read_stat(pid, entry)) {
        return false;
    }
    return entry.state != 'Z' && entry.state != 'X';
}

}  // namespace overseer::process
