#pragma once

#include <string>
#include <sys/types.h>
#include <vector>

namespace overseer::process {

// Identity of one OS process. The name is read once at discovery time and
// may be stale or empty if the process exited in the meantime.
struct ProcessHandle {
    pid_t pid = 0;
    std::string name;
};

// Point-in-time snapshot of a root's recursive descendants, breadth-first.
using ProcessTree = std::vector<ProcessHandle>;

// Walks /proc and collects every transitive descendant of root_pid. An
// unknown root yields an empty tree.
ProcessTree discover_descendants(pid_t root_pid);

// True when pid is in the process table and is not a zombie.
bool is_running(pid_t pid);

// Best-effort read of /proc/<pid>/comm; empty when the process is gone.
std::string read_process_name(pid_t pid);

}  // namespace overseer::process
