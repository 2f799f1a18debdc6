#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <sys/types.h>
#include "core/logging/logger.hpp"
#include "process/process_tree.hpp"

namespace overseer::process {

struct ReaperOptions {
    // How long members get to exit after SIGTERM before SIGKILL.
    std::chrono::milliseconds grace_period{3000};
    std::chrono::milliseconds poll_interval{20};
};

// Graceful-then-forceful shutdown of a process and everything below it.
// Processes that are already gone are the expected outcome, never an error.
class ProcessTreeReaper {
public:
    explicit ProcessTreeReaper(core::logging::LogSink& log, ReaperOptions options = {});

    // Reclaims every descendant of root_pid, then root_pid itself.
    void terminate_tree(pid_t root_pid) const;

    // Reclaims every descendant of root_pid but leaves root_pid running.
    // Returns the number of processes in the initial snapshot.
    std::size_t terminate_descendants(pid_t root_pid) const;

    const ReaperOptions& options() const { return options_; }

private:
    void reclaim(const ProcessTree& members) const;
    ProcessTree wait_for_exit(const ProcessTree& members) const;
    void send_signal(const ProcessHandle& member, int signal_number) const;
    static bool has_exited(pid_t pid);
    static std::string describe(const ProcessHandle& member);

    core::logging::LogSink& log_;
    ReaperOptions options_;
};

}  // namespace overseer::process
