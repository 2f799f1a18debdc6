#include "process/process_tree_reaper.hpp"

#include <cerrno>
#include <cstring>
#include <signal.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace overseer::process {

ProcessTreeReaper::ProcessTreeReaper(core::logging::LogSink& log,
                                     ReaperOptions options)
    : log_(log), options_(options) {}

std::string ProcessTreeReaper::describe(const ProcessHandle& member) {
    if (member.name.empty()) {
        return std::to_string(member.pid);
    }
    return std::to_string(member.pid) + " (" + member.name + ")";
}

bool ProcessTreeReaper::has_exited(const pid_t pid) {
    // Reap our own children so they do not linger as zombies.
    int status = 0;
    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
        return true;
    }
    return !is_running(pid);
}

void ProcessTreeReaper::send_signal(const ProcessHandle& member,
                                    const int signal_number) const {
    if (member.pid == getpid()) {
        log_.warn("Reaper: refusing to signal own process " + describe(member));
        return;
    }
    if (kill(member.pid, signal_number) == 0 || errno == ESRCH) {
        return;
    }
    log_.warn("Reaper: signal " + std::to_string(signal_number) + " to " +
              describe(member) + " failed: " + std::strerror(errno));
}

ProcessTree ProcessTreeReaper::wait_for_exit(const ProcessTree& members) const {
    const auto deadline = std::chrono::steady_clock::now() + options_.grace_period;
    ProcessTree alive = members;
    while (true) {
        ProcessTree still_alive;
        for (const auto& member : alive) {
            if (!has_exited(member.pid)) {
                still_alive.push_back(member);
            }
        }
        alive.swap(still_alive);
        if (alive.empty() || std::chrono::steady_clock::now() >= deadline) {
            return alive;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }
}

void ProcessTreeReaper::reclaim(const ProcessTree& members) const {
    if (members.empty()) {
        return;
    }

    for (const auto& member : members) {
        log_.debug("Reaper: terminating " + describe(member));
        send_signal(member, SIGTERM);
    }

    const ProcessTree still_alive = wait_for_exit(members);
    if (still_alive.empty()) {
        return;
    }

    log_.warn("Reaper: " + std::to_string(still_alive.size()) +
              " processes still alive after termination, killing forcibly");
    for (const auto& member : still_alive) {
        send_signal(member, SIGKILL);
    }

    // Stragglers may have forked between the snapshot and the kill.
    for (const auto& member : still_alive) {
        terminate_tree(member.pid);
    }
}

std::size_t ProcessTreeReaper::terminate_descendants(const pid_t root_pid) const {
    const ProcessTree children = discover_descendants(root_pid);
    if (!children.empty()) {
        log_.info("Reaper: found " + std::to_string(children.size()) +
                  " descendant processes of " + std::to_string(root_pid));
    }
    reclaim(children);
    return children.size();
}

void ProcessTreeReaper::terminate_tree(const pid_t root_pid) const {
    if (root_pid <= 0) {
        return;
    }
    terminate_descendants(root_pid);

    if (root_pid == getpid()) {
        log_.warn("Reaper: root " + std::to_string(root_pid) +
                  " is the current process, leaving it running");
        return;
    }
    if (has_exited(root_pid)) {
        return;
    }

    const ProcessHandle root{root_pid, read_process_name(root_pid)};
    send_signal(root, SIGTERM);
    const ProcessTree still_alive = wait_for_exit({root});
    if (still_alive.empty()) {
        return;
    }
    log_.warn("Reaper: killing " + describe(root) + " forcibly");
    send_signal(root, SIGKILL);
    static_cast<void>(wait_for_exit({root}));
}

}  // namespace overseer::process
