#include "runtime/deadline_supervisor.hpp"

#include <unistd.h>

namespace overseer::runtime {

DeadlineSupervisor::DeadlineSupervisor(core::logging::LogSink& log,
                                       process::ReaperOptions reaper_options)
    : log_(log), reaper_(log, reaper_options) {}

std::size_t DeadlineSupervisor::reclaim_descendants(
    const std::string& label, const std::chrono::milliseconds deadline) const {
    const pid_t self = getpid();
    log_.error("DeadlineSupervisor: '" + label + "' timed out after " +
               std::to_string(deadline.count()) +
               " ms, terminating descendant processes of " + std::to_string(self));

    const std::size_t reclaimed = reaper_.terminate_descendants(self);
    log_.warn("DeadlineSupervisor: reclaimed " + std::to_string(reclaimed) +
              " processes; worker thread for '" + label + "' is left detached");
    return reclaimed;
}

}  // namespace overseer::runtime
