#include "app/run_outcome.hpp"

#include <cstdlib>
#include <iostream>

namespace overseer::app {

RunVerdict classify_outcome(const runtime::DeadlineResult<protocol::RunReport>& outcome) {
    RunVerdict verdict;
    if (runtime::timed_out(outcome)) {
        const auto& timeout = runtime::get_timeout(outcome);
        verdict.status = "timed_out";
        verdict.exit_code = kExitTimedOut;
        verdict.message = "Deadline of " + std::to_string(timeout.deadline.count()) +
                          " ms elapsed; reclaimed " +
                          std::to_string(timeout.reclaimed_processes) + " processes";
        return verdict;
    }
    if (runtime::is_failure(outcome)) {
        const auto& err = runtime::get_failure(outcome);
        verdict.status = "failed";
        verdict.exit_code = kExitFailed;
        verdict.message = "[" + err.code + "] " + err.message;
        return verdict;
    }

    // Every termination reason of a completed loop is a normal finish,
    // including an agent that gave up.
    const auto& report = runtime::get_value(outcome);
    verdict.status = "finished";
    verdict.exit_code = kExitOk;
    verdict.message = protocol::to_string(report.reason) + " after " +
                      std::to_string(report.steps_completed) + " steps";
    return verdict;
}

ExitCode final_exit_code(const RunVerdict& verdict, const bool summary_written) {
    if (verdict.exit_code == kExitOk && !summary_written) {
        return kExitPersistence;
    }
    return verdict.exit_code;
}

void exit_without_teardown(const int code) {
    std::cout.flush();
    std::cerr.flush();
    std::quick_exit(code);
}

} // namespace overseer::app
